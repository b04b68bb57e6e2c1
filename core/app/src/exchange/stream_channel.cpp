#include "bgcore/exchange/stream_channel.hpp"

#include "bgcore/domain/errors.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <utility>

namespace bgcore {

namespace {

// How long one poll waits before the loop re-checks running_, the outbox
// and the heartbeat.
constexpr auto kPollSlice = std::chrono::milliseconds(50);

constexpr std::int64_t kLoginTimeoutMs = 10000;

}  // namespace

StreamChannel::StreamChannel(std::string name, StreamEndpoint endpoint,
                             const BackoffConfig& backoff,
                             const HeartbeatConfig& heartbeat,
                             const ITimeProvider& clock, Callbacks callbacks,
                             EventSink status_sink, ConnectionFactory connect)
    : name_(std::move(name)),
      endpoint_(std::move(endpoint)),
      clock_(clock),
      callbacks_(std::move(callbacks)),
      status_sink_(std::move(status_sink)),
      connect_(std::move(connect)),
      backoff_(backoff),
      heartbeat_(heartbeat, clock) {}

StreamChannel::~StreamChannel() { stop(); }

void StreamChannel::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void StreamChannel::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  wake_.notify_all();
  thread_.join();
}

void StreamChannel::send(std::string text) {
  if (!connected_.load()) {
    return;
  }
  std::lock_guard lock(mutex_);
  outbox_.push_back(std::move(text));
}

void StreamChannel::emitStatus(StreamStatusEvent::Kind kind,
                               const std::string& reason) {
  if (!status_sink_) {
    return;
  }
  StreamStatusEvent event;
  event.kind = kind;
  event.channel = name_;
  event.reason = reason;
  event.timestamp = std::chrono::system_clock::now();
  status_sink_(std::move(event));
}

void StreamChannel::waitBeforeReconnect(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  wake_.wait_for(lock, delay, [this] { return !running_.load(); });
}

// -----------------------------------------------------------------------------
// run(): reconnect loop
// -----------------------------------------------------------------------------
void StreamChannel::run() {
  while (running_.load()) {
    std::string reason = "closed";
    std::unique_ptr<IStreamConnection> connection;
    try {
      connection = connect_(endpoint_);
      session(*connection);
    } catch (const AuthError& e) {
      connection.reset();
      connected_.store(false);
      std::cerr << "[StreamChannel:" << name_ << "] Login rejected: " << e.what()
                << std::endl;
      emitStatus(StreamStatusEvent::Kind::AuthFailed, e.what());
      return;
    } catch (const std::exception& e) {
      reason = e.what();
    }
    if (connection) {
      connection->close();
      connection.reset();
    }

    const bool was_connected = connected_.exchange(false);
    {
      std::lock_guard lock(mutex_);
      outbox_.clear();
    }
    if (!running_.load()) {
      break;
    }

    if (was_connected) {
      emitStatus(StreamStatusEvent::Kind::Disconnected, reason);
    }
    const auto delay = backoff_.nextDelay();
    std::cout << "[StreamChannel:" << name_ << "] Disconnected (" << reason
              << "), reconnect attempt " << backoff_.attempt() << " in "
              << delay.count() << " ms" << std::endl;
    waitBeforeReconnect(delay);
  }
  std::cout << "[StreamChannel:" << name_ << "] Stopped" << std::endl;
}

// -----------------------------------------------------------------------------
// session(): one connection, from login until failure or stop()
// -----------------------------------------------------------------------------
void StreamChannel::session(IStreamConnection& connection) {
  if (callbacks_.login_message) {
    connection.write(callbacks_.login_message());
    const std::int64_t deadline = clock_.now_ms() + kLoginTimeoutMs;
    bool logged_in = false;
    while (!logged_in) {
      if (!running_.load()) {
        return;
      }
      if (clock_.now_ms() > deadline) {
        throw TransientNetworkError("no login response");
      }
      if (auto frame = connection.poll(kPollSlice)) {
        const InboundKind kind = callbacks_.on_message(*frame);
        if (kind == InboundKind::LoginRejected) {
          throw AuthError("stream login refused: " + *frame);
        }
        logged_in = kind == InboundKind::LoginAccepted;
      }
    }
  }

  if (callbacks_.subscribe_message) {
    connection.write(callbacks_.subscribe_message());
  }

  heartbeat_.reset();
  connected_.store(true);
  backoff_.reset();
  std::cout << "[StreamChannel:" << name_ << "] Connected to "
            << endpoint_.host << endpoint_.path << std::endl;
  emitStatus(StreamStatusEvent::Kind::Connected, "subscribed");

  while (running_.load()) {
    if (auto frame = connection.poll(kPollSlice)) {
      if (*frame == "pong") {
        heartbeat_.onPong();
      } else if (callbacks_.on_message(*frame) == InboundKind::LoginRejected) {
        throw AuthError("session rejected: " + *frame);
      }
    }

    std::deque<std::string> pending;
    {
      std::lock_guard lock(mutex_);
      pending.swap(outbox_);
    }
    for (const auto& text : pending) {
      connection.write(text);
    }

    if (heartbeat_.pingDue()) {
      heartbeat_.onPingSent();
      connection.write("ping");
    }
    heartbeat_.check();
  }
}

}  // namespace bgcore
