#include "bgcore/network/ipc_server.hpp"

#include "bgcore/domain/domain_json.hpp"
#include "bgcore/events/order_update_event.hpp"
#include "bgcore/events/position_update_event.hpp"
#include "bgcore/events/risk_events.hpp"
#include "bgcore/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iostream>
#include <utility>

namespace bgcore {

using json = nlohmann::json;

namespace {

const char* toString(StreamStatusEvent::Kind kind) {
  switch (kind) {
    case StreamStatusEvent::Kind::Connected:
      return "connected";
    case StreamStatusEvent::Kind::Disconnected:
      return "disconnected";
    case StreamStatusEvent::Kind::ResyncRequired:
      return "resync_required";
    case StreamStatusEvent::Kind::AuthFailed:
      return "auth_failed";
  }
  return "unknown";
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] Listening. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << std::endl;
}

void IpcServer::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  } else if (!context_) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] Stopped";
  if (dropped_.load() > 0) {
    std::cout << " (" << dropped_.load() << " telemetry events dropped)";
  }
  std::cout << std::endl;
}

void IpcServer::pushTelemetry(Event event) {
  if (!telemetry_queue_.try_push(std::move(event))) {
    dropped_.fetch_add(1);
  }
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    try {
      processCommands();
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] Command socket error: " << e.what() << "\n";
    }
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto line = formatTelemetry(*event);
    if (!line) {
      continue;
    }
    zmq::message_t msg(line->data(), line->size());
    // A slow or absent subscriber must not stall the worker.
    (void)pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received) {
    return;
  }

  const std::string command = normalizeCommand(
      std::string(static_cast<const char*>(request.data()), request.size()));

  std::string response;
  try {
    response = command_handler_(command);
  } catch (const std::exception& e) {
    response = json{{"status", "error"}, {"response", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::normalizeCommand(const std::string& raw) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(raw.begin(), raw.end(), not_space);
  auto end = std::find_if(raw.rbegin(), raw.rend(), not_space).base();
  std::string command = begin < end ? std::string(begin, end) : std::string{};
  std::transform(command.begin(), command.end(), command.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return command;
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  json j;
  if (auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    j["type"] = "order_update";
    j["order"] = e->order;
    j["previous_status"] = domain::toString(e->previous_status);
    j["ts"] = timestamp_to_ms(e->timestamp);
  } else if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    j["type"] = "position_update";
    j["position"] = e->position;
    j["balance"] = e->balance;
    j["ts"] = timestamp_to_ms(e->timestamp);
  } else if (auto* e = std::get_if<RiskRejectEvent>(&event)) {
    j["type"] = "risk_reject";
    j["strategy_id"] = e->strategy_id;
    j["symbol"] = e->symbol;
    j["reason"] = e->reason;
  } else if (auto* e = std::get_if<RiskViolationEvent>(&event)) {
    j["type"] = "halt";
    j["symbol"] = e->symbol;
    j["reason"] = e->reason;
    j["current_value"] = e->current_value;
    j["limit_value"] = e->limit_value;
  } else if (auto* e = std::get_if<StreamStatusEvent>(&event)) {
    j["type"] = "stream_status";
    j["status"] = toString(e->kind);
    j["channel"] = e->channel;
    j["symbol"] = e->symbol;
    j["reason"] = e->reason;
  } else {
    return std::nullopt;
  }
  return j.dump();
}

}  // namespace bgcore
