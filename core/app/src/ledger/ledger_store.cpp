#include "bgcore/ledger/ledger_store.hpp"

#include "bgcore/domain/domain_json.hpp"
#include "bgcore/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace bgcore {

using json = nlohmann::json;

namespace {

constexpr int kSnapshotFormatVersion = 1;

}  // namespace

JsonFileLedgerStore::JsonFileLedgerStore(std::string path)
    : path_(std::move(path)) {}

void JsonFileLedgerStore::save(const LedgerSnapshot& snapshot) {
  json doc;
  doc["format"] = kSnapshotFormatVersion;
  doc["saved_ms"] = snapshot.saved_ms;
  doc["last_sequence"] = snapshot.last_sequence;
  doc["next_order_id"] = snapshot.next_order_id;
  doc["open_orders"] = snapshot.open_orders;
  doc["positions"] = snapshot.positions;
  doc["balances"] = snapshot.balances;

  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp_path + " for writing");
    }
    out << doc.dump(2) << '\n';
    if (!out.good()) {
      throw std::runtime_error("failed writing " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    throw std::runtime_error("cannot rename " + tmp_path + " to " + path_);
  }
  std::cout << "[LedgerStore] Saved " << snapshot.open_orders.size()
            << " open orders, " << snapshot.positions.size()
            << " positions to " << path_ << std::endl;
}

std::optional<LedgerSnapshot> JsonFileLedgerStore::load() {
  std::ifstream in(path_);
  if (!in) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  try {
    const json doc = json::parse(buffer.str());
    const int format = doc.value("format", 0);
    if (format != kSnapshotFormatVersion) {
      throw ConfigError("ledger snapshot " + path_ + " has format " +
                        std::to_string(format) + ", expected " +
                        std::to_string(kSnapshotFormatVersion));
    }

    LedgerSnapshot snapshot;
    snapshot.saved_ms = doc.value("saved_ms", std::int64_t{0});
    snapshot.last_sequence = doc.value("last_sequence", std::uint64_t{0});
    snapshot.next_order_id = doc.value("next_order_id", domain::OrderId{1});
    snapshot.open_orders =
        doc.value("open_orders", std::vector<domain::Order>{});
    snapshot.positions =
        doc.value("positions", std::vector<domain::Position>{});
    snapshot.balances = doc.value("balances", std::vector<domain::Balance>{});
    return snapshot;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("malformed ledger snapshot " + path_ + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw ConfigError("malformed ledger snapshot " + path_ + ": " + e.what());
  }
}

}  // namespace bgcore
