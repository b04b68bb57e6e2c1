#pragma once

#include "bgcore/ledger/ledger_snapshot.hpp"

#include <optional>
#include <string>

namespace bgcore {

// -----------------------------------------------------------------------------
// ILedgerStore: persisted ledger snapshot
// -----------------------------------------------------------------------------
//
// save() is called on shutdown and periodically from the coordinator's
// timer; load() once at startup, before the ledger sees any event.
// -----------------------------------------------------------------------------
class ILedgerStore {
 public:
  virtual ~ILedgerStore() = default;

  // Throws std::runtime_error if the snapshot cannot be written.
  virtual void save(const LedgerSnapshot& snapshot) = 0;

  // nullopt when nothing has been saved yet. Throws ConfigError if a saved
  // snapshot exists but cannot be parsed.
  virtual std::optional<LedgerSnapshot> load() = 0;
};

// -----------------------------------------------------------------------------
// JsonFileLedgerStore
// -----------------------------------------------------------------------------
//
// One JSON document per file. save() writes "<path>.tmp" and renames it over
// <path>, so a crash mid-write leaves the previous snapshot intact.
// -----------------------------------------------------------------------------
class JsonFileLedgerStore : public ILedgerStore {
 public:
  explicit JsonFileLedgerStore(std::string path);

  void save(const LedgerSnapshot& snapshot) override;
  std::optional<LedgerSnapshot> load() override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace bgcore
