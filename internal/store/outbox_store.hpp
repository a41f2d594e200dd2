#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/event.hpp"
#include "internal/store/result.hpp"

namespace outbox::store {

/*
  Result of a pending scan.

  skipped_records counts records that could not be parsed and were left out.
  status is not OK when the backend could not be read at all.
*/
struct PendingScan {
  Result                    status;
  std::vector<model::Event> events;
  std::uint64_t             skipped_records = 0;
};

struct StoreStats {
  std::uint64_t pending         = 0;
  std::uint64_t processed       = 0;
  std::uint64_t failed          = 0;
  std::uint64_t skipped_records = 0;
};

/*
  Outbox store abstraction.

  The store exclusively owns the persisted event sequence. Every mutation is
  serialized inside the store; callers only ever see whole records.

  Duplicate policy: Append rejects an id that is already present (in any
  status) with AlreadyExists and leaves the stored event untouched.

  Implementations:
    FILE    → line log, atomic rewrite via tmp + rename
    SQLITE  → outbox_events table
    MEMORY  → tests / dry runs, not durable
*/
class OutboxStore {
 public:
  virtual ~OutboxStore() = default;

  // ------------------------------------------------------------------
  // Producer side
  // ------------------------------------------------------------------
  /*
    Durably add a new Pending event. The status carried by the argument is
    ignored.
  */
  virtual Result Append(const model::Event& event) = 0;

  // ------------------------------------------------------------------
  // Relay side
  // ------------------------------------------------------------------
  /*
    Snapshot of all Pending events in append order.
  */
  virtual PendingScan ListPending() = 0;

  virtual Result MarkProcessed(const std::string& id) = 0;

  virtual Result MarkFailed(const std::string& id, const std::string& reason) = 0;

  // ------------------------------------------------------------------
  // Inspection / maintenance
  // ------------------------------------------------------------------
  virtual std::optional<model::Event> Get(const std::string& id) = 0;

  virtual std::vector<model::Event> ListFailed() = 0;

  /*
    Operator action: move a Failed event back to Pending so it is relayed
    again. Never called by the relay engine.
  */
  virtual Result Requeue(const std::string& id) = 0;

  /*
    Drop Processed events. Failed events are retained.
  */
  virtual Result Compact() = 0;

  virtual StoreStats Stats() = 0;
};

using OutboxStorePtr = std::shared_ptr<OutboxStore>;

} // namespace outbox::store
