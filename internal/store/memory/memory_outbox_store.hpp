#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/store/outbox_store.hpp"

namespace outbox::store::memory {

/*
  In-process outbox store.

  Same contract as the durable backends minus durability: everything is
  lost with the process. Used by tests and for dry runs.
*/
class MemoryOutboxStore final : public OutboxStore {
 public:
  MemoryOutboxStore() = default;

  Result      Append(const model::Event& event) override;
  PendingScan ListPending() override;
  Result      MarkProcessed(const std::string& id) override;
  Result      MarkFailed(const std::string& id, const std::string& reason) override;

  std::optional<model::Event> Get(const std::string& id) override;
  std::vector<model::Event>   ListFailed() override;
  Result                      Requeue(const std::string& id) override;
  Result                      Compact() override;
  StoreStats                  Stats() override;

 private:
  Result UpdateStatus(const std::string& id, model::EventStatus to, const std::string& reason);

  std::mutex mutex_;

  // append order; compaction rebuilds index_
  std::vector<model::Event>                    events_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace outbox::store::memory
