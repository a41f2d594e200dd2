#include "memory_outbox_store.hpp"

namespace outbox::store::memory {

using model::Event;
using model::EventStatus;

Result MemoryOutboxStore::Append(const Event& event) {
  if (event.id.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "event id must not be empty");
  }

  std::lock_guard lock(mutex_);

  if (index_.count(event.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "event " + event.id + " already in outbox");
  }

  index_.emplace(event.id, events_.size());
  events_.emplace_back(event.id, event.payload);
  return Result::Ok();
}

PendingScan MemoryOutboxStore::ListPending() {
  std::lock_guard lock(mutex_);

  PendingScan scan;
  for (const auto& event : events_) {
    if (event.status == EventStatus::kPending) {
      scan.events.push_back(event);
    }
  }
  return scan;
}

Result MemoryOutboxStore::UpdateStatus(const std::string& id, EventStatus to, const std::string& reason) {
  std::lock_guard lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end()) {
    return Result::Err(ErrorCode::NotFound, "event " + id + " not in outbox");
  }

  auto& event = events_[it->second];
  if (!model::CanTransition(event.status, to)) {
    return Result::Err(ErrorCode::InvalidTransition, "event " + id + " is already " + std::string(model::ToString(event.status)));
  }

  event.status         = to;
  event.failure_reason = to == EventStatus::kFailed ? reason : std::string{};
  return Result::Ok();
}

Result MemoryOutboxStore::MarkProcessed(const std::string& id) {
  return UpdateStatus(id, EventStatus::kProcessed, {});
}

Result MemoryOutboxStore::MarkFailed(const std::string& id, const std::string& reason) {
  return UpdateStatus(id, EventStatus::kFailed, reason);
}

std::optional<Event> MemoryOutboxStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return events_[it->second];
}

std::vector<Event> MemoryOutboxStore::ListFailed() {
  std::lock_guard lock(mutex_);

  std::vector<Event> failed;
  for (const auto& event : events_) {
    if (event.status == EventStatus::kFailed) failed.push_back(event);
  }
  return failed;
}

Result MemoryOutboxStore::Requeue(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end()) {
    return Result::Err(ErrorCode::NotFound, "event " + id + " not in outbox");
  }

  auto& event = events_[it->second];
  if (event.status != EventStatus::kFailed) {
    return Result::Err(ErrorCode::InvalidTransition, "only failed events can be requeued, " + id + " is " + std::string(model::ToString(event.status)));
  }
  event.status = EventStatus::kPending;
  event.failure_reason.clear();
  return Result::Ok();
}

Result MemoryOutboxStore::Compact() {
  std::lock_guard lock(mutex_);

  std::vector<Event> kept;
  kept.reserve(events_.size());
  for (auto& event : events_) {
    if (event.status != EventStatus::kProcessed) kept.push_back(std::move(event));
  }

  events_ = std::move(kept);
  index_.clear();
  for (std::size_t i = 0; i < events_.size(); ++i) {
    index_.emplace(events_[i].id, i);
  }
  return Result::Ok();
}

StoreStats MemoryOutboxStore::Stats() {
  std::lock_guard lock(mutex_);

  StoreStats stats;
  for (const auto& event : events_) {
    if (event.status == EventStatus::kPending) ++stats.pending;
    if (event.status == EventStatus::kProcessed) ++stats.processed;
    if (event.status == EventStatus::kFailed) ++stats.failed;
  }
  return stats;
}

} // namespace outbox::store::memory
