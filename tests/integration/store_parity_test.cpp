#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/event.hpp"
#include "internal/store/file/file_outbox_store.hpp"
#include "internal/store/memory/memory_outbox_store.hpp"
#include "internal/store/outbox_store.hpp"

#if OUTBOX_STORE_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_outbox_store.hpp"
#endif

namespace {

using outbox::model::Event;
using outbox::model::EventStatus;
using outbox::store::ErrorCode;
using outbox::store::OutboxStore;
using outbox::store::file::FileOutboxStore;
using outbox::store::memory::MemoryOutboxStore;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                        name;
  std::function<std::shared_ptr<OutboxStore>()>      make_store;
  std::function<bool()>                              supports_restart;
  std::function<void(std::shared_ptr<OutboxStore>&)> restart;
  std::function<void()>                              cleanup;
};

void VerifyAppendListMark(OutboxStore& store, const std::string& prefix) {
  const auto a = prefix + "-1";
  const auto b = prefix + "-2";
  const auto c = prefix + "-3";

  assert(store.Append(Event(a, "A")));
  assert(store.Append(Event(b, "B")));
  assert(store.Append(Event(c, "C")));

  auto scan = store.ListPending();
  assert(scan.status);
  assert(scan.events.size() == 3);
  assert(scan.events[0].id == a);
  assert(scan.events[1].id == b);
  assert(scan.events[2].id == c);

  assert(store.MarkProcessed(a));
  assert(store.MarkFailed(b, "permanent: rejected"));
  assert(store.MarkProcessed(c));

  assert(store.ListPending().events.empty());
  assert(store.Get(a)->status == EventStatus::kProcessed);

  auto failed = store.Get(b);
  assert(failed.has_value());
  assert(failed->status == EventStatus::kFailed);
  assert(failed->failure_reason == "permanent: rejected");
}

void VerifyPayloadBytesSurvive(OutboxStore& store, const std::string& prefix) {
  const std::string id      = prefix + "|odd\\id";
  const std::string payload = "{\"k\":\"v|w\"}\nsecond line\r\n";

  assert(store.Append(Event(id, payload)));
  auto event = store.Get(id);
  assert(event.has_value());
  assert(event->payload == payload);
  assert(store.MarkProcessed(id));
}

void VerifyDuplicatePolicy(OutboxStore& store, const std::string& prefix) {
  const auto id = prefix + "-dup";

  assert(store.Append(Event(id, "first")));
  auto dup = store.Append(Event(id, "second"));
  assert(dup.code == ErrorCode::AlreadyExists);

  size_t seen = 0;
  for (const auto& event : store.ListPending().events) {
    if (event.id == id) {
      ++seen;
      assert(event.payload == "first");
    }
  }
  assert(seen == 1);
  assert(store.MarkProcessed(id));
}

void VerifyTransitions(OutboxStore& store, const std::string& prefix) {
  const auto id = prefix + "-transitions";

  assert(store.MarkProcessed(id).code == ErrorCode::NotFound);
  assert(store.Append(Event(id, "x")));
  assert(store.Requeue(id).code == ErrorCode::InvalidTransition);

  assert(store.MarkFailed(id, "boom"));
  assert(store.MarkProcessed(id).code == ErrorCode::InvalidTransition);

  assert(store.Requeue(id));
  assert(store.Get(id)->status == EventStatus::kPending);
  assert(store.Get(id)->failure_reason.empty());

  assert(store.MarkProcessed(id));
  assert(store.MarkFailed(id, "late").code == ErrorCode::InvalidTransition);
}

void VerifyCompact(OutboxStore& store) {
  auto before = store.Stats();
  assert(before.processed > 0);

  assert(store.Compact());

  auto after = store.Stats();
  assert(after.processed == 0);
  assert(after.pending == before.pending);
  assert(after.failed == before.failed);
  assert(store.ListFailed().size() == after.failed);
}

void VerifyConcurrentAppends(OutboxStore& store, const std::string& prefix) {
  constexpr int kThreads   = 4;
  constexpr int kPerThread = 16;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, &prefix, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto r = store.Append(Event(prefix + "-c" + std::to_string(t) + "-" + std::to_string(i), "p"));
        assert(r);
        (void)r;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  size_t count = 0;
  for (const auto& event : store.ListPending().events) {
    if (event.id.rfind(prefix + "-c", 0) == 0) ++count;
  }
  assert(count == kThreads * kPerThread);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  assert(store->Append(Event(prefix + "-durable-1", "A")));
  assert(store->Append(Event(prefix + "-durable-2", "B")));
  assert(store->MarkProcessed(prefix + "-durable-1"));

  backend.restart(store);

  assert(store->Get(prefix + "-durable-1")->status == EventStatus::kProcessed);
  assert(store->Get(prefix + "-durable-2")->status == EventStatus::kPending);
  assert(store->Append(Event(prefix + "-durable-2", "B")).code == ErrorCode::AlreadyExists);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<MemoryOutboxStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<OutboxStore>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeFileFactory() {
  auto log_path = std::filesystem::temp_directory_path() / ("outbox_relay_integration_file_" + std::to_string(NowMs()) + ".log");

  auto make_store = [log_path]() { return std::make_shared<FileOutboxStore>(log_path, FileOutboxStore::Options{.fsync = false}); };

  return BackendFactory{
      .name             = "file",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<OutboxStore>& store) { store = make_store(); },
      .cleanup          = [log_path]() { std::filesystem::remove(log_path); },
  };
}

#if OUTBOX_STORE_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("outbox_relay_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() {
    return std::make_shared<outbox::store::sqlite::SqliteOutboxStore>(std::make_shared<outbox::store::sqlite::SqliteDB>(db_path));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<OutboxStore>& store) {
        store.reset();
        store = make_store();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto store = backend.make_store();

    VerifyAppendListMark(*store, backend.name + "-life");
    VerifyPayloadBytesSurvive(*store, backend.name + "-bytes");
    VerifyDuplicatePolicy(*store, backend.name);
    VerifyTransitions(*store, backend.name);
    VerifyCompact(*store);
    VerifyConcurrentAppends(*store, backend.name);
  }

  VerifyRestartDurability(backend, backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeFileFactory());

#if OUTBOX_STORE_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "outbox_relay_integration_store_parity: pass\n";
  return 0;
}
