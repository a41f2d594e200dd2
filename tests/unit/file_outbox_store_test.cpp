#include "internal/store/file/file_outbox_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using outbox::model::Event;
using outbox::model::EventStatus;
using outbox::store::ErrorCode;
using outbox::store::file::FileOutboxStore;

std::filesystem::path FreshLog(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "outbox_relay_file_store_tests";
  std::filesystem::create_directories(base_dir);

  const auto path = base_dir / (test_name + ".log");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + ".tmp");
  return path;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

void TestAppendThenListPending() {
  const auto path = FreshLog("append_list");
  FileOutboxStore store(path);

  assert(store.Append(Event("1", "A")));
  assert(store.Append(Event("2", "B")));

  auto scan = store.ListPending();
  assert(scan.status);
  assert(scan.skipped_records == 0);
  assert(scan.events.size() == 2);
  assert(scan.events[0].id == "1" && scan.events[0].payload == "A");
  assert(scan.events[1].id == "2" && scan.events[1].payload == "B");
  assert(scan.events[0].status == EventStatus::kPending);

  assert(ReadFile(path) == "1|A|pending\n2|B|pending\n");
}

void TestAppendIgnoresIncomingStatus() {
  const auto path = FreshLog("append_status");
  FileOutboxStore store(path);

  Event event("1", "A");
  event.status = EventStatus::kProcessed;
  assert(store.Append(event));

  auto scan = store.ListPending();
  assert(scan.events.size() == 1);
}

void TestDuplicateAppendIsRejected() {
  const auto path = FreshLog("duplicate");
  FileOutboxStore store(path);

  assert(store.Append(Event("1", "A")));
  auto dup = store.Append(Event("1", "A-retry"));
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  auto scan = store.ListPending();
  assert(scan.events.size() == 1);
  assert(scan.events[0].payload == "A");

  // still rejected after the event left Pending
  assert(store.MarkProcessed("1"));
  assert(store.Append(Event("1", "A")).code == ErrorCode::AlreadyExists);
}

void TestEmptyIdIsRejected() {
  const auto path = FreshLog("empty_id");
  FileOutboxStore store(path);

  assert(store.Append(Event("", "A")).code == ErrorCode::InvalidArgument);
}

void TestMarkProcessedAndFailed() {
  const auto path = FreshLog("mark");
  FileOutboxStore store(path);

  assert(store.Append(Event("1", "A")));
  assert(store.Append(Event("2", "B")));
  assert(store.Append(Event("3", "C")));

  assert(store.MarkProcessed("1"));
  assert(store.MarkFailed("2", "rejected by broker"));

  auto scan = store.ListPending();
  assert(scan.events.size() == 1);
  assert(scan.events[0].id == "3");

  auto failed = store.Get("2");
  assert(failed.has_value());
  assert(failed->status == EventStatus::kFailed);
  assert(failed->failure_reason == "rejected by broker");

  // order of records is preserved by the rewrite
  assert(ReadFile(path) == "1|A|processed\n2|B|failed:rejected by broker\n3|C|pending\n");
}

void TestTerminalStatesAreFinal() {
  const auto path = FreshLog("terminal");
  FileOutboxStore store(path);

  assert(store.Append(Event("1", "A")));
  assert(store.MarkProcessed("1"));

  assert(store.MarkProcessed("1").code == ErrorCode::InvalidTransition);
  assert(store.MarkFailed("1", "late").code == ErrorCode::InvalidTransition);
  assert(store.Get("1")->status == EventStatus::kProcessed);
}

void TestUnknownIdIsNotFound() {
  const auto path = FreshLog("not_found");
  FileOutboxStore store(path);

  assert(store.MarkProcessed("missing").code == ErrorCode::NotFound);
  assert(store.MarkFailed("missing", "x").code == ErrorCode::NotFound);
  assert(store.Requeue("missing").code == ErrorCode::NotFound);
  assert(!store.Get("missing").has_value());
}

void TestCorruptRecordsAreSkippedAndCounted() {
  const auto path = FreshLog("corrupt");
  WriteFile(path, "1|A|pending\nthis is not a record\n2|B|bogus\n3|C|pending\n");

  FileOutboxStore store(path);
  auto scan = store.ListPending();
  assert(scan.status);
  assert(scan.skipped_records == 2);
  assert(scan.events.size() == 2);
  assert(scan.events[0].id == "1");
  assert(scan.events[1].id == "3");

  // a rewrite keeps the corrupt lines for inspection
  assert(store.MarkProcessed("1"));
  auto contents = ReadFile(path);
  assert(contents.find("this is not a record\n") != std::string::npos);
  assert(contents.find("2|B|bogus\n") != std::string::npos);
  assert(store.Stats().skipped_records == 2);
}

void TestTornTailIsTerminatedOnOpen() {
  const auto path = FreshLog("torn_tail");
  WriteFile(path, "1|A|pending\n2|B|pend");

  {
    FileOutboxStore store(path);
    assert(store.Append(Event("3", "C")));

    auto scan = store.ListPending();
    assert(scan.skipped_records == 1);
    assert(scan.events.size() == 2);
    assert(scan.events[0].id == "1");
    assert(scan.events[1].id == "3");
  }

  assert(ReadFile(path) == "1|A|pending\n2|B|pend\n3|C|pending\n");
}

void TestStaleRewriteFileIsDiscarded() {
  const auto path = FreshLog("stale_tmp");
  WriteFile(path, "1|A|pending\n");
  WriteFile(path.string() + ".tmp", "1|A|processed\n");

  FileOutboxStore store(path);
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  auto scan = store.ListPending();
  assert(scan.events.size() == 1);
  assert(scan.events[0].id == "1");
}

void TestRestartRecoversState() {
  const auto path = FreshLog("restart");
  {
    FileOutboxStore store(path);
    assert(store.Append(Event("1", "A")));
    assert(store.Append(Event("2", "B")));
    assert(store.MarkProcessed("1"));
  }

  FileOutboxStore reopened(path);
  auto scan = reopened.ListPending();
  assert(scan.events.size() == 1);
  assert(scan.events[0].id == "2");
  assert(reopened.Append(Event("1", "A")).code == ErrorCode::AlreadyExists);
}

void TestDuplicateRecordsLastWins() {
  const auto path = FreshLog("last_wins");
  WriteFile(path, "1|A|pending\n2|B|pending\n1|A|processed\n");

  FileOutboxStore store(path);
  auto scan = store.ListPending();
  assert(scan.events.size() == 1);
  assert(scan.events[0].id == "2");
  assert(store.Get("1")->status == EventStatus::kProcessed);
}

void TestRequeueAndCompact() {
  const auto path = FreshLog("requeue_compact");
  FileOutboxStore store(path);

  assert(store.Append(Event("1", "A")));
  assert(store.Append(Event("2", "B")));
  assert(store.Append(Event("3", "C")));
  assert(store.MarkProcessed("1"));
  assert(store.MarkFailed("2", "boom"));

  assert(store.Requeue("3").code == ErrorCode::InvalidTransition);
  assert(store.ListFailed().size() == 1);

  assert(store.Compact());
  assert(ReadFile(path) == "2|B|failed:boom\n3|C|pending\n");

  auto stats = store.Stats();
  assert(stats.pending == 1);
  assert(stats.processed == 0);
  assert(stats.failed == 1);

  assert(store.Requeue("2"));
  auto requeued = store.Get("2");
  assert(requeued->status == EventStatus::kPending);
  assert(requeued->failure_reason.empty());
  assert(store.ListPending().events.size() == 2);

  // compacted ids may be reused
  assert(store.Append(Event("1", "A2")));
}

void TestConcurrentMarksDoNotLoseUpdates() {
  const auto path = FreshLog("concurrent");
  FileOutboxStore store(path, FileOutboxStore::Options{.fsync = false});

  constexpr int kEvents = 32;
  for (int i = 0; i < kEvents; ++i) {
    assert(store.Append(Event(std::to_string(i), "p")));
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, t] {
      for (int i = t; i < kEvents; i += 4) {
        auto r = store.MarkProcessed(std::to_string(i));
        assert(r);
        (void)r;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(store.ListPending().events.empty());
  assert(store.Stats().processed == kEvents);
}

// a producer (outboxctl) and the relay each hold their own store on one log
void TestAppendsSurviveRewritesFromAnotherInstance() {
  const auto path = FreshLog("two_instances");
  FileOutboxStore relay(path, FileOutboxStore::Options{.fsync = false});
  FileOutboxStore producer(path, FileOutboxStore::Options{.fsync = false});

  for (int i = 0; i < 500; ++i) {
    assert(relay.Append(Event("pad-" + std::to_string(i), std::string(64, 'x'))));
  }
  assert(relay.Append(Event("seed", "s")));
  assert(relay.MarkFailed("seed", "boom"));

  constexpr int    kAppends = 300;
  std::atomic<bool> done{false};

  std::thread rewriter([&] {
    while (!done.load()) {
      auto requeued = relay.Requeue("seed");
      assert(requeued);
      auto failed = relay.MarkFailed("seed", "boom");
      assert(failed);
      (void)requeued;
      (void)failed;
    }
  });

  int appended = 0;
  for (int i = 0; i < kAppends; ++i) {
    if (producer.Append(Event("new-" + std::to_string(i), "n"))) ++appended;
  }
  done = true;
  rewriter.join();
  assert(appended == kAppends);

  FileOutboxStore reopened(path);
  for (int i = 0; i < kAppends; ++i) {
    auto event = reopened.Get("new-" + std::to_string(i));
    assert(event.has_value());
    assert(event->status == EventStatus::kPending);
  }
  assert(reopened.Stats().pending == 500 + kAppends);
}

void TestDuplicateIsDetectedAcrossInstances() {
  const auto path = FreshLog("two_instances_dup");
  FileOutboxStore first(path);
  FileOutboxStore second(path);

  assert(first.Append(Event("1", "A")));
  auto dup = second.Append(Event("1", "A-again"));
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  // ids compacted away by one instance can be appended through the other
  assert(first.MarkProcessed("1"));
  assert(first.Compact());
  assert(second.Append(Event("1", "A-reused")));
  assert(first.Get("1")->payload == "A-reused");
}

void TestAppendAfterTornTailFromAnotherWriter() {
  const auto path = FreshLog("torn_by_other");
  FileOutboxStore store(path);
  assert(store.Append(Event("1", "A")));

  // another process died halfway through its append
  {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out << "2|B|pen";
  }

  assert(store.Append(Event("3", "C")));

  auto scan = store.ListPending();
  assert(scan.events.size() == 2);
  assert(scan.events[0].id == "1");
  assert(scan.events[1].id == "3" && scan.events[1].payload == "C");
  assert(scan.skipped_records == 1);
}

} // namespace

int main() {
  TestAppendThenListPending();
  TestAppendIgnoresIncomingStatus();
  TestDuplicateAppendIsRejected();
  TestEmptyIdIsRejected();
  TestMarkProcessedAndFailed();
  TestTerminalStatesAreFinal();
  TestUnknownIdIsNotFound();
  TestCorruptRecordsAreSkippedAndCounted();
  TestTornTailIsTerminatedOnOpen();
  TestStaleRewriteFileIsDiscarded();
  TestRestartRecoversState();
  TestDuplicateRecordsLastWins();
  TestRequeueAndCompact();
  TestConcurrentMarksDoNotLoseUpdates();
  TestAppendsSurviveRewritesFromAnotherInstance();
  TestDuplicateIsDetectedAcrossInstances();
  TestAppendAfterTornTailFromAnotherWriter();

  std::cout << "outbox_relay_unit_file_outbox_store: pass\n";
  return 0;
}
