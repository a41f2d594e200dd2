#pragma once

#include <sys/stat.h>

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/store/outbox_store.hpp"

namespace outbox::store::file {

/*
  Line-log outbox store.

  One record per line: id|payload|status (see model::Event).

    Append  → O_APPEND write of one record (+ fsync)
    Mark*   → read all, modify, write <path>.tmp, fsync, rename over <path>

  All operations hold mutex_ and an flock on <path>.lock: exclusive for
  Append and every rewrite, shared for scans. The flock is what keeps
  outboxctl appends from landing on an inode the relay is about to
  replace. ids_ is refreshed from the log whenever another instance has
  changed it since this one last looked.

  Recovery on open:
    - a stale <path>.tmp from an interrupted rewrite is removed
      (rename is atomic, so <path> still holds the previous sequence)
    - a torn last record from an interrupted append is terminated so it is
      skipped as corrupt instead of being glued to the next append
*/
class FileOutboxStore final : public OutboxStore {
 public:
  struct Options {
    bool fsync = true;
  };

  // throws std::runtime_error if the log cannot be created or read
  explicit FileOutboxStore(std::filesystem::path path);
  FileOutboxStore(std::filesystem::path path, Options options);

  FileOutboxStore(const FileOutboxStore&)            = delete;
  FileOutboxStore& operator=(const FileOutboxStore&) = delete;

  Result      Append(const model::Event& event) override;
  PendingScan ListPending() override;
  Result      MarkProcessed(const std::string& id) override;
  Result      MarkFailed(const std::string& id, const std::string& reason) override;

  std::optional<model::Event> Get(const std::string& id) override;
  std::vector<model::Event>   ListFailed() override;
  Result                      Requeue(const std::string& id) override;
  Result                      Compact() override;
  StoreStats                  Stats() override;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  struct LoadedLog {
    std::vector<model::Event> events;
    // unparseable lines are carried through rewrites untouched
    std::vector<std::string> corrupt_lines;
  };

  // identifies the log contents last seen by this instance
  struct LogStamp {
    dev_t           dev = 0;
    ino_t           ino = 0;
    off_t           size = -1;
    struct timespec mtime {};
  };

  void   Recover();
  Result ReadAll(LoadedLog& log) const;
  Result WriteAll(const LoadedLog& log);
  Result RefreshIds();
  void   IndexLog(const LoadedLog& log);
  bool   CurrentStamp(LogStamp& stamp) const;
  Result UpdateStatus(const std::string& id, model::EventStatus to, const std::string& reason);

  std::filesystem::path path_;
  std::filesystem::path tmp_path_;
  std::filesystem::path lock_path_;
  Options               options_;

  std::mutex                      mutex_;
  std::unordered_set<std::string> ids_;
  LogStamp                        stamp_;
};

} // namespace outbox::store::file
