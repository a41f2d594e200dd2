#include "file_outbox_store.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace outbox::store::file {

using model::Event;
using model::EventStatus;
using observability::IntField;
using observability::StringField;

namespace {

/*
  Owns a POSIX file descriptor.
*/
class UniqueFd {
 public:
  explicit UniqueFd(int fd) : fd_(fd) {
  }
  ~UniqueFd() {
    if (fd_ >= 0) ::close(fd_);
  }

  UniqueFd(const UniqueFd&)            = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int Get() const {
    return fd_;
  }

  bool Valid() const {
    return fd_ >= 0;
  }

  // close explicitly so errors from close() are not lost
  int Close() {
    int rc = ::close(fd_);
    fd_    = -1;
    return rc;
  }

 private:
  int fd_;
};

/*
  Advisory lock on the sidecar <path>.lock, held for the lifetime of the
  object. The lock file is never renamed, so every instance on the same
  log, in any process, contends on the same inode.
*/
class FileLock {
 public:
  FileLock(const std::filesystem::path& path, int operation)
      : fd_(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)) {
    if (!fd_.Valid()) return;
    while (::flock(fd_.Get(), operation) != 0) {
      if (errno != EINTR) return;
    }
    locked_ = true;
  }

  bool Locked() const {
    return locked_;
  }

 private:
  UniqueFd fd_;
  bool     locked_ = false;
};

Result IoError(const std::string& what, const std::filesystem::path& path) {
  return Result::Err(ErrorCode::IOError, what + " " + path.string() + ": " + std::strerror(errno));
}

bool WriteFully(int fd, const std::string& data) {
  const char* cursor    = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, cursor, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    cursor += n;
    remaining -= static_cast<std::size_t>(n);
  }
  return true;
}

// fsync the directory so a rename survives power loss
void SyncDirectory(const std::filesystem::path& dir) {
  UniqueFd fd(::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.Valid()) {
    ::fsync(fd.Get());
  }
}

Result ValidateId(const std::string& id) {
  if (id.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "event id must not be empty");
  }
  return Result::Ok();
}

} // namespace

FileOutboxStore::FileOutboxStore(std::filesystem::path path) : FileOutboxStore(std::move(path), Options{}) {
}

FileOutboxStore::FileOutboxStore(std::filesystem::path path, Options options)
    : path_(std::move(path)),
      tmp_path_(path_.string() + ".tmp"),
      lock_path_(path_.string() + ".lock"),
      options_(options) {
  if (path_.empty()) {
    throw util::InvalidArgument("file store path must not be empty");
  }
  Recover();
}

// ------------------------------------------------------------------
// Recovery
// ------------------------------------------------------------------

void FileOutboxStore::Recover() {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create outbox directory " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  // exclusive, so a rewrite in flight elsewhere is never mistaken for a stale one
  FileLock file_lock(lock_path_, LOCK_EX);
  if (!file_lock.Locked()) {
    throw std::runtime_error("cannot lock outbox log " + lock_path_.string() + ": " + std::strerror(errno));
  }

  if (std::filesystem::remove(tmp_path_, ec)) {
    OUTBOX_LOG_WARN("Removed interrupted outbox rewrite", {StringField("path", tmp_path_.string())});
  }

  UniqueFd fd(::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  if (!fd.Valid()) {
    throw std::runtime_error("cannot open outbox log " + path_.string() + ": " + std::strerror(errno));
  }

  struct stat st {};
  if (::fstat(fd.Get(), &st) != 0) {
    throw std::runtime_error("cannot stat outbox log " + path_.string() + ": " + std::strerror(errno));
  }

  if (st.st_size > 0) {
    char last = '\n';
    if (::pread(fd.Get(), &last, 1, st.st_size - 1) != 1) {
      throw std::runtime_error("cannot read outbox log " + path_.string() + ": " + std::strerror(errno));
    }
    if (last != '\n') {
      OUTBOX_LOG_WARN("Terminating torn outbox record", {StringField("path", path_.string())});
      if (!WriteFully(fd.Get(), "\n") || (options_.fsync && ::fsync(fd.Get()) != 0)) {
        throw std::runtime_error("cannot repair outbox log " + path_.string() + ": " + std::strerror(errno));
      }
    }
  }

  LoadedLog log;
  if (auto r = ReadAll(log); !r) {
    throw std::runtime_error(r.message);
  }
  IndexLog(log);

  OUTBOX_LOG_INFO("Opened file outbox",
                  {StringField("path", path_.string()), IntField("events", static_cast<std::int64_t>(log.events.size())),
                   IntField("corrupt_records", static_cast<std::int64_t>(log.corrupt_lines.size()))});
}

// ------------------------------------------------------------------
// Id index
// ------------------------------------------------------------------

bool FileOutboxStore::CurrentStamp(LogStamp& stamp) const {
  struct stat st {};
  if (::stat(path_.c_str(), &st) != 0) return false;
  stamp.dev   = st.st_dev;
  stamp.ino   = st.st_ino;
  stamp.size  = st.st_size;
  stamp.mtime = st.st_mtim;
  return true;
}

void FileOutboxStore::IndexLog(const LoadedLog& log) {
  ids_.clear();
  for (const auto& event : log.events) {
    ids_.insert(event.id);
  }
  if (!CurrentStamp(stamp_)) stamp_ = LogStamp{};
}

// caller holds the exclusive flock
Result FileOutboxStore::RefreshIds() {
  LogStamp now;
  if (CurrentStamp(now) && now.dev == stamp_.dev && now.ino == stamp_.ino && now.size == stamp_.size &&
      now.mtime.tv_sec == stamp_.mtime.tv_sec && now.mtime.tv_nsec == stamp_.mtime.tv_nsec) {
    return Result::Ok();
  }

  LoadedLog log;
  if (auto r = ReadAll(log); !r) return r;
  IndexLog(log);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Read / rewrite
// ------------------------------------------------------------------

Result FileOutboxStore::ReadAll(LoadedLog& log) const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    if (!std::filesystem::exists(path_)) {
      return Result::Ok();
    }
    return IoError("cannot open", path_);
  }

  // last record for an id wins, keeping the position of the first
  std::unordered_map<std::string, std::size_t> index;

  std::string   line;
  std::uint64_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    try {
      Event event = Event::Parse(line);
      auto  it    = index.find(event.id);
      if (it == index.end()) {
        index.emplace(event.id, log.events.size());
        log.events.push_back(std::move(event));
      } else {
        log.events[it->second] = std::move(event);
      }
    } catch (const util::ParseError& e) {
      OUTBOX_LOG_WARN("Skipping corrupt outbox record",
                      {StringField("path", path_.string()), IntField("line", static_cast<std::int64_t>(line_no)), StringField("error", e.what())});
      log.corrupt_lines.push_back(line);
    }
  }

  if (in.bad()) {
    return IoError("cannot read", path_);
  }
  return Result::Ok();
}

/*
  Atomic rewrite:
      write tmp → fsync → rename → fsync dir
*/
Result FileOutboxStore::WriteAll(const LoadedLog& log) {
  std::string contents;
  for (const auto& event : log.events) {
    contents += event.Serialize();
    contents.push_back('\n');
  }
  for (const auto& raw : log.corrupt_lines) {
    contents += raw;
    contents.push_back('\n');
  }

  {
    UniqueFd fd(::open(tmp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
      return IoError("cannot create", tmp_path_);
    }
    if (!WriteFully(fd.Get(), contents) || (options_.fsync && ::fsync(fd.Get()) != 0) || fd.Close() != 0) {
      auto err = IoError("cannot write", tmp_path_);
      ::unlink(tmp_path_.c_str());
      return err;
    }
  }

  if (::rename(tmp_path_.c_str(), path_.c_str()) != 0) {
    auto err = IoError("cannot replace", path_);
    ::unlink(tmp_path_.c_str());
    return err;
  }

  if (options_.fsync) {
    SyncDirectory(path_.parent_path());
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Producer side
// ------------------------------------------------------------------

Result FileOutboxStore::Append(const Event& event) {
  if (auto r = ValidateId(event.id); !r) return r;

  Event record(event.id, event.payload);

  std::lock_guard lock(mutex_);
  FileLock        file_lock(lock_path_, LOCK_EX);
  if (!file_lock.Locked()) return IoError("cannot lock", lock_path_);

  // another instance may have appended or compacted since we last looked
  if (auto r = RefreshIds(); !r) return r;

  if (ids_.count(record.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "event " + record.id + " already in outbox");
  }

  UniqueFd fd(::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  if (!fd.Valid()) {
    return IoError("cannot open", path_);
  }

  // a writer that died mid-append leaves a torn tail; start a fresh line
  std::string line;
  struct stat st {};
  if (::fstat(fd.Get(), &st) != 0) return IoError("cannot stat", path_);
  if (st.st_size > 0) {
    char last = '\n';
    if (::pread(fd.Get(), &last, 1, st.st_size - 1) != 1) return IoError("cannot read", path_);
    if (last != '\n') line.push_back('\n');
  }
  line += record.Serialize();
  line.push_back('\n');

  if (!WriteFully(fd.Get(), line) || (options_.fsync && ::fsync(fd.Get()) != 0) || fd.Close() != 0) {
    return IoError("cannot append to", path_);
  }

  ids_.insert(record.id);
  if (!CurrentStamp(stamp_)) stamp_ = LogStamp{};
  return Result::Ok();
}

// ------------------------------------------------------------------
// Relay side
// ------------------------------------------------------------------

PendingScan FileOutboxStore::ListPending() {
  PendingScan scan;
  LoadedLog   log;

  {
    std::lock_guard lock(mutex_);
    FileLock        file_lock(lock_path_, LOCK_SH);
    if (!file_lock.Locked()) {
      scan.status = IoError("cannot lock", lock_path_);
      return scan;
    }
    scan.status = ReadAll(log);
  }

  scan.skipped_records = log.corrupt_lines.size();
  for (auto& event : log.events) {
    if (event.status == EventStatus::kPending) {
      scan.events.push_back(std::move(event));
    }
  }
  return scan;
}

Result FileOutboxStore::UpdateStatus(const std::string& id, EventStatus to, const std::string& reason) {
  std::lock_guard lock(mutex_);
  FileLock        file_lock(lock_path_, LOCK_EX);
  if (!file_lock.Locked()) return IoError("cannot lock", lock_path_);

  LoadedLog log;
  if (auto r = ReadAll(log); !r) return r;

  for (auto& event : log.events) {
    if (event.id != id) continue;

    if (!model::CanTransition(event.status, to)) {
      return Result::Err(ErrorCode::InvalidTransition, "event " + id + " is already " + std::string(model::ToString(event.status)));
    }
    event.status         = to;
    event.failure_reason = to == EventStatus::kFailed ? reason : std::string{};
    if (auto r = WriteAll(log); !r) return r;
    IndexLog(log);
    return Result::Ok();
  }

  return Result::Err(ErrorCode::NotFound, "event " + id + " not in outbox");
}

Result FileOutboxStore::MarkProcessed(const std::string& id) {
  return UpdateStatus(id, EventStatus::kProcessed, {});
}

Result FileOutboxStore::MarkFailed(const std::string& id, const std::string& reason) {
  return UpdateStatus(id, EventStatus::kFailed, reason);
}

// ------------------------------------------------------------------
// Inspection / maintenance
// ------------------------------------------------------------------

std::optional<Event> FileOutboxStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  FileLock        file_lock(lock_path_, LOCK_SH);
  if (!file_lock.Locked()) throw StoreError(IoError("cannot lock", lock_path_));

  LoadedLog log;
  if (auto r = ReadAll(log); !r) throw StoreError(std::move(r));

  for (auto& event : log.events) {
    if (event.id == id) return std::move(event);
  }
  return std::nullopt;
}

std::vector<Event> FileOutboxStore::ListFailed() {
  LoadedLog log;
  {
    std::lock_guard lock(mutex_);
    FileLock        file_lock(lock_path_, LOCK_SH);
    if (!file_lock.Locked()) throw StoreError(IoError("cannot lock", lock_path_));
    if (auto r = ReadAll(log); !r) throw StoreError(std::move(r));
  }

  std::vector<Event> failed;
  for (auto& event : log.events) {
    if (event.status == EventStatus::kFailed) {
      failed.push_back(std::move(event));
    }
  }
  return failed;
}

Result FileOutboxStore::Requeue(const std::string& id) {
  std::lock_guard lock(mutex_);
  FileLock        file_lock(lock_path_, LOCK_EX);
  if (!file_lock.Locked()) return IoError("cannot lock", lock_path_);

  LoadedLog log;
  if (auto r = ReadAll(log); !r) return r;

  for (auto& event : log.events) {
    if (event.id != id) continue;

    if (event.status != EventStatus::kFailed) {
      return Result::Err(ErrorCode::InvalidTransition, "only failed events can be requeued, " + id + " is " + std::string(model::ToString(event.status)));
    }
    event.status = EventStatus::kPending;
    event.failure_reason.clear();
    if (auto r = WriteAll(log); !r) return r;
    IndexLog(log);
    return Result::Ok();
  }

  return Result::Err(ErrorCode::NotFound, "event " + id + " not in outbox");
}

Result FileOutboxStore::Compact() {
  std::lock_guard lock(mutex_);
  FileLock        file_lock(lock_path_, LOCK_EX);
  if (!file_lock.Locked()) return IoError("cannot lock", lock_path_);

  LoadedLog log;
  if (auto r = ReadAll(log); !r) return r;

  LoadedLog                kept;
  std::vector<std::string> dropped;
  kept.corrupt_lines = std::move(log.corrupt_lines);
  for (auto& event : log.events) {
    if (event.status == EventStatus::kProcessed) {
      dropped.push_back(event.id);
    } else {
      kept.events.push_back(std::move(event));
    }
  }

  if (dropped.empty()) {
    return Result::Ok();
  }

  if (auto r = WriteAll(kept); !r) return r;
  IndexLog(kept);

  OUTBOX_LOG_INFO("Compacted file outbox", {StringField("path", path_.string()), IntField("removed", static_cast<std::int64_t>(dropped.size()))});
  return Result::Ok();
}

StoreStats FileOutboxStore::Stats() {
  LoadedLog log;
  {
    std::lock_guard lock(mutex_);
    FileLock        file_lock(lock_path_, LOCK_SH);
    if (!file_lock.Locked()) throw StoreError(IoError("cannot lock", lock_path_));
    if (auto r = ReadAll(log); !r) throw StoreError(std::move(r));
  }

  StoreStats stats;
  stats.skipped_records = log.corrupt_lines.size();
  for (const auto& event : log.events) {
    switch (event.status) {
      case EventStatus::kPending:
        ++stats.pending;
        break;
      case EventStatus::kProcessed:
        ++stats.processed;
        break;
      case EventStatus::kFailed:
        ++stats.failed;
        break;
    }
  }
  return stats;
}

} // namespace outbox::store::file
