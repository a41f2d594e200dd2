#include "file_sink.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace outbox::relay::sinks {

FileSink::FileSink(std::filesystem::path path) : FileSink(std::move(path), Options{}) {
}

FileSink::FileSink(std::filesystem::path path, Options options) : path_(std::move(path)), options_(options) {
}

FileSink::~FileSink() {
  CloseLocked();
}

void FileSink::CloseLocked() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

DeliveryResult FileSink::Fail(const std::string& what) {
  auto result = DeliveryResult::Transient(what + " " + path_.string() + ": " + std::strerror(errno));
  CloseLocked();
  return result;
}

// a file that does not end in '\n' holds a torn line from an earlier
// failed write; end it so the next record starts on its own line
DeliveryResult FileSink::TerminateTornLine() {
  struct stat st {};
  if (::fstat(fd_, &st) != 0) return Fail("stat");
  if (st.st_size == 0) return DeliveryResult::Delivered();

  char last = '\n';
  if (::pread(fd_, &last, 1, st.st_size - 1) != 1) return Fail("read");
  if (last == '\n') return DeliveryResult::Delivered();

  OUTBOX_LOG_WARN("terminating torn sink line", {observability::StringField("path", path_.string())});
  while (::write(fd_, "\n", 1) != 1) {
    if (errno != EINTR) return Fail("write");
  }
  return DeliveryResult::Delivered();
}

DeliveryResult FileSink::Deliver(const model::Event& event) {
  if (options_.reject_empty_payload && event.payload.empty()) {
    return DeliveryResult::Permanent("empty payload rejected by file sink");
  }

  std::string line = std::to_string(util::ToUnixMillis(util::Now()));
  line.push_back('|');
  line += model::EscapeField(event.id);
  line.push_back('|');
  line += model::EscapeField(event.payload);
  line.push_back('\n');

  std::lock_guard lock(mutex_);

  if (fd_ < 0) {
    if (path_.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path_.parent_path(), ec);
      if (ec) {
        return DeliveryResult::Transient("create directory " + path_.parent_path().string() + ": " + ec.message());
      }
    }
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return Fail("open");
    if (auto r = TerminateTornLine(); !r) return r;
  }

  struct stat st {};
  if (::fstat(fd_, &st) != 0) return Fail("stat");

  const char* cursor    = line.data();
  std::size_t remaining = line.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd_, cursor, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      // drop the partial line; if that fails the reopen terminates it
      const int saved = errno;
      if (remaining != line.size() && ::ftruncate(fd_, st.st_size) != 0) {
        OUTBOX_LOG_WARN("cannot drop partial sink line", {observability::StringField("path", path_.string())});
      }
      errno = saved;
      return Fail("write");
    }
    cursor += n;
    remaining -= static_cast<std::size_t>(n);
  }

  if (options_.fsync && ::fsync(fd_) != 0) return Fail("fsync");

  return DeliveryResult::Delivered();
}

} // namespace outbox::relay::sinks
