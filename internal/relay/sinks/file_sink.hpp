#pragma once

#include <filesystem>
#include <mutex>

#include "internal/relay/relay_sink.hpp"

namespace outbox::relay::sinks {

/*
  Appends one line per delivered event to a file:

      <delivered_at_unix_ms>|<id>|<payload>

  with the same escaping as the outbox log. The file is opened lazily and
  reopened after a write error, so a missing directory or full disk is a
  transient failure. A partial line left by a failed write is truncated
  away, or terminated on reopen when truncation is not possible. Empty payloads are rejected permanently when
  reject_empty_payload is set.
*/
class FileSink final : public RelaySink {
 public:
  struct Options {
    bool fsync                = false;
    bool reject_empty_payload = false;
  };

  explicit FileSink(std::filesystem::path path);
  FileSink(std::filesystem::path path, Options options);
  ~FileSink() override;

  FileSink(const FileSink&)            = delete;
  FileSink& operator=(const FileSink&) = delete;

  std::string_view Name() const override {
    return "file";
  }

  DeliveryResult Deliver(const model::Event& event) override;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  DeliveryResult Fail(const std::string& what);
  DeliveryResult TerminateTornLine();
  void CloseLocked();

  std::filesystem::path path_;
  Options               options_;

  std::mutex mutex_;
  int        fd_ = -1;
};

} // namespace outbox::relay::sinks
