#include "sink_factory.hpp"

#include "file_sink.hpp"
#include "internal/util/errors.hpp"
#include "log_sink.hpp"

namespace outbox::relay::sinks {

RelaySinkPtr SinkFactory::Build(const outbox::runtime::config::SinkConfig& cfg) {
  if (cfg.has_file()) {
    if (cfg.file().path().empty()) {
      throw util::InvalidArgument("sink.file.path is required");
    }

    FileSink::Options options;
    options.fsync                = cfg.file().fsync();
    options.reject_empty_payload = cfg.file().reject_empty_payload();
    return std::make_shared<FileSink>(cfg.file().path(), options);
  }

  return std::make_shared<LogSink>();
}

} // namespace outbox::relay::sinks
