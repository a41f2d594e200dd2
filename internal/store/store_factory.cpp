#include "store_factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "file/file_outbox_store.hpp"
#include "internal/observability/logging.hpp"
#include "memory/memory_outbox_store.hpp"
#if OUTBOX_STORE_SQLITE
#include "sqlite/sqlite_db.hpp"
#include "sqlite/sqlite_outbox_store.hpp"
#endif

namespace outbox::store {

OutboxStorePtr StoreFactory::Build(const outbox::runtime::config::StoreConfig& cfg) {
  using outbox::runtime::config::StoreConfig;

  switch (cfg.backend_case()) {
    case StoreConfig::kSqlite: {
#if OUTBOX_STORE_SQLITE
      const auto& path = cfg.sqlite().path();
      if (path.empty()) {
        throw std::runtime_error("store.sqlite.path must be set");
      }
      std::filesystem::path parent = std::filesystem::path(path).parent_path();
      if (!parent.empty()) std::filesystem::create_directories(parent);
      OUTBOX_LOG_INFO("Using sqlite outbox", {observability::StringField("path", path)});
      return std::make_shared<sqlite::SqliteOutboxStore>(std::make_shared<sqlite::SqliteDB>(path));
#else
      throw std::runtime_error("sqlite store requested but not enabled at build time");
#endif
    }

    case StoreConfig::kMemory:
      OUTBOX_LOG_WARN("Using in-memory outbox; events do not survive a restart");
      return std::make_shared<memory::MemoryOutboxStore>();

    case StoreConfig::kFile:
    case StoreConfig::BACKEND_NOT_SET:
      break;
  }

  std::filesystem::path path = cfg.file().path().empty() ? std::filesystem::path{"outbox.log"} : std::filesystem::path{cfg.file().path()};

  file::FileOutboxStore::Options options;
  options.fsync = !cfg.file().has_fsync() || cfg.file().fsync();

  return std::make_shared<file::FileOutboxStore>(std::move(path), options);
}

} // namespace outbox::store
