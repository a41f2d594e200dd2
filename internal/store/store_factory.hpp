#pragma once

#include "config/config.pb.h"
#include "outbox_store.hpp"

namespace outbox::store {

/*
  Builds the configured outbox store backend.

      auto store = StoreFactory::Build(config.store());
      store->Append(event);

  Defaults to the file backend at ./outbox.log when no backend is set.
  Throws std::runtime_error when the backend cannot be opened; at startup
  that is fatal.
*/
class StoreFactory {
public:
  static OutboxStorePtr Build(const outbox::runtime::config::StoreConfig& cfg);
};

} // namespace outbox::store
