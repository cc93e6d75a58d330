#pragma once

#include <memory>
#include "config/store_config.hpp"
#include "store/store.hpp"

namespace guidstore {
namespace store {

// Opens the store described by config, throws ConfigurationError for an invalid combination
std::unique_ptr<Store> open_store(const config::StoreConfig& config);

} // namespace store
} // namespace guidstore
