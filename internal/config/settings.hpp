#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/core/transfer_settings.hpp"

namespace fetchgate::config {

inline constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";

// Applies defaults for unset fields and rejects values the server cannot run
// with. Throws std::runtime_error.
core::TransferSettings ResolveTransferSettings(const fetchgate::runtime::config::RuntimeConfig& config);

std::string ResolveBindAddress(const fetchgate::runtime::config::RuntimeConfig& config);

} // namespace fetchgate::config
