#pragma once

#include "analytics_cache/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace analytics_cache {

// Stable text form of params: object keys sorted at every depth, array order
// kept, time points rendered through format_timestamp.
std::string canonical_params(const Json &params);

std::uint64_t fnv1a64(std::string_view data);

// 16 lowercase hex characters.
std::string params_digest(const Json &params);

// "{name_space}:{digest}"
std::string generate_key(const std::string &name_space, const Json &params);

} // namespace analytics_cache
