#pragma once

#include <optional>
#include <string>

namespace hdwio {

// Version of the precomputed wait-time statistics layout.
constexpr const char* default_wait_times_version = "v1b";

// Where precomputed statistics are cached locally and fetched from.
struct cache_config {
    // Root of the local cache.
    std::string data_dir = "data";

    // Remote object store bucket; remote fetches fail without one.
    std::optional<std::string> bucket;

    std::string version = default_wait_times_version;
};

// Return value of environment variable, or std::nullopt if unset or empty.
std::optional<std::string> read_env_string(const char* env_var);

// Defaults overridden by HEADWAY_DATA_DIR, HEADWAY_S3_BUCKET and
// HEADWAY_WAIT_TIMES_VERSION.
cache_config load_cache_config();

} // namespace hdwio
