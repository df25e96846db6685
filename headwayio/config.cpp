#include <cstdlib>
#include <optional>
#include <string>

#include <headwayio/config.hpp>

namespace hdwio {

std::optional<std::string> read_env_string(const char* env_var) {
    const char* str = std::getenv(env_var);
    if (!str || !*str) return std::nullopt;
    return std::string(str);
}

cache_config load_cache_config() {
    cache_config config;
    if (auto dir = read_env_string("HEADWAY_DATA_DIR")) {
        config.data_dir = *dir;
    }
    config.bucket = read_env_string("HEADWAY_S3_BUCKET");
    if (auto version = read_env_string("HEADWAY_WAIT_TIMES_VERSION")) {
        config.version = *version;
    }
    return config;
}

} // namespace hdwio
