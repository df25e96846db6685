#pragma once

#include <optional>
#include <string>

#include <headway/hdwexcept.hpp>
#include <headwayio/config.hpp>

#include <nlohmann/json.hpp>

// Retrieval of precomputed wait-time statistics.
//
// A statistics document holds one value per (route, direction, stop):
//
//     {"routes": {"<route>": {"<direction>": {"<stop>": <value>}}}}
//
// Documents are looked up first in a local cache directory and otherwise
// fetched from a remote object store, then written to the cache.

namespace hdwio {

struct headwayio_error: public hdw::headway_exception {
    headwayio_error(const std::string& msg);
};

// An identifier used to build a cache path or remote object path contains
// characters other than letters, digits, '_' and '-'. Thrown before any
// file-system or network access.
struct invalid_identifier: headwayio_error {
    invalid_identifier(const std::string& what, const std::string& value);
    std::string what_id;
    std::string value;
};

// The remote store has no document for the request (HTTP 404 or 403).
struct stat_not_found: headwayio_error {
    stat_not_found(const std::string& url, int status);
    std::string url;
    int status;
};

// Any other unsuccessful response from the remote store.
struct fetch_error: headwayio_error {
    fetch_error(const std::string& url, int status, const std::string& body);
    std::string url;
    int status;
    std::string body;
};

// A document is not valid JSON or lacks the "routes" object.
struct cache_format_error: headwayio_error {
    cache_format_error(const std::string& source, const std::string& err);
    std::string source;
};

// A remote fetch was required but no bucket is configured.
struct missing_config: headwayio_error {
    explicit missing_config(const std::string& setting);
};

// Identifies one precomputed statistics document.
struct wait_times_key {
    std::string agency_id;
    std::string date;          // ISO date, YYYY-MM-DD
    std::string stat_id;       // e.g. "median-p90-plt20m"

    // Time of day range, e.g. "07:00" and "19:00"; both or neither.
    std::optional<std::string> start_time;
    std::optional<std::string> end_time;
};

// "" if no time range, else "_<start>_<end>" with ':' removed.
std::string time_range_suffix(const wait_times_key& key);

// Local cache file for key. Throws invalid_identifier.
std::string cache_path(const cache_config& config, const wait_times_key& key);

// Object path within the remote store. Throws invalid_identifier.
std::string remote_path(const cache_config& config, const wait_times_key& key);

// Object URL within the configured bucket. Throws invalid_identifier,
// missing_config.
std::string remote_url(const cache_config& config, const wait_times_key& key);

struct http_response {
    int status = 0;
    std::string body;
};

// Transport used for remote fetches. `get` returns the response body with
// any content encoding (gzip) already removed.
class remote_store {
public:
    virtual http_response get(const std::string& url) const = 0;
    virtual ~remote_store() {}
};

class cached_wait_times {
public:
    // Empty document.
    cached_wait_times();

    // Throws cache_format_error if `data` has no "routes" object.
    explicit cached_wait_times(nlohmann::json data);

    std::optional<nlohmann::json> get_value(const std::string& route_id,
                                            const std::string& direction_id,
                                            const std::string& stop_id) const;

    // As get_value, for statistics that are a single number.
    std::optional<double> get_number(const std::string& route_id,
                                     const std::string& direction_id,
                                     const std::string& stop_id) const;

    void set_value(const std::string& route_id,
                   const std::string& direction_id,
                   const std::string& stop_id,
                   nlohmann::json value);

    const nlohmann::json& json() const { return data_; }

private:
    nlohmann::json data_;
};

// Parse a document; `source` names it in error messages.
cached_wait_times parse_cached_wait_times(const std::string& text, const std::string& source);

// Local cache first, else remote fetch, persisting the fetched document to
// the local cache.
cached_wait_times get_cached_wait_times(const remote_store& store,
                                        const cache_config& config,
                                        const wait_times_key& key);

// Write document into the local cache, creating directories as required.
void write_cached_wait_times(const cache_config& config,
                             const wait_times_key& key,
                             const cached_wait_times& data);

} // namespace hdwio
