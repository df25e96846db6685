#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <regex>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <headwayio/cached_wait_times.hpp>
#include <headwayio/config.hpp>

#include <nlohmann/json.hpp>

namespace hdwio {

namespace fs = std::filesystem;

headwayio_error::headwayio_error(const std::string& msg):
    hdw::headway_exception(msg) {}

invalid_identifier::invalid_identifier(const std::string& what, const std::string& value):
    headwayio_error(fmt::format("Invalid {}: \"{}\"", what, value)),
    what_id(what), value(value)
{}

stat_not_found::stat_not_found(const std::string& url, int status):
    headwayio_error(fmt::format("{} not found{}", url, status==403? " or access denied": "")),
    url(url), status(status)
{}

fetch_error::fetch_error(const std::string& url, int status, const std::string& body):
    headwayio_error(fmt::format("Error fetching {}: HTTP {}: {}", url, status, body)),
    url(url), status(status), body(body)
{}

cache_format_error::cache_format_error(const std::string& source, const std::string& err):
    headwayio_error(fmt::format("Invalid wait times document {}: {}", source, err)),
    source(source)
{}

missing_config::missing_config(const std::string& setting):
    headwayio_error(fmt::format("Missing configuration: {}", setting))
{}

namespace {

const std::regex identifier_re("^[A-Za-z0-9_-]+$");
const std::regex time_range_re("^[A-Za-z0-9_+-]*$");
const std::regex iso_date_re("^([0-9]{4})-([0-9]{2})-([0-9]{2})$");

void check_identifier(const char* what, const std::string& value) {
    if (!std::regex_match(value, identifier_re)) {
        throw invalid_identifier(what, value);
    }
}

std::string strip_colons(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), ':'), s.end());
    return s;
}

// Validates every component of the key; returns the time range suffix.
std::string checked_suffix(const cache_config& config, const wait_times_key& key) {
    check_identifier("agency", key.agency_id);
    check_identifier("date", key.date);
    check_identifier("version", config.version);
    check_identifier("stat id", key.stat_id);

    auto suffix = time_range_suffix(key);
    if (!std::regex_match(suffix, time_range_re)) {
        throw invalid_identifier("time range", suffix);
    }
    return suffix;
}

} // anonymous namespace

std::string time_range_suffix(const wait_times_key& key) {
    if (!key.start_time && !key.end_time) return "";
    if (!key.start_time || !key.end_time) {
        throw invalid_identifier("time range", key.start_time? *key.start_time+"_": "_"+key.end_time.value_or(""));
    }
    return "_"+strip_colons(*key.start_time)+"_"+strip_colons(*key.end_time);
}

std::string cache_path(const cache_config& config, const wait_times_key& key) {
    auto suffix = checked_suffix(config, key);
    const auto& v = config.version;
    const auto& a = key.agency_id;
    const auto& d = key.date;

    return fmt::format("{}/wait-times_{}_{}/{}/wait-times_{}_{}_{}_{}{}.json",
                       config.data_dir, v, a, d, v, a, d, key.stat_id, suffix);
}

std::string remote_path(const cache_config& config, const wait_times_key& key) {
    auto suffix = checked_suffix(config, key);

    std::smatch ymd;
    if (!std::regex_match(key.date, ymd, iso_date_re)) {
        throw invalid_identifier("date", key.date);
    }

    const auto& v = config.version;
    const auto& a = key.agency_id;
    const auto& d = key.date;

    return fmt::format("wait-times/{}/{}/{}/{}/{}/wait-times_{}_{}_{}_{}{}.json.gz",
                       v, a, ymd.str(1), ymd.str(2), ymd.str(3), v, a, d, key.stat_id, suffix);
}

std::string remote_url(const cache_config& config, const wait_times_key& key) {
    auto path = remote_path(config, key);
    if (!config.bucket) throw missing_config("remote bucket (HEADWAY_S3_BUCKET)");
    return fmt::format("http://{}.s3.amazonaws.com/{}", *config.bucket, path);
}

cached_wait_times::cached_wait_times():
    data_({{"routes", nlohmann::json::object()}})
{}

cached_wait_times::cached_wait_times(nlohmann::json data):
    data_(std::move(data))
{
    auto routes = data_.find("routes");
    if (routes==data_.end() || !routes->is_object()) {
        throw cache_format_error("<json>", "missing \"routes\" object");
    }
}

std::optional<nlohmann::json> cached_wait_times::get_value(const std::string& route_id,
                                                           const std::string& direction_id,
                                                           const std::string& stop_id) const
{
    const auto& routes = data_.at("routes");

    auto route = routes.find(route_id);
    if (route==routes.end() || !route->is_object()) return std::nullopt;

    auto direction = route->find(direction_id);
    if (direction==route->end() || !direction->is_object()) return std::nullopt;

    auto stop = direction->find(stop_id);
    if (stop==direction->end()) return std::nullopt;

    return *stop;
}

std::optional<double> cached_wait_times::get_number(const std::string& route_id,
                                                    const std::string& direction_id,
                                                    const std::string& stop_id) const
{
    auto value = get_value(route_id, direction_id, stop_id);
    if (!value || !value->is_number()) return std::nullopt;
    return value->get<double>();
}

void cached_wait_times::set_value(const std::string& route_id,
                                  const std::string& direction_id,
                                  const std::string& stop_id,
                                  nlohmann::json value)
{
    data_["routes"][route_id][direction_id][stop_id] = std::move(value);
}

cached_wait_times parse_cached_wait_times(const std::string& text, const std::string& source) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(text);
    }
    catch (nlohmann::json::parse_error& e) {
        throw cache_format_error(source, e.what());
    }

    if (!data.is_object() || !data.contains("routes") || !data.at("routes").is_object()) {
        throw cache_format_error(source, "missing \"routes\" object");
    }
    return cached_wait_times(std::move(data));
}

static void write_text(const std::string& path, const std::string& text) {
    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            throw headwayio_error(fmt::format("Unable to create cache directory {}: {}", p.parent_path().string(), ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary);
    out << text;
    if (!out) {
        throw headwayio_error(fmt::format("Unable to write cache file {}", path));
    }
}

cached_wait_times get_cached_wait_times(const remote_store& store,
                                        const cache_config& config,
                                        const wait_times_key& key)
{
    // Validates every identifier before anything is read or fetched.
    auto local = cache_path(config, key);

    if (fs::exists(local)) {
        std::ifstream in(local, std::ios::binary);
        if (!in) {
            throw headwayio_error(fmt::format("Unable to read cache file {}", local));
        }
        std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        return parse_cached_wait_times(text, local);
    }

    auto url = remote_url(config, key);
    auto response = store.get(url);
    if (response.status==404 || response.status==403) {
        throw stat_not_found(url, response.status);
    }
    if (response.status<200 || response.status>=300) {
        throw fetch_error(url, response.status, response.body);
    }

    auto result = parse_cached_wait_times(response.body, url);
    write_text(local, response.body);
    return result;
}

void write_cached_wait_times(const cache_config& config,
                             const wait_times_key& key,
                             const cached_wait_times& data)
{
    write_text(cache_path(config, key), data.json().dump());
}

} // namespace hdwio
