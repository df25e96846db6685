#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <headway/common_types.hpp>
#include <headway/hdwexcept.hpp>
#include <headway/wait_times.hpp>
#include <tinyopt/tinyopt.h>

// Compute wait-time statistics for a series of arrival times read from
// FILE, either a JSON array of timestamps or whitespace-separated
// timestamps [s].

const char* help_msg =
    "[OPTION]... FILE\n"
    "\n"
    " -s, --start=TIME       start of interval [s]\n"
    " -e, --end=TIME         end of interval [s]\n"
    " -p, --percentiles=P,.. report wait at each percentile P (default 10,50,90)\n"
    " -b, --bin-width=W      histogram bin width [min] (default 5)\n"
    " -t, --sample=STEP      also report waits sampled every STEP [s]\n"
    " -c, --cdf              print the cumulative distribution of wait time\n"
    " -j, --json             print results as a JSON object\n"
    " -h, --help             print extended usage information and exit\n"
    "\n"
    "The interval defaults to the range of the arrival times, and is cut back\n"
    "to the last arrival if no arrival follows it. Waits are reported in\n"
    "minutes.\n";

struct options {
    std::string file;
    std::optional<hdw::time_type> start;
    std::optional<hdw::time_type> end;
    std::vector<double> percentiles = {10, 50, 90};
    double bin_width = 5;
    std::optional<hdw::time_type> sample_step;
    bool cdf = false;
    bool json = false;
};

bool parse_options(options& opt, int& argc, char** argv);
std::vector<hdw::time_type> read_arrivals(const std::string& path);
void print_text(const options& opt, const hdw::wait_time_stats& stats);
void print_json(const options& opt, const hdw::wait_time_stats& stats);

int main(int argc, char** argv) {
    try {
        options opt;
        if (!parse_options(opt, argc, argv)) return 0;

        auto stats = hdw::build_stats(read_arrivals(opt.file), opt.start, opt.end);

        if (opt.json) print_json(opt, stats);
        else print_text(opt, stats);
    }
    catch (to::option_error& e) {
        to::usage_error(argv[0], "[OPTIONS]... FILE\nTry '--help' for more information.", e.what());
        return 1;
    }
    catch (hdw::headway_exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
    catch (std::exception& e) {
        std::cerr << "caught exception: " << e.what() << "\n";
        return -2;
    }
}

bool parse_options(options& opt, int& argc, char** argv) {
    auto do_help = [&]() { to::usage(argv[0], help_msg); };

    to::option cli_opts[] = {
        { to::action(do_help), to::flag, to::exit, "-h", "--help" },
        { to::sink(opt.start, to::default_parser<hdw::time_type>{}),       "-s", "--start" },
        { to::sink(opt.end, to::default_parser<hdw::time_type>{}),         "-e", "--end" },
        { {opt.percentiles, to::delimited<double>()},                      "-p", "--percentiles" },
        { opt.bin_width,                                                   "-b", "--bin-width" },
        { to::sink(opt.sample_step, to::default_parser<hdw::time_type>{}), "-t", "--sample" },
        { to::set(opt.cdf),  to::flag, "-c", "--cdf" },
        { to::set(opt.json), to::flag, "-j", "--json" },
        { opt.file, to::single },
    };

    if (!to::run(cli_opts, argc, argv+1)) return false;
    if (argv[1]) throw to::option_error("unrecognized argument", argv[1]);
    if (opt.file.empty()) throw to::user_option_error("missing FILE");
    if (!(opt.bin_width>0)) throw to::user_option_error("bin width must be positive");
    return true;
}

std::vector<hdw::time_type> read_arrivals(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error(fmt::format("unable to open {}", path));

    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    auto first = text.find_first_not_of(" \t\r\n");
    if (first!=std::string::npos && text[first]=='[') {
        return nlohmann::json::parse(text).get<std::vector<hdw::time_type>>();
    }

    std::vector<hdw::time_type> times;
    std::istringstream is(text);
    hdw::time_type t;
    while (is >> t) times.push_back(t);
    if (!is.eof()) {
        throw std::runtime_error(fmt::format("{}: expected an arrival time after {} values", path, times.size()));
    }
    return times;
}

// Bin edges 0, w, 2w, ... covering the largest wait in the distribution.
static std::vector<hdw::minutes_type> bin_edges(const std::vector<hdw::cdf_point>& cdf, double width) {
    std::vector<hdw::minutes_type> edges;
    double top = std::ceil(cdf.back().wait/width);
    for (int i = 0; i<=int(top); ++i) {
        edges.push_back(i*width);
    }
    if (edges.size()<2) edges.push_back(width);
    return edges;
}

void print_text(const options& opt, const hdw::wait_time_stats& stats) {
    fmt::print("interval        [{}, {}) s\n", stats.interval_start(), stats.interval_end());
    fmt::print("arrivals        {}\n", stats.arrivals().size());

    if (stats.empty()) {
        fmt::print("no wait times: interval is empty\n");
        return;
    }

    if (auto w = stats.end_wait_time()) {
        fmt::print("tail            {} s, next arrival after {} s\n", stats.end_elapsed_time(), *w);
    }
    if (auto avg = stats.average()) {
        fmt::print("average wait    {:.3f} min\n", *avg);
    }

    auto cdf = stats.cumulative_distribution();
    if (!cdf) {
        fmt::print("no wait time distribution\n");
        return;
    }

    auto values = *stats.percentiles(opt.percentiles);
    for (std::size_t i = 0; i<values.size(); ++i) {
        fmt::print("p{:<14g} {:.3f} min\n", opt.percentiles[i], values[i]);
    }

    fmt::print("\nhistogram\n");
    auto edges = bin_edges(*cdf, opt.bin_width);
    auto bins = *stats.histogram(edges);
    for (std::size_t i = 0; i<bins.size(); ++i) {
        fmt::print("  [{:6.2f}, {:6.2f})  {:.4f}\n", edges[i], edges[i+1], bins[i]);
    }

    if (opt.cdf) {
        fmt::print("\ncumulative distribution\n");
        for (const auto& p: *cdf) {
            fmt::print("  {:10.4f} min  {:.6f}\n", p.wait, p.probability);
        }
    }

    if (opt.sample_step) {
        auto waits = *stats.sampled_waits(*opt.sample_step);
        fmt::print("\nsampled waits every {} s ({} samples)\n", *opt.sample_step, waits.size());
        for (auto w: waits) {
            fmt::print("  {:.3f}\n", w);
        }
    }
}

void print_json(const options& opt, const hdw::wait_time_stats& stats) {
    nlohmann::json out;
    out["interval"] = {stats.interval_start(), stats.interval_end()};
    out["arrivals"] = stats.arrivals().size();

    if (auto avg = stats.average()) out["average"] = *avg;
    else out["average"] = nullptr;

    if (auto cdf = stats.cumulative_distribution()) {
        nlohmann::json pct = nlohmann::json::object();
        auto values = *stats.percentiles(opt.percentiles);
        for (std::size_t i = 0; i<values.size(); ++i) {
            pct[fmt::format("{:g}", opt.percentiles[i])] = values[i];
        }
        out["percentiles"] = pct;

        auto edges = bin_edges(*cdf, opt.bin_width);
        out["histogram"] = {{"edges", edges}, {"probabilities", *stats.histogram(edges)}};

        if (opt.cdf) {
            nlohmann::json points = nlohmann::json::array();
            for (const auto& p: *cdf) {
                points.push_back({p.wait, p.probability});
            }
            out["cdf"] = points;
        }
    }

    if (opt.sample_step) {
        if (auto waits = stats.sampled_waits(*opt.sample_step)) out["sampled_waits"] = *waits;
    }

    std::cout << out.dump(2) << "\n";
}
