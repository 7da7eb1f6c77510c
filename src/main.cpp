/// @file src/main.cpp
/// @brief ridership CLI entry point.
///
/// Usage:
///   ridership --readings <csv> [options]   Score stations or complexes
///   ridership --help                       Print usage

#include "ridership/calendar.hpp"
#include "ridership/config.hpp"
#include "ridership/data_loader.hpp"
#include "ridership/pipeline.hpp"
#include "ridership/scorer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using ridership::core::PipelineConfig;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  ridership --readings <csv> [options]\n"
        "\n"
        "Inputs:\n"
        "  --readings <csv>          Cleaned readings (required)\n"
        "  --complexes <csv>         station,line_names,complex_id\n"
        "  --device-counts <csv>     station,line_names,device_count\n"
        "  --config <file>           key = value configuration file\n"
        "\n"
        "Options (override the config file):\n"
        "  --group station|complex   Grouping key (default station)\n"
        "  --resolution <duration>   Bucket width, e.g. 3600, 15m, 4h, 1d (default 1h)\n"
        "  --min-coverage <n>        Flag buckets with fewer entities\n"
        "  --exclude-low-coverage    Drop flagged buckets before scoring\n"
        "  --drop-zero-rates         Drop zero-rate intervals\n"
        "  --topology-counts         Density divisor from declared device counts\n"
        "  --traffic-weight <w>      Offset added to the traffic score (default 0)\n"
        "  --density-weight <w>      Offset added to the density score (default 0)\n"
        "  --summary                 Rank whole-period summaries\n"
        "  --top <n>                 Rows to print (0 = all)\n"
        "  --verbose                 Per-stage progress on stderr\n"
        "\n"
        "Outputs:\n"
        "  --series-out <csv>        Per-bucket table\n"
        "  --summary-out <csv>       Summary table\n"
        "  --share-out <csv>         Mean daily share per entity\n"
        "\n"
        "Exit codes: 0 ok (an empty batch only warns), 1 usage or I/O error,\n"
        "            2 degenerate scoring batch\n"
    );
}

struct CliArgs {
    std::string readings_path;
    std::optional<std::string> complexes_path;
    std::optional<std::string> device_counts_path;
    std::optional<std::string> series_out;
    std::optional<std::string> summary_out;
    std::optional<std::string> share_out;
    PipelineConfig config;
};

/// Value following the flag at `i`; advances `i`.
std::string take_value(int argc, char* argv[], int& i) {
    const std::string flag(argv[i]);
    if (i + 1 >= argc) {
        throw std::runtime_error(fmt::format("{} requires a value", flag));
    }
    return std::string(argv[++i]);
}

void apply_or_throw(PipelineConfig& config, const char* key, const std::string& value) {
    const auto err = ridership::core::apply_option(config, key, value);
    if (!err.empty()) {
        throw std::runtime_error(fmt::format("{}: {}", key, err));
    }
}

/// Parse argv. The config file is loaded first so that flags override it.
/// Throws std::runtime_error on any usage problem.
CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            const std::string path = take_value(argc, argv, i);
            auto loaded = ridership::core::load_config_file(path, args.config);
            if (!loaded) {
                throw std::runtime_error(fmt::format("cannot open config file '{}'", path));
            }
            if (!loaded->ok()) {
                throw std::runtime_error(
                    fmt::format("config file '{}': {}", path, loaded->errors.front()));
            }
            args.config = loaded->config;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string flag(argv[i]);
        if      (flag == "--config")               { (void)take_value(argc, argv, i); }
        else if (flag == "--readings")             { args.readings_path = take_value(argc, argv, i); }
        else if (flag == "--complexes")            { args.complexes_path = take_value(argc, argv, i); }
        else if (flag == "--device-counts")        { args.device_counts_path = take_value(argc, argv, i); }
        else if (flag == "--series-out")           { args.series_out = take_value(argc, argv, i); }
        else if (flag == "--summary-out")          { args.summary_out = take_value(argc, argv, i); }
        else if (flag == "--share-out")            { args.share_out = take_value(argc, argv, i); }
        else if (flag == "--group")                { apply_or_throw(args.config, "grouping_key", take_value(argc, argv, i)); }
        else if (flag == "--resolution")           { apply_or_throw(args.config, "bucket_resolution", take_value(argc, argv, i)); }
        else if (flag == "--min-coverage")         { apply_or_throw(args.config, "min_coverage", take_value(argc, argv, i)); }
        else if (flag == "--traffic-weight")       { apply_or_throw(args.config, "traffic_weight", take_value(argc, argv, i)); }
        else if (flag == "--density-weight")       { apply_or_throw(args.config, "density_weight", take_value(argc, argv, i)); }
        else if (flag == "--top")                  { apply_or_throw(args.config, "top_n", take_value(argc, argv, i)); }
        else if (flag == "--summary")              { args.config.summary_mode = true; }
        else if (flag == "--exclude-low-coverage") { args.config.exclude_low_coverage = true; }
        else if (flag == "--drop-zero-rates")      { args.config.drop_zero_rates = true; }
        else if (flag == "--topology-counts")      {
            args.config.device_count_source = ridership::aggregate::DeviceCountSource::Topology;
        }
        else if (flag == "--verbose")              { args.config.verbose = true; }
        else {
            throw std::runtime_error(fmt::format("unknown option '{}'", flag));
        }
    }

    if (args.readings_path.empty()) {
        throw std::runtime_error("--readings is required");
    }
    return args;
}

std::ofstream open_output(const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error(fmt::format("cannot write '{}'", path));
    }
    return out;
}

void write_share_csv(std::ostream& out,
                     const ridership::core::PipelineResult& result,
                     const ridership::NetworkTopology& topology) {
    fmt::print(out, "rank,entity,mean_share,days,cumulative_share\n");
    for (std::size_t i = 0; i < result.shares.size(); ++i) {
        const auto& s = result.shares[i];
        fmt::print(out, "{},{},{:.6f},{},{:.6f}\n",
                   i + 1,
                   ridership::projection::ResultProjector::csv_escape(
                       topology.entity_label(s.entity)),
                   s.mean_share,
                   s.days,
                   result.share_curve[i].cumulative_share);
    }
}

void print_ranking(const std::vector<ridership::scoring::ScoredRecord>& scored,
                   const ridership::NetworkTopology& topology,
                   std::size_t top_n) {
    const auto ranked = ridership::scoring::PriorityScorer::rank(scored, top_n);
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        const auto& s = ranked[i];
        const std::string when = s.record.is_summary()
            ? fmt::format("{} buckets", s.record.bucket_count)
            : ridership::calendar::format_timestamp(*s.record.bucket);
        fmt::print("{:4d}  {:.4f}  {:<32}  {:<20}  traffic={:.2f}  density={:.2f}{}\n",
                   i + 1, s.priority, topology.entity_label(s.record.entity), when,
                   s.record.total_traffic, s.record.density,
                   s.record.low_confidence ? "  (low coverage)" : "");
    }
}

/// Returns the process exit code.
int run(const CliArgs& args) {
    const auto problems = ridership::core::validate(args.config);
    if (!problems.empty()) {
        for (const auto& p : problems) {
            fmt::print(stderr, "Error: {}\n", p);
        }
        return 1;
    }

    ridership::NetworkTopology topology;
    auto load = ridership::core::DataLoader::load_readings_csv(args.readings_path, topology);
    if (!load) {
        throw std::runtime_error(fmt::format("cannot open file '{}'", args.readings_path));
    }
    if (args.config.verbose) {
        fmt::print(stderr, "Loaded {} readings from '{}' ({} rows skipped)\n",
                   load->readings.size(), args.readings_path, load->stats.rows_skipped);
    }

    if (args.complexes_path) {
        const auto stats =
            ridership::core::DataLoader::load_complexes_csv(*args.complexes_path, topology);
        if (!stats) {
            throw std::runtime_error(fmt::format("cannot open file '{}'", *args.complexes_path));
        }
        if (args.config.verbose) {
            fmt::print(stderr, "Loaded {} complex memberships ({} rows skipped)\n",
                       stats->rows_read - stats->rows_skipped, stats->rows_skipped);
        }
    }
    if (args.device_counts_path) {
        const auto stats =
            ridership::core::DataLoader::load_device_counts_csv(*args.device_counts_path, topology);
        if (!stats) {
            throw std::runtime_error(fmt::format("cannot open file '{}'", *args.device_counts_path));
        }
    }

    const ridership::core::Pipeline pipeline{args.config};
    const auto result = pipeline.run(load->readings, topology);
    if (!result) {
        fmt::print(stderr, "Error: invalid configuration\n");
        return 1;
    }

    if (!result->diagnostics.empty()) {
        fmt::print(stderr, "{}", result->diagnostics.to_string());
    }

    if (args.series_out) {
        auto out = open_output(*args.series_out);
        ridership::projection::ResultProjector::write_time_series_csv(out, result->series_rows);
    }
    if (args.summary_out) {
        auto out = open_output(*args.summary_out);
        ridership::projection::ResultProjector::write_summary_csv(out, result->summary_rows);
    }
    if (args.share_out) {
        auto out = open_output(*args.share_out);
        write_share_csv(out, *result, topology);
    }

    const char* batch = args.config.summary_mode ? "summary" : "time-series";
    const auto status = args.config.summary_mode ? result->summary_status()
                                                 : result->series_status();
    if (status == ridership::core::BatchStatus::Empty) {
        fmt::print(stderr, "Warning: {} batch is empty, nothing to rank\n", batch);
        return 0;
    }
    if (status == ridership::core::BatchStatus::Degenerate) {
        fmt::print(stderr, "Error: {} batch is degenerate and could not be scored\n", batch);
        return 2;
    }

    const auto& reported = args.config.summary_mode ? result->summary_scored
                                                    : result->series_scored;
    print_ranking(*reported, topology, args.config.top_n);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    try {
        return run(parse_args(argc, argv));
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
