/// @file src/core/config.cpp
/// @brief PipelineConfig parsing, validation and rendering.

#include "ridership/config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace ridership::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

std::optional<std::uint64_t> parse_unsigned(std::string_view s) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(std::string_view s) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        const std::string token(s);
        std::size_t pos = 0;
        const double value = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_duration(std::int64_t seconds) {
    if (seconds > 0 && seconds % constants::SECONDS_PER_DAY == 0) {
        return fmt::format("{}d", seconds / constants::SECONDS_PER_DAY);
    }
    if (seconds > 0 && seconds % 3600 == 0) {
        return fmt::format("{}h", seconds / 3600);
    }
    if (seconds > 0 && seconds % constants::SECONDS_PER_MINUTE == 0) {
        return fmt::format("{}m", seconds / constants::SECONDS_PER_MINUTE);
    }
    return fmt::format("{}s", seconds);
}

}  // namespace

// ─── parse_duration / parse_bool ─────────────────────────────────────────────

std::optional<std::int64_t> parse_duration(std::string_view text) noexcept {
    const std::string_view s = trim(text);
    if (s.empty()) {
        return std::nullopt;
    }

    std::int64_t unit = 1;
    std::string_view digits = s;
    switch (std::tolower(static_cast<unsigned char>(s.back()))) {
        case 's': unit = 1;                              break;
        case 'm': unit = constants::SECONDS_PER_MINUTE;  break;
        case 'h': unit = 3600;                           break;
        case 'd': unit = constants::SECONDS_PER_DAY;     break;
        default:  unit = 0;                              break;
    }
    if (unit != 0) {
        digits = trim(s.substr(0, s.size() - 1));
    } else {
        unit = 1;
    }

    const auto count = parse_unsigned(digits);
    if (!count) {
        return std::nullopt;
    }
    if (*count > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max() / unit)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*count) * unit;
}

std::optional<bool> parse_bool(std::string_view text) noexcept {
    const std::string s = lowercase(trim(text));
    if (s == "true" || s == "yes" || s == "on" || s == "1")  return true;
    if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    return std::nullopt;
}

// ─── apply_option ────────────────────────────────────────────────────────────

std::string apply_option(PipelineConfig& config, std::string_view key, std::string_view value) {
    const std::string k = lowercase(trim(key));
    const std::string_view v = trim(value);

    if (k == "bucket_resolution") {
        const auto d = parse_duration(v);
        if (!d) return fmt::format("bad duration '{}'", v);
        config.bucket_resolution = *d;
        return {};
    }
    if (k == "min_coverage") {
        const auto n = parse_unsigned(v);
        if (!n) return fmt::format("bad integer '{}'", v);
        config.min_coverage = static_cast<std::size_t>(*n);
        return {};
    }
    if (k == "traffic_weight" || k == "density_weight") {
        const auto w = parse_double(v);
        if (!w) return fmt::format("bad number '{}'", v);
        (k == "traffic_weight" ? config.traffic_weight : config.density_weight) = *w;
        return {};
    }
    if (k == "grouping_key") {
        const auto g = parse_grouping_key(v);
        if (!g) return fmt::format("grouping_key must be station or complex, got '{}'", v);
        config.grouping_key = *g;
        return {};
    }
    if (k == "device_count_source") {
        const std::string s = lowercase(v);
        if (s == "observed") {
            config.device_count_source = aggregate::DeviceCountSource::Observed;
        } else if (s == "topology") {
            config.device_count_source = aggregate::DeviceCountSource::Topology;
        } else {
            return fmt::format("device_count_source must be observed or topology, got '{}'", v);
        }
        return {};
    }
    if (k == "top_n") {
        const auto n = parse_unsigned(v);
        if (!n) return fmt::format("bad integer '{}'", v);
        config.top_n = static_cast<std::size_t>(*n);
        return {};
    }

    bool* flag = nullptr;
    if (k == "drop_zero_rates")      flag = &config.drop_zero_rates;
    if (k == "exclude_low_coverage") flag = &config.exclude_low_coverage;
    if (k == "summary_mode")         flag = &config.summary_mode;
    if (k == "verbose")              flag = &config.verbose;
    if (flag != nullptr) {
        const auto b = parse_bool(v);
        if (!b) return fmt::format("bad boolean '{}'", v);
        *flag = *b;
        return {};
    }

    return fmt::format("unknown option '{}'", k);
}

// ─── parse_config_string / load_config_file ──────────────────────────────────

ConfigLoadResult parse_config_string(std::string_view content, PipelineConfig base) {
    ConfigLoadResult result{.config = base, .errors = {}};

    std::istringstream stream{std::string(content)};
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        const auto hash = line.find('#');
        const std::string_view body = trim(std::string_view(line).substr(0, hash));
        if (body.empty()) {
            continue;
        }

        const auto eq = body.find('=');
        if (eq == std::string_view::npos) {
            result.errors.push_back(fmt::format("line {}: expected key = value", line_no));
            continue;
        }

        auto err = apply_option(result.config, body.substr(0, eq), body.substr(eq + 1));
        if (!err.empty()) {
            result.errors.push_back(fmt::format("line {}: {}", line_no, err));
        }
    }

    return result;
}

std::optional<ConfigLoadResult> load_config_file(const std::string& path, PipelineConfig base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_config_string(contents.str(), base);
}

// ─── validate ────────────────────────────────────────────────────────────────

std::vector<std::string> validate(const PipelineConfig& config) {
    std::vector<std::string> problems;

    if (config.bucket_resolution <= 0) {
        problems.push_back(fmt::format("bucket_resolution must be positive, got {}",
                                       config.bucket_resolution));
    }
    if (!std::isfinite(config.traffic_weight) || config.traffic_weight < 0.0) {
        problems.push_back(fmt::format("traffic_weight must be finite and >= 0, got {}",
                                       config.traffic_weight));
    }
    if (!std::isfinite(config.density_weight) || config.density_weight < 0.0) {
        problems.push_back(fmt::format("density_weight must be finite and >= 0, got {}",
                                       config.density_weight));
    }

    return problems;
}

// ─── to_string ───────────────────────────────────────────────────────────────

std::string to_string(const PipelineConfig& config) {
    return fmt::format(
        "bucket_resolution    = {}\n"
        "grouping_key         = {}\n"
        "min_coverage         = {}\n"
        "traffic_weight       = {}\n"
        "density_weight       = {}\n"
        "drop_zero_rates      = {}\n"
        "exclude_low_coverage = {}\n"
        "device_count_source  = {}\n"
        "summary_mode         = {}\n"
        "top_n                = {}\n"
        "verbose              = {}\n",
        format_duration(config.bucket_resolution),
        ridership::to_string(config.grouping_key),
        config.min_coverage,
        config.traffic_weight,
        config.density_weight,
        config.drop_zero_rates,
        config.exclude_low_coverage,
        aggregate::to_string(config.device_count_source),
        config.summary_mode,
        config.top_n,
        config.verbose);
}

}  // namespace ridership::core
