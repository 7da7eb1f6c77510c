/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for readings, complex memberships and device counts.

#include "ridership/data_loader.hpp"
#include "ridership/calendar.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace ridership::core {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

template <typename T>
std::optional<T> parse_integer(const std::string& s) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }
    T value{};
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// ─── DataLoader::split_row ───────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (ch == '"') {
                quoted = false;
            } else {
                field += ch;
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += ch;
        }
    }
    fields.push_back(std::move(field));

    for (auto& f : fields) {
        const auto first = f.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            f.clear();
            continue;
        }
        const auto last = f.find_last_not_of(" \t\r\n");
        f = f.substr(first, last - first + 1);
    }
    return fields;
}

// ─── DataLoader::find_column ─────────────────────────────────────────────────

std::optional<std::size_t>
DataLoader::find_column(const std::vector<std::string>& header, const std::string& name) {
    const std::string wanted = lowercase(name);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (lowercase(header[i]) == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

// ─── DataLoader::read_file ───────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

// ─── DataLoader::parse_table ─────────────────────────────────────────────────

LoadStats DataLoader::parse_table(const std::string& csv_content,
                                  const std::vector<std::string>& required,
                                  const RowHandler& handle) {
    LoadStats stats;
    std::istringstream stream(csv_content);
    std::string line;

    std::optional<std::vector<std::size_t>> columns;
    bool header_seen = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (!header_seen) {
            // First non-empty, non-comment line is the header.
            header_seen = true;
            const auto header = split_row(line);
            std::vector<std::size_t> idx;
            idx.reserve(required.size());
            for (const auto& name : required) {
                const auto col = find_column(header, name);
                if (!col) {
                    idx.clear();
                    break;
                }
                idx.push_back(*col);
            }
            if (idx.size() == required.size()) {
                columns = std::move(idx);
            }
            continue;
        }

        ++stats.rows_read;
        if (!columns) {
            ++stats.rows_skipped;
            continue;
        }

        const auto fields = split_row(line);
        const std::size_t needed = *std::max_element(columns->begin(), columns->end()) + 1;
        if (fields.size() < needed || !handle(fields, *columns)) {
            ++stats.rows_skipped;
        }
    }

    return stats;
}

// ─── Readings ────────────────────────────────────────────────────────────────

ReadingsLoad DataLoader::parse_readings_string(const std::string& csv_content,
                                               NetworkTopology& topology) noexcept {
    ReadingsLoad load;

    static const std::vector<std::string> REQUIRED = {
        "control_area", "unit", "subunit", "station",
        "line_names", "timestamp", "net_increment",
    };

    load.stats = parse_table(csv_content, REQUIRED,
        [&](const std::vector<std::string>& f, const std::vector<std::size_t>& c) {
            const auto& control_area = f[c[0]];
            const auto& unit         = f[c[1]];
            const auto& subunit      = f[c[2]];
            const auto& station      = f[c[3]];
            const auto& lines        = f[c[4]];

            if (control_area.empty() || unit.empty() || subunit.empty() || station.empty()) {
                return false;
            }
            const auto ts = calendar::parse_timestamp(f[c[5]]);
            const auto increment = parse_integer<std::uint64_t>(f[c[6]]);
            if (!ts || !increment) {
                return false;
            }

            const StationId sid = topology.register_station(StationKey{station, lines});
            const DeviceId did = topology.register_device(
                DeviceKey{control_area, unit, subunit, station}, sid);
            const StationId owner = topology.station_of(did).value_or(sid);

            load.readings.push_back(Reading{
                .device        = did,
                .station       = owner,
                .timestamp     = *ts,
                .net_increment = *increment,
            });
            return true;
        });

    return load;
}

std::optional<ReadingsLoad> DataLoader::load_readings_csv(const std::string& filepath,
                                                          NetworkTopology& topology) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_readings_string(*contents, topology);
}

// ─── Complexes ───────────────────────────────────────────────────────────────

LoadStats DataLoader::parse_complexes_string(const std::string& csv_content,
                                             NetworkTopology& topology) noexcept {
    static const std::vector<std::string> REQUIRED = {"station", "line_names", "complex_id"};

    return parse_table(csv_content, REQUIRED,
        [&](const std::vector<std::string>& f, const std::vector<std::size_t>& c) {
            const auto complex = parse_integer<std::uint32_t>(f[c[2]]);
            if (f[c[0]].empty() || !complex) {
                return false;
            }
            const StationId sid = topology.register_station(StationKey{f[c[0]], f[c[1]]});
            return topology.assign_complex(sid, ComplexId{*complex});
        });
}

std::optional<LoadStats> DataLoader::load_complexes_csv(const std::string& filepath,
                                                        NetworkTopology& topology) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_complexes_string(*contents, topology);
}

// ─── Device counts ───────────────────────────────────────────────────────────

LoadStats DataLoader::parse_device_counts_string(const std::string& csv_content,
                                                 NetworkTopology& topology) noexcept {
    static const std::vector<std::string> REQUIRED = {"station", "line_names", "device_count"};

    return parse_table(csv_content, REQUIRED,
        [&](const std::vector<std::string>& f, const std::vector<std::size_t>& c) {
            const auto count = parse_integer<std::uint64_t>(f[c[2]]);
            if (f[c[0]].empty() || !count) {
                return false;
            }
            const StationId sid = topology.register_station(StationKey{f[c[0]], f[c[1]]});
            return topology.set_declared_device_count(sid, static_cast<std::size_t>(*count));
        });
}

std::optional<LoadStats> DataLoader::load_device_counts_csv(const std::string& filepath,
                                                            NetworkTopology& topology) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_device_counts_string(*contents, topology);
}

}  // namespace ridership::core
