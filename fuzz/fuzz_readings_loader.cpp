/**
 * @file  fuzz_readings_loader.cpp
 * @brief libFuzzer target for readings CSV parsing followed by the full Pipeline
 *
 * Build:
 *   cmake -DRIDERSHIP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_readings_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_readings_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. rows_read == |readings| + rows_skipped.
 *   3. Every reading refers to a device and station registered in the topology.
 *   4. If the pipeline runs:
 *      a. rate_count ≤ reading_count
 *      b. every priority ∈ [0, 1] and finite
 *      c. density == total_traffic / device_count for every series row
 *      d. an empty or degenerate batch has no projected rows
 *
 * Fuzzer strategy:
 *   The input is prefixed with a valid header so most mutations reach the
 *   row parser. Interesting shapes include quoted fields with embedded
 *   commas, CRLF endings, huge or negative counts, and repeated timestamps.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "ridership/data_loader.hpp"
#include "ridership/pipeline.hpp"

using namespace ridership;
using namespace ridership::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string csv = "control_area,unit,subunit,station,line_names,timestamp,net_increment\n";
    csv.append(reinterpret_cast<const char*>(data), size);

    NetworkTopology topology;
    const auto loaded = DataLoader::parse_readings_string(csv, topology);

    // Invariant 2: row accounting
    assert(loaded.stats.rows_read == loaded.readings.size() + loaded.stats.rows_skipped);

    // Invariant 3: registered keys
    for (const auto& r : loaded.readings) {
        assert(r.device.value < topology.device_count());
        assert(r.station.value < topology.station_count());
    }

    const auto result = Pipeline{}.run(loaded.readings, topology);
    if (!result) {
        return 0;
    }

    // Invariant 4a
    assert(result->rate_count <= result->reading_count);

    // Invariant 4b / 4c
    for (const auto& row : result->series_rows) {
        assert(std::isfinite(row.priority));
        assert(row.priority >= 0.0 && row.priority <= 1.0);
        assert(row.device_count > 0);
        assert(row.density == row.total_traffic / static_cast<double>(row.device_count));
    }
    for (const auto& row : result->summary_rows) {
        assert(row.priority >= 0.0 && row.priority <= 1.0);
    }

    // Invariant 4d
    if (result->series_status() != BatchStatus::Scored) {
        assert(result->series_rows.empty());
    }
    if (result->summary_status() != BatchStatus::Scored) {
        assert(result->summary_rows.empty());
    }

    return 0;
}
