/**
 * @file  fuzz_config_parser.cpp
 * @brief libFuzzer target for the `key = value` configuration parser
 *
 * Build:
 *   cmake -DRIDERSHIP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_config_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_config_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. parse_duration never returns a negative value.
 *   3. A config that parsed cleanly and validates survives a round trip
 *      through to_string() unchanged.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "ridership/config.hpp"

using namespace ridership;
using namespace ridership::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    // Invariant 2
    if (const auto d = parse_duration(input)) {
        assert(*d >= 0);
    }

    const auto parsed = parse_config_string(input);
    if (!parsed.ok() || !validate(parsed.config).empty()) {
        return 0;
    }

    // Invariant 3: rendering is loadable and lossless
    const auto again = parse_config_string(to_string(parsed.config));
    assert(again.ok());
    const auto& a = parsed.config;
    const auto& b = again.config;
    assert(a.bucket_resolution    == b.bucket_resolution);
    assert(a.min_coverage         == b.min_coverage);
    assert(a.grouping_key         == b.grouping_key);
    assert(a.drop_zero_rates      == b.drop_zero_rates);
    assert(a.exclude_low_coverage == b.exclude_low_coverage);
    assert(a.device_count_source  == b.device_count_source);
    assert(a.summary_mode         == b.summary_mode);
    assert(a.top_n                == b.top_n);
    assert(a.verbose              == b.verbose);

    return 0;
}
