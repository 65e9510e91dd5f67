/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the OHLCV CSV parser.
 *
 * Build:
 *   cmake -DMKTPSYCH_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Every returned bar passes DataLoader::validate_bar.
 *   3. bars + skipped rows never exceed the number of input lines.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "mktpsych/data_loader.hpp"

using namespace mktpsych;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto out = DataLoader::parse_csv_string(input);

    for (const auto& bar : out.bars) {
        assert(DataLoader::validate_bar(bar));
        assert(bar.close > 0.0);
    }

    std::size_t lines = 1;
    for (char c : input) {
        if (c == '\n') ++lines;
    }
    assert(out.bars.size() + out.skipped_rows <= lines);

    return 0;
}
