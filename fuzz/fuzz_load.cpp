// fuzz_load.cpp - libFuzzer target for nbtcmp::load_reuse().
//
// A single static DocumentView is reused across invocations so that both the
// hot path (tape.reset()) and the growth path (tape.reserve()/ensure()) are
// hit.
//
// Two passes per input:
//   1. load_reuse()   - decode with the default depth limit
//   2. dump()/size()  - walk the tape (covers skip-links and member lookup)
//
// Build:
//   cmake -B build-fuzz \
//         -DNBTCMP_BUILD_FUZZ=ON \
//         -DNBTCMP_BUILD_TESTS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_load
//
// Run:
//   ./build-fuzz/fuzz_load corpus/ -max_len=65536

#include <nbtcmp/nbtcmp.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace nbtcmp;

// libFuzzer is single-threaded by default, so static storage is safe.
static DocumentView g_doc;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    try {
        Value root = load_reuse(g_doc, input);
        (void)root.dump();
        (void)root.size();
        (void)root.find(kLastUpdateField);
    } catch (const ParseError &) {
        // Malformed input - expected.
    }

    return 0;
}
