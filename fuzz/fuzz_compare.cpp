// fuzz_compare.cpp - libFuzzer target for nbtcmp::compare().
//
// The input is split in two at its first byte's position modulo the size,
// and both halves are compared. Besides memory safety, the target checks the
// comparator's algebra on every input that decodes:
//   - reflexivity: compare(x, x) is true
//   - symmetry:    compare(a, b) == compare(b, a), with and without exclusion
// A violation traps so libFuzzer records the input.
//
// Build / run: see fuzz_load.cpp header comment; swap target name to
// fuzz_compare.

#include <nbtcmp/nbtcmp.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace nbtcmp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size == 0)
        return 0;
    const std::string_view input(reinterpret_cast<const char *>(data), size);
    const size_t split = data[0] % size;
    const std::string_view left = input.substr(1, split);
    const std::string_view right = input.substr(1 + split);

    CompareOptions excluding;
    excluding.exclude_field = kLastUpdateField;

    const auto ab = try_compare(left, right);
    const auto ba = try_compare(right, left);
    if (ab.has_value() != ba.has_value() || (ab && *ab != *ba))
        __builtin_trap();

    const auto ab_ex = try_compare(left, right, excluding);
    const auto ba_ex = try_compare(right, left, excluding);
    if (ab_ex.has_value() != ba_ex.has_value() || (ab_ex && *ab_ex != *ba_ex))
        __builtin_trap();

    if (ab) {
        // Both halves decoded, so each must equal itself.
        if (!compare(left, left) || !compare(right, right))
            __builtin_trap();
    }

    return 0;
}
