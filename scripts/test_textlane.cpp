/**
 *  @brief   Extensive @b unit-testing suite for TextLane, written in C++.
 *  @note    The same file is compiled several times: against the header-only library, picking the backend at compile
 *           time from the target flags (`-msse4.1`, `-march=haswell`, or none), and against the shared library with
 *           `TL_DYNAMIC_DISPATCH=1`, picking the backend at load time.
 *
 *  @see     Throughput measurements live in the @b `scripts/bench_textlane.cpp` benchmark.
 *
 *  @file    test_textlane.cpp
 */
#undef NDEBUG // ! Enable all assertions for testing

/**
 *  ! Overload the following with caution.
 *  ! Those parameters must never be explicitly set during releases,
 *  ! but they come handy during development, if you want to validate
 *  ! different ISA-specific implementations.

 #define TL_USE_WESTMERE 0
 #define TL_USE_HASWELL 0
 #define TL_USE_NEON 0
 */
#if defined(TL_DEBUG)
#undef TL_DEBUG
#endif
#define TL_DEBUG 1 // ! Enforce aggressive logging in this translation unit

/**
 *  Make sure to include the TextLane headers before anything else,
 *  to intercept missing `#include` directives and other issues.
 */
#include <textlane/textlane.h>   // Primary C API
#include <textlane/textlane.hpp> // C++ wrappers

#include <cassert>   // C-style assertions
#include <cctype>    // `std::toupper`, `std::tolower`
#include <cstdio>    // `std::printf`
#include <cstdlib>   // `std::getenv`
#include <cstring>   // `std::memcmp`
#include <stdexcept> // `std::invalid_argument`
#include <string>    // `std::string`
#include <vector>    // `std::vector`

#if !TL_IS_CPP11_
#error "This test requires C++11 or later."
#endif

#include "test_textlane.hpp" // `global_random_generator`, `random_bytes`

namespace tl = textlane;
using namespace tl::scripts;
using tl::literals::operator""_tv;

/**
 *  @brief  Mix of 1-, 2-, 3-, and 4-byte UTF-8 sequences, used to synthesize well-formed inputs.
 */
static char const *utf8_alphabet[] = {
    "a", "Z", " ", "\n", "0", "\xC3\xA9" /* é */, "\xD0\x96" /* Ж */, "\xE4\xB8\x96" /* 世 */,
    "\xED\x9F\xBF" /* U+D7FF */, "\xEE\x80\x80" /* U+E000 */, "\xF0\x9F\x94\xA5" /* 🔥 */,
    "\xF4\x8F\xBF\xBF" /* U+10FFFF */,
};

/** @brief Produces a well-formed UTF-8 string with exactly @p runes characters, mostly ASCII if @p ascii_heavy. */
static std::string random_utf8(std::size_t runes, bool ascii_heavy) noexcept(false) {
    std::size_t const alphabet_size = sizeof(utf8_alphabet) / sizeof(utf8_alphabet[0]);
    uniform_u8_distribution_t pick(0, static_cast<std::uint8_t>(alphabet_size - 1));
    uniform_u8_distribution_t coin(0, 15);
    std::string result;
    for (std::size_t i = 0; i != runes; ++i) {
        bool const ascii = ascii_heavy && coin(global_random_generator()) != 0;
        result += ascii ? utf8_alphabet[0] : utf8_alphabet[pick(global_random_generator())];
    }
    return result;
}

/** @brief Overwrites one random byte of @p text with a random value, likely breaking its UTF-8 structure. */
static void corrupt_one_byte(std::string &text) noexcept {
    if (text.empty()) return;
    std::uniform_int_distribution<std::size_t> position(0, text.size() - 1);
    uniform_u8_distribution_t value;
    text[position(global_random_generator())] = static_cast<char>(value(global_random_generator()));
}

/** @brief Reference conversion, only touching the ASCII letters. */
static std::string expected_case(std::string text, bool upper) noexcept(false) {
    for (char &c : text) {
        unsigned char const u = static_cast<unsigned char>(c);
        if (upper && u >= 'a' && u <= 'z') c = static_cast<char>(u - 0x20);
        if (!upper && u >= 'A' && u <= 'Z') c = static_cast<char>(u + 0x20);
    }
    return text;
}

/**
 *  @brief  Checks the public dispatched functions on hand-picked inputs.
 */
void test_ascii_case() {

    auto upper = [](std::string text) {
        tl_to_upper(&text[0], text.size());
        return text;
    };
    auto lower = [](std::string text) {
        tl_to_lower(&text[0], text.size());
        return text;
    };

    assert(upper("hello") == "HELLO");
    assert(upper("Hello, World! 123") == "HELLO, WORLD! 123");
    assert(lower("Hello, World! 123") == "hello, world! 123");
    assert(lower("ABCDEFGHIJKLMNOPQRSTUVWXYZ") == "abcdefghijklmnopqrstuvwxyz");
    assert(upper("abcdefghijklmnopqrstuvwxyz") == "ABCDEFGHIJKLMNOPQRSTUVWXYZ");

    // Neighbors of the letter ranges must stay untouched
    assert(upper("@[`{") == "@[`{");
    assert(lower("@[`{") == "@[`{");

    // Non-ASCII bytes are preserved, even when they would look like letters after masking the top bit
    assert(upper("caf\xC3\xA9") == "CAF\xC3\xA9");
    assert(lower("\xC3\x89T\xC3\x89") == "\xC3\x89t\xC3\x89");
    assert(upper("\xE1\x0F a\xFA") == "\xE1\x0F A\xFA");

    // Embedded NULs don't terminate the conversion
    assert(upper(std::string("a\0b", 3)) == std::string("A\0B", 3));

    // Empty inputs are no-ops, even with `NULL` pointers
    tl_to_upper(NULL, 0);
    tl_to_lower(NULL, 0);
    tl_to_upper_serial(NULL, 0);
    tl_to_lower_serial(NULL, 0);
    assert(upper("") == "");

    // Every byte value, every length, and every alignment from 0 to a few lane widths
    std::string all_bytes(256, '\0');
    for (std::size_t i = 0; i != 256; ++i) all_bytes[i] = static_cast<char>(i);
    for (std::size_t offset = 0; offset != 64; ++offset) {
        std::string shifted = all_bytes.substr(offset) + all_bytes.substr(0, offset);
        for (std::size_t length = 0; length <= shifted.size(); length += 7) {
            std::string const slice = shifted.substr(0, length);
            assert(upper(slice) == expected_case(slice, true));
            assert(lower(slice) == expected_case(slice, false));
        }
    }

    // Converting twice is the same as converting once
    std::string const mixed = "The Quick Brown Fox Jumps Over The Lazy Dog \xF0\x9F\x94\xA5";
    assert(upper(upper(mixed)) == upper(mixed));
    assert(lower(lower(mixed)) == lower(mixed));
    assert(lower(upper(mixed)) == lower(mixed));
}

/**
 *  @brief  Checks the public dispatched UTF-8 functions on hand-picked inputs.
 */
void test_utf8() {

    auto valid = [](std::string const &text) { return tl_utf8_valid(text.data(), text.size()) == tl_true_k; };
    auto count = [](std::string const &text) { return tl_utf8_count(text.data(), text.size()); };
    auto invalid_offset = [](std::string const &text) -> std::ptrdiff_t {
        tl_cptr_t invalid = tl_utf8_find_invalid(text.data(), text.size());
        return invalid ? invalid - text.data() : -1;
    };

    // Well-formed inputs
    assert(valid(""));
    assert(valid("Hello"));
    assert(valid("caf\xC3\xA9"));
    assert(valid("\xE4\xB8\x96\xE7\x95\x8C"));
    assert(valid("\xF0\x9F\x94\xA5"));
    assert(valid(std::string("\0", 1)));
    assert(valid("\xC2\x80"));         // U+0080, smallest 2-byte value
    assert(valid("\xDF\xBF"));         // U+07FF, largest 2-byte value
    assert(valid("\xE0\xA0\x80"));     // U+0800, smallest 3-byte value
    assert(valid("\xED\x9F\xBF"));     // U+D7FF, just below the surrogates
    assert(valid("\xEE\x80\x80"));     // U+E000, just above the surrogates
    assert(valid("\xEF\xBF\xBF"));     // U+FFFF
    assert(valid("\xF0\x90\x80\x80")); // U+10000, smallest 4-byte value
    assert(valid("\xF4\x8F\xBF\xBF")); // U+10FFFF, largest code point

    // Malformed inputs
    assert(!valid("\x80"));             // Lone continuation byte
    assert(!valid("\xBF"));             // Lone continuation byte
    assert(!valid("\xC3"));             // Truncated 2-byte sequence
    assert(!valid("\xC0\x80"));         // Overlong NUL
    assert(!valid("\xC1\xBF"));         // Overlong 2-byte sequence
    assert(!valid("\xE0\x80\x80"));     // Overlong 3-byte sequence
    assert(!valid("\xE0\x9F\xBF"));     // Overlong 3-byte sequence
    assert(!valid("\xED\xA0\x80"));     // High surrogate U+D800
    assert(!valid("\xED\xBF\xBF"));     // Low surrogate U+DFFF
    assert(!valid("\xE4\xB8"));         // Truncated 3-byte sequence
    assert(!valid("\xF0\x80\x80\x80")); // Overlong 4-byte sequence
    assert(!valid("\xF0\x8F\xBF\xBF")); // Overlong 4-byte sequence
    assert(!valid("\xF4\x90\x80\x80")); // Above U+10FFFF
    assert(!valid("\xF5\x80\x80\x80")); // Invalid lead byte
    assert(!valid("\xFF"));             // Invalid lead byte
    assert(!valid("\xF0\x9F\x94"));     // Truncated 4-byte sequence
    assert(!valid("\xC3\x28"));         // Continuation replaced by ASCII

    // Character counts of well-formed inputs
    assert(count("") == 0);
    assert(count("Hello") == 5);
    assert(count("caf\xC3\xA9") == 4);
    assert(count("\xE4\xB8\x96\xE7\x95\x8C") == 2);
    assert(count("\xF0\x9F\x94\xA5!") == 2);
    assert(count(std::string("a\0b", 3)) == 3);

    // Malformed inputs are counted up to the first offending sequence
    assert(count("ab\xC3") == 2);
    assert(count("a\x80"
                 "b") == 1);
    assert(count("\xE0\x80\x80x") == 0);
    assert(count("caf\xC3\xA9\xED\xA0\x80") == 4);

    // Offsets of the first offending sequence
    assert(invalid_offset("") == -1);
    assert(invalid_offset("caf\xC3\xA9") == -1);
    assert(invalid_offset("ab\xC3") == 2);
    assert(invalid_offset("a\x80"
                          "b") == 1);
    assert(invalid_offset("\xE0\x80\x80x") == 0);
    assert(invalid_offset("caf\xC3\xA9\xF0\x9F\x94") == 5);
    assert(invalid_offset("xyz\xE4\xB8\x96\xED\xA0\x80") == 6);

    // Empty inputs are well-formed, even with `NULL` pointers
    assert(tl_utf8_valid(NULL, 0) == tl_true_k);
    assert(tl_utf8_count(NULL, 0) == 0);
    assert(tl_utf8_find_invalid(NULL, 0) == NULL);
    assert(tl_utf8_valid_serial(NULL, 0) == tl_true_k);
    assert(tl_utf8_count_serial(NULL, 0) == 0);
    assert(tl_utf8_find_invalid_serial(NULL, 0) == NULL);

    // Long ASCII runs before the error, to let the vectorized paths skip ahead
    std::string const ascii = repeat("0123456789abcdef", 37);
    assert(count(ascii + "\xC3\xA9") == ascii.size() + 1);
    assert(invalid_offset(ascii + "\xC3") == static_cast<std::ptrdiff_t>(ascii.size()));
    assert(invalid_offset(ascii + "\x80" + ascii) == static_cast<std::ptrdiff_t>(ascii.size()));
    assert(count(ascii + "\x80" + ascii) == ascii.size());
}

/**
 *  @brief  Checks the resumable scanner on sequences split across chunks.
 */
void test_utf8_scan() {

    // Split inside a 2-byte sequence
    {
        tl_utf8_scan_state_t scan;
        tl_utf8_scan_state_init(&scan);
        tl_utf8_scan("caf\xC3", 4, &scan);
        assert(scan.state == tl_utf8_expect_one_k);
        assert(scan.runes == 3);
        assert(scan.boundary == 3);
        tl_utf8_scan("\xA9", 1, &scan);
        assert(scan.state == tl_utf8_expect_lead_k);
        assert(scan.runes == 4);
        assert(scan.consumed == 5);
        assert(scan.boundary == 5);
    }

    // Split a 4-byte sequence into single bytes, with bounds carried over from the lead byte
    {
        tl_utf8_scan_state_t scan;
        tl_utf8_scan_state_init(&scan);
        tl_utf8_scan("\xF4", 1, &scan);
        assert(scan.state == tl_utf8_expect_three_k);
        tl_utf8_scan("\x90", 1, &scan); // Above U+10FFFF
        assert(scan.state == tl_utf8_invalid_k);
        assert(scan.boundary == 0);
        assert(scan.consumed == 1);

        // The invalid state is absorbing
        tl_utf8_scan("abc", 3, &scan);
        assert(scan.state == tl_utf8_invalid_k);
        assert(scan.runes == 0);
    }

    // Empty chunks change nothing
    {
        tl_utf8_scan_state_t scan;
        tl_utf8_scan_state_init(&scan);
        tl_utf8_scan("\xE4", 1, &scan);
        tl_utf8_scan(NULL, 0, &scan);
        tl_utf8_scan("\xB8", 1, &scan);
        tl_utf8_scan(NULL, 0, &scan);
        tl_utf8_scan("\x96", 1, &scan);
        assert(scan.state == tl_utf8_expect_lead_k);
        assert(scan.runes == 1);
    }

    // Random chunking of random inputs matches a single pass
    std::size_t const iterations = scale_iterations(200);
    for (std::size_t iteration = 0; iteration != iterations; ++iteration) {
        std::string text = random_utf8(300, iteration % 2 == 0);
        if (iteration % 3 == 0) corrupt_one_byte(text);

        tl_utf8_scan_state_t whole;
        tl_utf8_scan_state_init(&whole);
        tl_utf8_scan_serial(text.data(), text.size(), &whole);

        tl_utf8_scan_state_t chunked;
        tl_utf8_scan_state_init(&chunked);
        std::uniform_int_distribution<std::size_t> chunk_length(0, 70);
        for (std::size_t offset = 0; offset < text.size();) {
            std::size_t const length = (std::min)(chunk_length(global_random_generator()), text.size() - offset);
            tl_utf8_scan(text.data() + offset, length, &chunked);
            offset += length;
        }

        assert(whole.state == chunked.state);
        assert(whole.runes == chunked.runes);
        assert(whole.consumed == chunked.consumed);
        assert(whole.boundary == chunked.boundary);
    }
}

/**
 *  @brief  Compares one vectorized backend against the serial one, covering the boundary between
 *          full lanes and the tails, misaligned starts, random bytes, and corrupted UTF-8.
 */
void test_equivalence(                                                                                    //
    tl_transform_t upper_base, tl_transform_t upper_simd, tl_transform_t lower_base, tl_transform_t lower_simd, //
    tl_utf8_scan_t scan_base, tl_utf8_scan_t scan_simd,                                                   //
    tl_utf8_valid_t valid_base, tl_utf8_valid_t valid_simd,                                               //
    tl_utf8_count_t count_base, tl_utf8_count_t count_simd,                                               //
    tl_utf8_find_invalid_t find_base, tl_utf8_find_invalid_t find_simd,                                   //
    std::size_t lane_width, std::size_t min_iterations = scale_iterations(2000)) {

    auto check_case = [&](std::string const &text) {
        std::string base = text, simd = text;
        upper_base(&base[0], base.size());
        upper_simd(&simd[0], simd.size());
        assert(base == simd && "Mismatch in uppercase conversion");
        base = text, simd = text;
        lower_base(&base[0], base.size());
        lower_simd(&simd[0], simd.size());
        assert(base == simd && "Mismatch in lowercase conversion");
    };

    auto check_utf8 = [&](char const *data, std::size_t length) {
        tl_utf8_scan_state_t state_base, state_simd;
        tl_utf8_scan_state_init(&state_base);
        tl_utf8_scan_state_init(&state_simd);
        scan_base(data, length, &state_base);
        scan_simd(data, length, &state_simd);
        assert(state_base.state == state_simd.state && "Mismatch in UTF-8 decoder state");
        assert(state_base.runes == state_simd.runes && "Mismatch in UTF-8 character count");
        assert(state_base.consumed == state_simd.consumed);
        assert(state_base.boundary == state_simd.boundary);
        assert(valid_base(data, length) == valid_simd(data, length) && "Mismatch in UTF-8 validation");
        assert(count_base(data, length) == count_simd(data, length) && "Mismatch in UTF-8 character count");
        assert(find_base(data, length) == find_simd(data, length) && "Mismatch in UTF-8 error position");
    };

    // Every length around the first few lane multiples, at every alignment within a lane
    std::string const letters = repeat("aZ@[`{zA", lane_width * 8);
    std::string const utf8 = repeat("a\xC3\xA9Z\xE4\xB8\x96", lane_width * 4);
    for (std::size_t offset = 0; offset != lane_width; ++offset) {
        for (std::size_t length = 0; length <= lane_width * 4 + 1 && offset + length <= letters.size(); ++length) {
            check_case(letters.substr(offset, length));
            check_utf8(letters.data() + offset, length);
            check_utf8(utf8.data() + offset, length);
        }
    }

    // A single offending byte at every position of a pure ASCII buffer
    std::string probe = repeat("x", lane_width * 3 + 3);
    for (std::size_t position = 0; position != probe.size(); ++position) {
        for (char offending : {'\x80', '\xC3', '\xE0', '\xF4', '\xFF'}) {
            std::string broken = probe;
            broken[position] = offending;
            check_utf8(broken.data(), broken.size());
        }
    }

    // Random bytes, valid UTF-8, and corrupted UTF-8
    for (std::size_t iteration = 0; iteration != min_iterations; ++iteration) {
        std::uniform_int_distribution<std::size_t> length_distribution(0, lane_width * 16);
        std::size_t const length = length_distribution(global_random_generator());
        std::string bytes = random_bytes(length);
        check_case(bytes);
        check_utf8(bytes.data(), bytes.size());

        std::string text = random_utf8(length / 2, iteration % 2 == 0);
        check_case(text);
        check_utf8(text.data(), text.size());
        corrupt_one_byte(text);
        check_utf8(text.data(), text.size());
    }
}

/**
 *  @brief  Runs `test_equivalence` for every vectorized backend compiled into this binary and supported by the CPU.
 */
void test_equivalence() {
    tl_capability_t const caps = tl_capabilities();
    tl_unused_(caps);

#if TL_USE_WESTMERE
    if (caps & tl_cap_westmere_k)
        test_equivalence(                                                                  //
            tl_to_upper_serial, tl_to_upper_westmere, tl_to_lower_serial, tl_to_lower_westmere, //
            tl_utf8_scan_serial, tl_utf8_scan_westmere,                                    //
            tl_utf8_valid_serial, tl_utf8_valid_westmere,                                  //
            tl_utf8_count_serial, tl_utf8_count_westmere,                                  //
            tl_utf8_find_invalid_serial, tl_utf8_find_invalid_westmere,                    //
            TL_WESTMERE_LANE_WIDTH);
    else std::printf("  skipping Westmere, unsupported by this CPU\n");
#endif
#if TL_USE_HASWELL
    if (caps & tl_cap_haswell_k)
        test_equivalence(                                                                //
            tl_to_upper_serial, tl_to_upper_haswell, tl_to_lower_serial, tl_to_lower_haswell, //
            tl_utf8_scan_serial, tl_utf8_scan_haswell,                                   //
            tl_utf8_valid_serial, tl_utf8_valid_haswell,                                 //
            tl_utf8_count_serial, tl_utf8_count_haswell,                                 //
            tl_utf8_find_invalid_serial, tl_utf8_find_invalid_haswell,                   //
            TL_HASWELL_LANE_WIDTH);
    else std::printf("  skipping Haswell, unsupported by this CPU\n");
#endif
#if TL_USE_NEON
    if (caps & tl_cap_neon_k)
        test_equivalence(                                                          //
            tl_to_upper_serial, tl_to_upper_neon, tl_to_lower_serial, tl_to_lower_neon, //
            tl_utf8_scan_serial, tl_utf8_scan_neon,                                //
            tl_utf8_valid_serial, tl_utf8_valid_neon,                              //
            tl_utf8_count_serial, tl_utf8_count_neon,                              //
            tl_utf8_find_invalid_serial, tl_utf8_find_invalid_neon,                //
            TL_NEON_LANE_WIDTH);
    else std::printf("  skipping NEON, unsupported by this CPU\n");
#endif

    // The dispatched entry points must agree with the serial backend as well
    test_equivalence(                                                        //
        tl_to_upper_serial, tl_to_upper, tl_to_lower_serial, tl_to_lower,   //
        tl_utf8_scan_serial, tl_utf8_scan,                                   //
        tl_utf8_valid_serial, tl_utf8_valid,                                 //
        tl_utf8_count_serial, tl_utf8_count,                                 //
        tl_utf8_find_invalid_serial, tl_utf8_find_invalid,                   //
        tl_capability_lane_width(caps) > 1 ? tl_capability_lane_width(caps) : 16);
}

/**
 *  @brief  Checks the capability introspection and the dispatch table updates.
 */
void test_capabilities() {

    assert(tl_version_major() == TEXTLANE_H_VERSION_MAJOR);
    assert(tl_version_minor() == TEXTLANE_H_VERSION_MINOR);
    assert(tl_version_patch() == TEXTLANE_H_VERSION_PATCH);

    tl_capability_t const caps = tl_capabilities();
    assert(caps & tl_cap_serial_k);
    assert((caps & ~tl_caps_cpus_k) == 0);

    // Names round-trip through the string forms
    assert(std::strcmp(tl_capabilities_to_string(tl_cap_serial_k), "serial") == 0);
    assert(std::strcmp(tl_capabilities_to_string((tl_capability_t)(tl_cap_serial_k | tl_cap_haswell_k)),
                       "serial,haswell") == 0);
    assert(std::strcmp(tl_capabilities_to_string(tl_caps_none_k), "") == 0);
    assert(tl_capabilities_from_string("serial") == tl_cap_serial_k);
    assert(tl_capabilities_from_string("serial,haswell") == (tl_cap_serial_k | tl_cap_haswell_k));
    assert(tl_capabilities_from_string("neon,westmere") == (tl_cap_neon_k | tl_cap_westmere_k));
    assert(tl_capabilities_from_string("any") == tl_cap_any_k);
    assert(tl_capabilities_from_string("") == tl_caps_none_k);
    assert(tl_capabilities_from_string("avx9000") == tl_caps_none_k);
    assert(tl_capabilities_from_string("serial,") == tl_caps_none_k);
    assert(tl_capabilities_from_string("serial,avx9000") == tl_caps_none_k);
    assert(tl_capabilities_from_string(tl_capabilities_to_string(caps)) == caps);

    // Only the compiled-in backends can be reported
#if !TL_DYNAMIC_DISPATCH && !TL_USE_NEON
    assert((caps & tl_cap_neon_k) == 0);
#endif

    // The dispatched backend is a single supported capability, narrowed down by `TL_CAPABILITIES`
    tl_capability_t const dispatched = tl_dispatch_table_capability();
    assert(dispatched != tl_caps_none_k && (dispatched & (dispatched - 1)) == 0);
    assert((dispatched & caps) == dispatched);
    char const *requested = std::getenv("TL_CAPABILITIES");
    if (tl_dynamic_dispatch() && requested && *requested) {
        tl_capability_t const allowed = tl_capabilities_from_string(requested);
        std::printf("  TL_CAPABILITIES=%s, dispatching to %s\n", requested, tl_capabilities_to_string(dispatched));
        if (allowed != tl_caps_none_k) assert((dispatched & (allowed | tl_cap_serial_k)) == dispatched);
    }

    assert(tl_capability_lane_width(tl_cap_serial_k) == TL_SERIAL_LANE_WIDTH);
    assert(tl_capability_lane_width(tl_caps_none_k) == TL_SERIAL_LANE_WIDTH);
#if TL_USE_HASWELL
    assert(tl_capability_lane_width(tl_cap_any_k) == TL_HASWELL_LANE_WIDTH);
#endif

    // Narrowing the dispatch table down to the serial backend must not change any result
    std::string const sample = "Mixed Case \xC3\xA9\xE4\xB8\x96 " + repeat("abcXYZ", 20) + "\xED\xA0\x80";
    std::string upper_best = sample, upper_serial = sample;
    tl_to_upper(&upper_best[0], upper_best.size());
    std::size_t const count_best = tl_utf8_count(sample.data(), sample.size());
    tl_cptr_t const invalid_best = tl_utf8_find_invalid(sample.data(), sample.size());

    tl_dispatch_table_update(tl_cap_serial_k);
    if (tl_dynamic_dispatch()) assert(tl_dispatch_table_capability() == tl_cap_serial_k);
    tl_to_upper(&upper_serial[0], upper_serial.size());
    assert(upper_best == upper_serial);
    assert(tl_utf8_count(sample.data(), sample.size()) == count_best);
    assert(tl_utf8_find_invalid(sample.data(), sample.size()) == invalid_best);

    // Requesting a backend the CPU lacks falls back to a supported one
    tl_dispatch_table_update(tl_caps_cpus_k);
    assert(tl_utf8_count(sample.data(), sample.size()) == count_best);
    assert((tl_dispatch_table_capability() & caps) == tl_dispatch_table_capability());
    tl_dispatch_table_update(tl_cap_any_k);
}

/**
 *  @brief  Checks the C++ wrappers: slices, STL interop, status codes, and exceptions.
 */
void test_cpp_api() {

    // Free functions over STL strings
    std::string text = "Hello, World!";
    tl::to_upper(text);
    assert(text == "HELLO, WORLD!");
    tl::to_lower(text);
    assert(text == "hello, world!");
    tl::to_upper(&text[0], 5);
    assert(text == "HELLO, world!");

    // Slices over raw buffers and STL strings
    tl::text_view view = "caf\xC3\xA9";
    assert(view.size() == 5);
    assert(view.utf8_valid());
    assert(view.utf8_count() == 4);
    assert(view.utf8_find_invalid() == tl::text_view::npos);
    assert(view.try_utf8_validate() == tl::status_t::success_k);
    assert(std::string(view) == "caf\xC3\xA9");

    tl::text_view broken = "ab\xC3"_tv;
    assert(!broken.utf8_valid());
    assert(broken.utf8_count() == 2);
    assert(broken.utf8_find_invalid() == 2);
    assert(broken.try_utf8_validate() == tl::status_t::invalid_utf8_k);
    assert(tl::try_utf8_validate(broken) == tl::status_t::invalid_utf8_k);

    bool thrown = false;
    try {
        broken.utf8_validate();
    }
    catch (std::invalid_argument const &) {
        thrown = true;
    }
    assert(thrown);
    view.utf8_validate(); // Must not throw
    tl::utf8_validate(std::string("plain ascii"));

    // Embedded NULs are part of the literal slices
    auto with_nul = "a\0\xC3\xA9"_tv;
    assert(with_nul.size() == 4);
    assert(tl::utf8_count(with_nul) == 3);

    // Mutable spans convert in place and chain
    std::string owned = "MiXeD \xD0\x96 CaSe";
    tl::text_span span = owned;
    span.to_lower().to_upper();
    assert(owned == "MIXED \xD0\x96 CASE");
    tl::text_view from_span = span;
    assert(from_span.data() == owned.data());
    assert(from_span.utf8_count() == 12);

    // Empty slices
    tl::text_span empty_span;
    empty_span.to_upper();
    assert(tl::text_view().utf8_valid());
    assert(tl::text_view().utf8_count() == 0);
    assert(tl::text_view().utf8_find_invalid() == tl::text_view::npos);

    // Slices over long NULL-terminated strings, measured without recursion
    std::string const long_text = repeat("Long text ", 1u << 20);
    tl::text_view long_view = long_text.c_str();
    assert(long_view.size() == long_text.size());
    assert(long_view.utf8_count() == long_text.size());
    std::string long_copy = long_text;
    tl::text_span long_span = &long_copy[0];
    assert(long_span.size() == long_copy.size());
    long_span.to_upper();
    assert(long_copy == repeat("LONG TEXT ", 1u << 20));

#if TL_IS_CPP17_ && defined(__cpp_lib_string_view)
    std::string_view stl_view = "\xE4\xB8\x96\xE7\x95\x8C";
    assert(tl::utf8_count(stl_view) == 2);
    assert(std::string_view(tl::text_view(stl_view)) == stl_view);
#endif
}

int main(int argc, char const **argv) {

    // Let's greet the user nicely
    tl_unused_(argc && argv);
    std::printf("Hi, dear tester! You look nice today!\n");

    // Header-only builds for a specific ISA can't run on older CPUs
    if (!(tl_capabilities() & tl_dispatch_table_capability())) {
        std::printf("Skipping, this CPU can't run the %s backend\n",
                    tl_capabilities_to_string(tl_dispatch_table_capability()));
        return 77;
    }
    print_test_environment();

    std::printf("\n=== Case Conversions ===\n");
    std::printf("- test_ascii_case...\n");
    test_ascii_case();

    std::printf("\n=== UTF-8 ===\n");
    std::printf("- test_utf8...\n");
    test_utf8();
    std::printf("- test_utf8_scan...\n");
    test_utf8_scan();

    std::printf("\n=== Backends ===\n");
    std::printf("- test_equivalence...\n");
    test_equivalence();
    std::printf("- test_capabilities...\n");
    test_capabilities();

    std::printf("\n=== C++ API ===\n");
    std::printf("- test_cpp_api...\n");
    test_cpp_api();

    std::printf("All tests passed... Unbelievable!\n");
    return 0;
}
