/**
 *  @brief  Hardware-accelerated UTF-8 validation and character counting.
 *  @file   utf8.h
 *
 *  Includes core APIs:
 *
 *  - `tl_utf8_valid` - checks if a buffer is well-formed UTF-8
 *  - `tl_utf8_count` - counts UTF-8 characters in the longest valid prefix of a buffer
 *  - `tl_utf8_find_invalid` - locates the first malformed or truncated sequence
 *  - `tl_utf8_scan` - resumable primitive behind all of the above, for chunked inputs
 *
 *  All of them share a single forward pass of a byte-level state machine, never backtracking.
 *  "Well-formed" follows the Unicode Standard, Table 3-7: overlong encodings, UTF-16 surrogates
 *  (U+D800-U+DFFF), codepoints above U+10FFFF, stray continuation bytes, and truncated sequences
 *  are all rejected. To enforce that with a single byte of look-behind, the state machine tracks
 *  the inclusive range of values the next continuation byte may take. It's the usual 0x80-0xBF,
 *  narrowed right after the E0, ED, F0, and F4 lead bytes.
 *
 *  SIMD backends only accelerate byte classification. A lane without bytes above 0x7F, observed on a
 *  sequence boundary, is accounted for in bulk. Everything else falls back to serial state transitions.
 *  This makes the throughput on ASCII-heavy text close to the memory bandwidth, and the output identical
 *  to the serial backend for every input.
 */
#ifndef TEXTLANE_UTF8_H_
#define TEXTLANE_UTF8_H_

#include "types.h"

#ifdef __cplusplus
extern "C" {
#endif

#pragma region Core API

/**
 *  @brief  State of the UTF-8 decoder, named after the number of continuation bytes it still expects.
 */
typedef enum tl_utf8_state_t {
    tl_utf8_expect_lead_k = 0,  //!< On a sequence boundary, expecting a lead or an ASCII byte.
    tl_utf8_expect_one_k = 1,   //!< One continuation byte left to complete the sequence.
    tl_utf8_expect_two_k = 2,   //!< Two continuation bytes left to complete the sequence.
    tl_utf8_expect_three_k = 3, //!< Three continuation bytes left to complete the sequence.
    tl_utf8_invalid_k = 4,      //!< Absorbing state, entered on the first grammar violation.
} tl_utf8_state_t;

/**
 *  @brief  Resumable cursor over a UTF-8 byte stream.
 *          Initialize with `tl_utf8_scan_state_init` and feed consecutive chunks into `tl_utf8_scan`.
 */
typedef struct tl_utf8_scan_state_t {
    /** @brief Current state of the decoder. */
    tl_utf8_state_t state;
    /** @brief Inclusive lower bound for the next continuation byte. */
    tl_u8_t lower;
    /** @brief Inclusive upper bound for the next continuation byte. */
    tl_u8_t upper;
    /** @brief Number of complete well-formed sequences seen so far. */
    tl_size_t runes;
    /** @brief Number of bytes accepted so far, across all chunks. */
    tl_size_t consumed;
    /** @brief Offset of the first byte past the last complete sequence, across all chunks. */
    tl_size_t boundary;
} tl_utf8_scan_state_t;

/** @brief Signature of the `tl_utf8_scan` backends. */
typedef void (*tl_utf8_scan_t)(tl_cptr_t, tl_size_t, tl_utf8_scan_state_t *);
/** @brief Signature of the `tl_utf8_valid` backends. */
typedef tl_bool_t (*tl_utf8_valid_t)(tl_cptr_t, tl_size_t);
/** @brief Signature of the `tl_utf8_count` backends. */
typedef tl_size_t (*tl_utf8_count_t)(tl_cptr_t, tl_size_t);
/** @brief Signature of the `tl_utf8_find_invalid` backends. */
typedef tl_cptr_t (*tl_utf8_find_invalid_t)(tl_cptr_t, tl_size_t);

/**
 *  @brief  Resets the @p scan state to the start of a stream.
 */
TL_PUBLIC void tl_utf8_scan_state_init(tl_utf8_scan_state_t *scan) {
    scan->state = tl_utf8_expect_lead_k;
    scan->lower = 0x80, scan->upper = 0xBF;
    scan->runes = 0, scan->consumed = 0, scan->boundary = 0;
}

/**
 *  @brief  Feeds the next chunk of a UTF-8 stream into the @p scan state.
 *          Stops consuming bytes on the first grammar violation, leaving the state in `tl_utf8_invalid_k`.
 *
 *  @param[in] text Chunk to be scanned. Can be `NULL`, if the @p length is zero.
 *  @param[in] length Number of bytes in the chunk.
 *  @param[inout] scan State carried over from the previous chunks.
 *
 *  @code{.c}
 *      tl_utf8_scan_state_t scan;
 *      tl_utf8_scan_state_init(&scan);
 *      tl_utf8_scan("caf\xC3", 4, &scan); // Sequence split between chunks
 *      tl_utf8_scan("\xA9", 1, &scan);
 *      // scan.state == tl_utf8_expect_lead_k, scan.runes == 4
 *  @endcode
 */
TL_DYNAMIC void tl_utf8_scan(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan);

/**
 *  @brief  Checks if the buffer contains only well-formed UTF-8 sequences.
 *
 *  @param[in] text String to be scanned. Can be `NULL`, if the @p length is zero.
 *  @param[in] length Number of bytes in the string.
 *  @return `tl_true_k` if the whole buffer is valid, including the empty one.
 */
TL_DYNAMIC tl_bool_t tl_utf8_valid(tl_cptr_t text, tl_size_t length);

/**
 *  @brief  Counts the number of UTF-8 characters in a string.
 *
 *  Never fails. For malformed input, only the complete sequences preceding the first invalid
 *  or truncated one are counted, so the result describes the longest valid prefix.
 *
 *  @param[in] text String to be scanned.
 *  @param[in] length Number of bytes in the string.
 *  @return Number of UTF-8 characters in the longest valid prefix of the string.
 *
 *  @code{.c}
 *      tl_utf8_count("caf\xC3\xA9", 5); // 4
 *      tl_utf8_count("ab\xC3", 3);      // 2, the trailing lead byte is incomplete
 *  @endcode
 */
TL_DYNAMIC tl_size_t tl_utf8_count(tl_cptr_t text, tl_size_t length);

/**
 *  @brief  Locates the first byte of the first invalid or truncated UTF-8 sequence.
 *
 *  @param[in] text String to be scanned.
 *  @param[in] length Number of bytes in the string.
 *  @return Pointer to the start of the offending sequence, or `NULL` if the whole string is valid.
 */
TL_DYNAMIC tl_cptr_t tl_utf8_find_invalid(tl_cptr_t text, tl_size_t length);

#pragma endregion

#pragma region Platform-Specific Backends

/** @copydoc tl_utf8_scan */
TL_PUBLIC void tl_utf8_scan_serial(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan);
/** @copydoc tl_utf8_valid */
TL_PUBLIC tl_bool_t tl_utf8_valid_serial(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_count */
TL_PUBLIC tl_size_t tl_utf8_count_serial(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_find_invalid */
TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_serial(tl_cptr_t text, tl_size_t length);

#if TL_USE_WESTMERE
/** @copydoc tl_utf8_scan */
TL_PUBLIC void tl_utf8_scan_westmere(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan);
/** @copydoc tl_utf8_valid */
TL_PUBLIC tl_bool_t tl_utf8_valid_westmere(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_count */
TL_PUBLIC tl_size_t tl_utf8_count_westmere(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_find_invalid */
TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_westmere(tl_cptr_t text, tl_size_t length);
#endif

#if TL_USE_HASWELL
/** @copydoc tl_utf8_scan */
TL_PUBLIC void tl_utf8_scan_haswell(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan);
/** @copydoc tl_utf8_valid */
TL_PUBLIC tl_bool_t tl_utf8_valid_haswell(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_count */
TL_PUBLIC tl_size_t tl_utf8_count_haswell(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_find_invalid */
TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_haswell(tl_cptr_t text, tl_size_t length);
#endif

#if TL_USE_NEON
/** @copydoc tl_utf8_scan */
TL_PUBLIC void tl_utf8_scan_neon(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan);
/** @copydoc tl_utf8_valid */
TL_PUBLIC tl_bool_t tl_utf8_valid_neon(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_count */
TL_PUBLIC tl_size_t tl_utf8_count_neon(tl_cptr_t text, tl_size_t length);
/** @copydoc tl_utf8_find_invalid */
TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_neon(tl_cptr_t text, tl_size_t length);
#endif

#pragma endregion

#pragma region Serial Implementation

/**
 *  @brief  Advances the state machine by a single byte.
 *          On a violation, the byte is not consumed and `boundary` keeps pointing at the offending sequence.
 */
TL_INTERNAL void tl_utf8_scan_byte_(tl_utf8_scan_state_t *scan, tl_u8_t byte) {
    tl_assert_(scan->state != tl_utf8_invalid_k);

    if (scan->state == tl_utf8_expect_lead_k) {
        // 1-byte sequence: 0xxxxxxx
        if ((byte & 0x80) == 0x00) { scan->runes++, scan->boundary = scan->consumed + 1; }
        // 2-byte sequence: 110xxxxx, excluding the overlong C0 and C1 leads
        else if ((byte & 0xE0) == 0xC0 && byte >= 0xC2) {
            scan->state = tl_utf8_expect_one_k;
            scan->lower = 0x80, scan->upper = 0xBF;
        }
        // 3-byte sequence: 1110xxxx
        else if ((byte & 0xF0) == 0xE0) {
            scan->state = tl_utf8_expect_two_k;
            scan->lower = byte == 0xE0 ? 0xA0 : 0x80; // Overlong below U+0800
            scan->upper = byte == 0xED ? 0x9F : 0xBF; // Surrogates U+D800-U+DFFF
        }
        // 4-byte sequence: 11110xxx, excluding F5-F7 leads above U+10FFFF
        else if ((byte & 0xF8) == 0xF0 && byte <= 0xF4) {
            scan->state = tl_utf8_expect_three_k;
            scan->lower = byte == 0xF0 ? 0x90 : 0x80; // Overlong below U+10000
            scan->upper = byte == 0xF4 ? 0x8F : 0xBF; // Above U+10FFFF
        }
        // Stray continuation byte, or an invalid lead byte
        else {
            scan->state = tl_utf8_invalid_k;
            return;
        }
    }
    else {
        if (byte < scan->lower || byte > scan->upper) {
            scan->state = tl_utf8_invalid_k;
            return;
        }
        scan->state = (tl_utf8_state_t)(scan->state - 1);
        scan->lower = 0x80, scan->upper = 0xBF;
        if (scan->state == tl_utf8_expect_lead_k) scan->runes++, scan->boundary = scan->consumed + 1;
    }
    scan->consumed++;
}

/**
 *  @brief  Accounts for @p count ASCII bytes at once. Only valid on a sequence boundary.
 */
TL_INTERNAL void tl_utf8_scan_ascii_(tl_utf8_scan_state_t *scan, tl_size_t count) {
    tl_assert_(scan->state == tl_utf8_expect_lead_k);
    scan->runes += count;
    scan->consumed += count;
    scan->boundary = scan->consumed;
}

TL_INTERNAL tl_bool_t tl_utf8_valid_with_(tl_utf8_scan_t scanner, tl_cptr_t text, tl_size_t length) {
    tl_utf8_scan_state_t scan;
    tl_utf8_scan_state_init(&scan);
    scanner(text, length, &scan);
    return scan.state == tl_utf8_expect_lead_k ? tl_true_k : tl_false_k;
}

TL_INTERNAL tl_size_t tl_utf8_count_with_(tl_utf8_scan_t scanner, tl_cptr_t text, tl_size_t length) {
    tl_utf8_scan_state_t scan;
    tl_utf8_scan_state_init(&scan);
    scanner(text, length, &scan);
    return scan.runes;
}

TL_INTERNAL tl_cptr_t tl_utf8_find_invalid_with_(tl_utf8_scan_t scanner, tl_cptr_t text, tl_size_t length) {
    tl_utf8_scan_state_t scan;
    tl_utf8_scan_state_init(&scan);
    scanner(text, length, &scan);
    return scan.state == tl_utf8_expect_lead_k ? TL_NULL_CHAR : text + scan.boundary;
}

TL_PUBLIC void tl_utf8_scan_serial(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan) {
    if (!length) return; // The `text` may be `NULL`
    tl_u8_t const *text_u8 = (tl_u8_t const *)text;
    tl_u8_t const *const end_u8 = text_u8 + length;
    for (; text_u8 != end_u8 && scan->state != tl_utf8_invalid_k; ++text_u8) tl_utf8_scan_byte_(scan, *text_u8);
}

TL_PUBLIC tl_bool_t tl_utf8_valid_serial(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_valid_with_(tl_utf8_scan_serial, text, length);
}

TL_PUBLIC tl_size_t tl_utf8_count_serial(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_count_with_(tl_utf8_scan_serial, text, length);
}

TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_serial(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_find_invalid_with_(tl_utf8_scan_serial, text, length);
}

#pragma endregion // Serial Implementation

#pragma region Westmere Implementation
#if TL_USE_WESTMERE
#if defined(__clang__)
#pragma clang attribute push(__attribute__((target("sse2,sse4.1,popcnt"))), apply_to = function)
#elif defined(__GNUC__)
#pragma GCC push_options
#pragma GCC target("sse2", "sse4.1", "popcnt")
#endif

TL_PUBLIC void tl_utf8_scan_westmere(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan) {
    tl_u128_vec_t text_vec;
    while (length >= TL_WESTMERE_LANE_WIDTH && scan->state != tl_utf8_invalid_k) {
        text_vec.xmm = _mm_loadu_si128((__m128i const *)text);
        tl_u32_t non_ascii_mask = (tl_u32_t)_mm_movemask_epi8(text_vec.xmm);
        if (scan->state != tl_utf8_expect_lead_k) { tl_utf8_scan_serial(text, TL_WESTMERE_LANE_WIDTH, scan); }
        else if (!non_ascii_mask) { tl_utf8_scan_ascii_(scan, TL_WESTMERE_LANE_WIDTH); }
        else {
            tl_size_t ascii_prefix = (tl_size_t)tl_u32_ctz(non_ascii_mask);
            tl_utf8_scan_ascii_(scan, ascii_prefix);
            tl_utf8_scan_serial(text + ascii_prefix, TL_WESTMERE_LANE_WIDTH - ascii_prefix, scan);
        }
        text += TL_WESTMERE_LANE_WIDTH, length -= TL_WESTMERE_LANE_WIDTH;
    }
    if (length) tl_utf8_scan_serial(text, length, scan);
}

TL_PUBLIC tl_bool_t tl_utf8_valid_westmere(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_valid_with_(tl_utf8_scan_westmere, text, length);
}

TL_PUBLIC tl_size_t tl_utf8_count_westmere(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_count_with_(tl_utf8_scan_westmere, text, length);
}

TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_westmere(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_find_invalid_with_(tl_utf8_scan_westmere, text, length);
}

#if defined(__clang__)
#pragma clang attribute pop
#elif defined(__GNUC__)
#pragma GCC pop_options
#endif
#endif            // TL_USE_WESTMERE
#pragma endregion // Westmere Implementation

#pragma region Haswell Implementation
#if TL_USE_HASWELL
#if defined(__clang__)
#pragma clang attribute push(__attribute__((target("avx2,bmi,bmi2,popcnt"))), apply_to = function)
#elif defined(__GNUC__)
#pragma GCC push_options
#pragma GCC target("avx2", "bmi", "bmi2", "popcnt")
#endif

TL_PUBLIC void tl_utf8_scan_haswell(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan) {
    tl_u256_vec_t text_vec;
    while (length >= TL_HASWELL_LANE_WIDTH && scan->state != tl_utf8_invalid_k) {
        text_vec.ymm = _mm256_loadu_si256((__m256i const *)text);
        tl_u32_t non_ascii_mask = (tl_u32_t)_mm256_movemask_epi8(text_vec.ymm);
        if (scan->state != tl_utf8_expect_lead_k) { tl_utf8_scan_serial(text, TL_HASWELL_LANE_WIDTH, scan); }
        else if (!non_ascii_mask) { tl_utf8_scan_ascii_(scan, TL_HASWELL_LANE_WIDTH); }
        else {
            tl_size_t ascii_prefix = (tl_size_t)tl_u32_ctz(non_ascii_mask);
            tl_utf8_scan_ascii_(scan, ascii_prefix);
            tl_utf8_scan_serial(text + ascii_prefix, TL_HASWELL_LANE_WIDTH - ascii_prefix, scan);
        }
        text += TL_HASWELL_LANE_WIDTH, length -= TL_HASWELL_LANE_WIDTH;
    }
    if (length) tl_utf8_scan_serial(text, length, scan);
}

TL_PUBLIC tl_bool_t tl_utf8_valid_haswell(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_valid_with_(tl_utf8_scan_haswell, text, length);
}

TL_PUBLIC tl_size_t tl_utf8_count_haswell(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_count_with_(tl_utf8_scan_haswell, text, length);
}

TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_haswell(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_find_invalid_with_(tl_utf8_scan_haswell, text, length);
}

#if defined(__clang__)
#pragma clang attribute pop
#elif defined(__GNUC__)
#pragma GCC pop_options
#endif
#endif            // TL_USE_HASWELL
#pragma endregion // Haswell Implementation

#pragma region NEON Implementation
#if TL_USE_NEON
#if defined(__clang__)
#pragma clang attribute push(__attribute__((target("+simd"))), apply_to = function)
#elif defined(__GNUC__)
#pragma GCC push_options
#pragma GCC target("+simd")
#endif

/**
 *  @brief  Uses `vshrn` to produce a bitmask with 4 bits per byte, similar to `movemask` in SSE.
 *  @see    https://community.arm.com/arm-community-blogs/b/infrastructure-solutions-blog/posts/porting-x86-vector-bitmask-optimizations-to-arm-neon
 */
TL_INTERNAL tl_u64_t tl_utf8_vreinterpretq_u8_u4_(uint8x16_t vec) {
    return vget_lane_u64(vreinterpret_u64_u8(vshrn_n_u16(vreinterpretq_u16_u8(vec), 4)), 0) & 0x8888888888888888ull;
}

TL_PUBLIC void tl_utf8_scan_neon(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan) {
    tl_u128_vec_t text_vec, non_ascii_vec;
    uint8x16_t high_bit_vec = vdupq_n_u8(0x80);
    while (length >= TL_NEON_LANE_WIDTH && scan->state != tl_utf8_invalid_k) {
        text_vec.u8x16 = vld1q_u8((tl_u8_t const *)text);
        if (scan->state != tl_utf8_expect_lead_k) { tl_utf8_scan_serial(text, TL_NEON_LANE_WIDTH, scan); }
        else if (vmaxvq_u8(text_vec.u8x16) < 0x80) { tl_utf8_scan_ascii_(scan, TL_NEON_LANE_WIDTH); }
        else {
            non_ascii_vec.u8x16 = vtstq_u8(text_vec.u8x16, high_bit_vec);
            tl_size_t ascii_prefix = (tl_size_t)tl_u64_ctz(tl_utf8_vreinterpretq_u8_u4_(non_ascii_vec.u8x16)) / 4;
            tl_utf8_scan_ascii_(scan, ascii_prefix);
            tl_utf8_scan_serial(text + ascii_prefix, TL_NEON_LANE_WIDTH - ascii_prefix, scan);
        }
        text += TL_NEON_LANE_WIDTH, length -= TL_NEON_LANE_WIDTH;
    }
    if (length) tl_utf8_scan_serial(text, length, scan);
}

TL_PUBLIC tl_bool_t tl_utf8_valid_neon(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_valid_with_(tl_utf8_scan_neon, text, length);
}

TL_PUBLIC tl_size_t tl_utf8_count_neon(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_count_with_(tl_utf8_scan_neon, text, length);
}

TL_PUBLIC tl_cptr_t tl_utf8_find_invalid_neon(tl_cptr_t text, tl_size_t length) {
    return tl_utf8_find_invalid_with_(tl_utf8_scan_neon, text, length);
}

#if defined(__clang__)
#pragma clang attribute pop
#elif defined(__GNUC__)
#pragma GCC pop_options
#endif
#endif            // TL_USE_NEON
#pragma endregion // NEON Implementation

#pragma region Compile Time Dispatching

#if !TL_DYNAMIC_DISPATCH

TL_DYNAMIC void tl_utf8_scan(tl_cptr_t text, tl_size_t length, tl_utf8_scan_state_t *scan) {
#if TL_USE_HASWELL
    tl_utf8_scan_haswell(text, length, scan);
#elif TL_USE_WESTMERE
    tl_utf8_scan_westmere(text, length, scan);
#elif TL_USE_NEON
    tl_utf8_scan_neon(text, length, scan);
#else
    tl_utf8_scan_serial(text, length, scan);
#endif
}

TL_DYNAMIC tl_bool_t tl_utf8_valid(tl_cptr_t text, tl_size_t length) {
#if TL_USE_HASWELL
    return tl_utf8_valid_haswell(text, length);
#elif TL_USE_WESTMERE
    return tl_utf8_valid_westmere(text, length);
#elif TL_USE_NEON
    return tl_utf8_valid_neon(text, length);
#else
    return tl_utf8_valid_serial(text, length);
#endif
}

TL_DYNAMIC tl_size_t tl_utf8_count(tl_cptr_t text, tl_size_t length) {
#if TL_USE_HASWELL
    return tl_utf8_count_haswell(text, length);
#elif TL_USE_WESTMERE
    return tl_utf8_count_westmere(text, length);
#elif TL_USE_NEON
    return tl_utf8_count_neon(text, length);
#else
    return tl_utf8_count_serial(text, length);
#endif
}

TL_DYNAMIC tl_cptr_t tl_utf8_find_invalid(tl_cptr_t text, tl_size_t length) {
#if TL_USE_HASWELL
    return tl_utf8_find_invalid_haswell(text, length);
#elif TL_USE_WESTMERE
    return tl_utf8_find_invalid_westmere(text, length);
#elif TL_USE_NEON
    return tl_utf8_find_invalid_neon(text, length);
#else
    return tl_utf8_find_invalid_serial(text, length);
#endif
}

#endif            // !TL_DYNAMIC_DISPATCH
#pragma endregion // Compile Time Dispatching

#ifdef __cplusplus
}
#endif // __cplusplus

#endif // TEXTLANE_UTF8_H_
