/**
 *  @brief  Hardware-accelerated ASCII case conversion.
 *  @file   ascii_case.h
 *
 *  Includes core APIs for in-place transforms of contiguous byte buffers:
 *
 *  - @b `tl_to_upper` - analog to applying @b `toupper` to every byte in the "C" locale
 *  - @b `tl_to_lower` - analog to applying @b `tolower` to every byte in the "C" locale
 *
 *  Only the 'a'-'z' and 'A'-'Z' ranges are affected, and the conversion is a toggle of the 0x20 bit.
 *  Every other byte, including every byte of a multi-byte UTF-8 sequence (all of which are >= 0x80),
 *  passes through unchanged. So the functions are total and can be safely applied to binary data.
 *
 *  Every SIMD backend builds a per-lane mask of bytes within the inclusive source range, toggles the
 *  0x20 bit in a copy of the lane, and blends the two with the mask, storing the lane back in place.
 */
#ifndef TEXTLANE_ASCII_CASE_H_
#define TEXTLANE_ASCII_CASE_H_

#include "types.h"

#ifdef __cplusplus
extern "C" {
#endif

#pragma region Core API

/**
 *  @brief  Converts lowercase ASCII letters to uppercase @b in-place.
 *
 *  @param[inout] text Buffer to transform. Can be `NULL`, if the @p length is zero.
 *  @param[in] length Number of bytes in the buffer. Can be a zero.
 *
 *  @code{.c}
 *      #include <textlane/ascii_case.h>
 *      int main() {
 *          char text[] = "hello, мир!";
 *          tl_to_upper(text, sizeof(text) - 1);
 *          return text[0] == 'H' ? 0 : 1; // "HELLO, мир!"
 *      }
 *  @endcode
 *
 *  @sa tl_to_upper_serial, tl_to_upper_westmere, tl_to_upper_haswell, tl_to_upper_neon
 */
TL_DYNAMIC void tl_to_upper(tl_ptr_t text, tl_size_t length);

/**
 *  @brief  Converts uppercase ASCII letters to lowercase @b in-place.
 *
 *  @param[inout] text Buffer to transform. Can be `NULL`, if the @p length is zero.
 *  @param[in] length Number of bytes in the buffer. Can be a zero.
 *
 *  @sa tl_to_lower_serial, tl_to_lower_westmere, tl_to_lower_haswell, tl_to_lower_neon
 */
TL_DYNAMIC void tl_to_lower(tl_ptr_t text, tl_size_t length);

#pragma endregion

#pragma region Platform-Specific Backends

/** @copydoc tl_to_upper */
TL_PUBLIC void tl_to_upper_serial(tl_ptr_t text, tl_size_t length);
/** @copydoc tl_to_lower */
TL_PUBLIC void tl_to_lower_serial(tl_ptr_t text, tl_size_t length);

#if TL_USE_WESTMERE
/** @copydoc tl_to_upper */
TL_PUBLIC void tl_to_upper_westmere(tl_ptr_t text, tl_size_t length);
/** @copydoc tl_to_lower */
TL_PUBLIC void tl_to_lower_westmere(tl_ptr_t text, tl_size_t length);
#endif

#if TL_USE_HASWELL
/** @copydoc tl_to_upper */
TL_PUBLIC void tl_to_upper_haswell(tl_ptr_t text, tl_size_t length);
/** @copydoc tl_to_lower */
TL_PUBLIC void tl_to_lower_haswell(tl_ptr_t text, tl_size_t length);
#endif

#if TL_USE_NEON
/** @copydoc tl_to_upper */
TL_PUBLIC void tl_to_upper_neon(tl_ptr_t text, tl_size_t length);
/** @copydoc tl_to_lower */
TL_PUBLIC void tl_to_lower_neon(tl_ptr_t text, tl_size_t length);
#endif

#pragma endregion

#pragma region Serial Implementation

/**
 *  @brief  Toggles the case bit of every byte in the inclusive `[first, last]` range.
 *          A single unsigned comparison replaces the two bound checks.
 */
TL_INTERNAL void tl_ascii_flip_range_serial_(tl_ptr_t text, tl_size_t length, tl_u8_t first, tl_u8_t last) {
    if (!length) return; // The `text` may be `NULL`
    tl_u8_t *text_u8 = (tl_u8_t *)text;
    tl_u8_t *const end_u8 = text_u8 + length;
    tl_u8_t const span = (tl_u8_t)(last - first);
    for (; text_u8 != end_u8; ++text_u8)
        if ((tl_u8_t)(*text_u8 - first) <= span) *text_u8 ^= 0x20;
}

TL_PUBLIC void tl_to_upper_serial(tl_ptr_t text, tl_size_t length) {
    tl_ascii_flip_range_serial_(text, length, 'a', 'z');
}

TL_PUBLIC void tl_to_lower_serial(tl_ptr_t text, tl_size_t length) {
    tl_ascii_flip_range_serial_(text, length, 'A', 'Z');
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

TL_INTERNAL void tl_ascii_flip_range_westmere_(tl_ptr_t text, tl_size_t length, tl_u8_t first, tl_u8_t last) {
    tl_u128_vec_t first_vec, last_vec, case_bit_vec, text_vec, flipped_vec, in_range_vec;
    first_vec.xmm = _mm_set1_epi8((char)first);
    last_vec.xmm = _mm_set1_epi8((char)last);
    case_bit_vec.xmm = _mm_set1_epi8(0x20);

    while (length >= TL_WESTMERE_LANE_WIDTH) {
        text_vec.xmm = _mm_loadu_si128((__m128i const *)text);
        // Clamping a byte into the range leaves it unchanged only if it was already within the range
        in_range_vec.xmm = _mm_cmpeq_epi8(_mm_min_epu8(_mm_max_epu8(text_vec.xmm, first_vec.xmm), last_vec.xmm),
                                          text_vec.xmm);
        flipped_vec.xmm = _mm_xor_si128(text_vec.xmm, case_bit_vec.xmm);
        text_vec.xmm = _mm_blendv_epi8(text_vec.xmm, flipped_vec.xmm, in_range_vec.xmm);
        _mm_storeu_si128((__m128i *)text, text_vec.xmm);
        text += TL_WESTMERE_LANE_WIDTH, length -= TL_WESTMERE_LANE_WIDTH;
    }

    if (length) tl_ascii_flip_range_serial_(text, length, first, last);
}

TL_PUBLIC void tl_to_upper_westmere(tl_ptr_t text, tl_size_t length) {
    tl_ascii_flip_range_westmere_(text, length, 'a', 'z');
}

TL_PUBLIC void tl_to_lower_westmere(tl_ptr_t text, tl_size_t length) {
    tl_ascii_flip_range_westmere_(text, length, 'A', 'Z');
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

TL_INTERNAL void tl_ascii_flip_range_haswell_(tl_ptr_t text, tl_size_t length, tl_u8_t first, tl_u8_t last) {
    tl_u256_vec_t first_vec, last_vec, case_bit_vec, text_vec, flipped_vec, in_range_vec;
    first_vec.ymm = _mm256_set1_epi8((char)first);
    last_vec.ymm = _mm256_set1_epi8((char)last);
    case_bit_vec.ymm = _mm256_set1_epi8(0x20);

    while (length >= TL_HASWELL_LANE_WIDTH) {
        text_vec.ymm = _mm256_loadu_si256((__m256i const *)text);
        in_range_vec.ymm = _mm256_cmpeq_epi8(
            _mm256_min_epu8(_mm256_max_epu8(text_vec.ymm, first_vec.ymm), last_vec.ymm), text_vec.ymm);
        flipped_vec.ymm = _mm256_xor_si256(text_vec.ymm, case_bit_vec.ymm);
        text_vec.ymm = _mm256_blendv_epi8(text_vec.ymm, flipped_vec.ymm, in_range_vec.ymm);
        _mm256_storeu_si256((__m256i *)text, text_vec.ymm);
        text += TL_HASWELL_LANE_WIDTH, length -= TL_HASWELL_LANE_WIDTH;
    }

    if (length) tl_ascii_flip_range_serial_(text, length, first, last);
}

TL_PUBLIC void tl_to_upper_haswell(tl_ptr_t text, tl_size_t length) {
    tl_ascii_flip_range_haswell_(text, length, 'a', 'z');
}

TL_PUBLIC void tl_to_lower_haswell(tl_ptr_t text, tl_size_t length) {
    tl_ascii_flip_range_haswell_(text, length, 'A', 'Z');
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

TL_INTERNAL void tl_ascii_flip_range_neon_(tl_ptr_t text, tl_size_t length, tl_u8_t first, tl_u8_t last) {
    tl_u128_vec_t text_vec, in_range_vec;
    uint8x16_t first_vec = vdupq_n_u8(first);
    uint8x16_t last_vec = vdupq_n_u8(last);
    uint8x16_t case_bit_vec = vdupq_n_u8(0x20);

    while (length >= TL_NEON_LANE_WIDTH) {
        text_vec.u8x16 = vld1q_u8((tl_u8_t const *)text);
        in_range_vec.u8x16 = vandq_u8(vcgeq_u8(text_vec.u8x16, first_vec), vcleq_u8(text_vec.u8x16, last_vec));
        text_vec.u8x16 = vbslq_u8(in_range_vec.u8x16, veorq_u8(text_vec.u8x16, case_bit_vec), text_vec.u8x16);
        vst1q_u8((tl_u8_t *)text, text_vec.u8x16);
        text += TL_NEON_LANE_WIDTH, length -= TL_NEON_LANE_WIDTH;
    }

    if (length) tl_ascii_flip_range_serial_(text, length, first, last);
}

TL_PUBLIC void tl_to_upper_neon(tl_ptr_t text, tl_size_t length) { tl_ascii_flip_range_neon_(text, length, 'a', 'z'); }

TL_PUBLIC void tl_to_lower_neon(tl_ptr_t text, tl_size_t length) { tl_ascii_flip_range_neon_(text, length, 'A', 'Z'); }

#if defined(__clang__)
#pragma clang attribute pop
#elif defined(__GNUC__)
#pragma GCC pop_options
#endif
#endif            // TL_USE_NEON
#pragma endregion // NEON Implementation

#pragma region Compile Time Dispatching

#if !TL_DYNAMIC_DISPATCH

TL_DYNAMIC void tl_to_upper(tl_ptr_t text, tl_size_t length) {
#if TL_USE_HASWELL
    tl_to_upper_haswell(text, length);
#elif TL_USE_WESTMERE
    tl_to_upper_westmere(text, length);
#elif TL_USE_NEON
    tl_to_upper_neon(text, length);
#else
    tl_to_upper_serial(text, length);
#endif
}

TL_DYNAMIC void tl_to_lower(tl_ptr_t text, tl_size_t length) {
#if TL_USE_HASWELL
    tl_to_lower_haswell(text, length);
#elif TL_USE_WESTMERE
    tl_to_lower_westmere(text, length);
#elif TL_USE_NEON
    tl_to_lower_neon(text, length);
#else
    tl_to_lower_serial(text, length);
#endif
}

#endif            // !TL_DYNAMIC_DISPATCH
#pragma endregion // Compile Time Dispatching

#ifdef __cplusplus
}
#endif // __cplusplus

#endif // TEXTLANE_ASCII_CASE_H_
