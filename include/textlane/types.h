/**
 *  @brief  Shared definitions for the TextLane library.
 *  @file   types.h
 *
 *  Includes the following types:
 *
 *  - `tl_u8_t`, `tl_u32_t`, `tl_u64_t` - unsigned integers of 8, 32, and 64 bits.
 *  - `tl_size_t` - unsigned integer of the same size as a pointer.
 *  - `tl_ptr_t`, `tl_cptr_t` - pointer and constant pointer to a byte buffer.
 *  - `tl_bool_t` - boolean type, `tl_true_k` and `tl_false_k` constants.
 *  - `tl_status_t` - outcome of operations that can reject their input.
 *  - `tl_capability_t` - bitmask of the SIMD backends a CPU can run.
 *  - @b `tl_u128_vec_t`, `tl_u256_vec_t` - @b SIMD vector types for x86 and Arm.
 *
 *  Every backend processes the input in "lanes" of a fixed width, defined below as `TL_*_LANE_WIDTH`.
 *  The tail of the input shorter than a lane is always handled by the `_serial` backend.
 */
#ifndef TEXTLANE_TYPES_H_
#define TEXTLANE_TYPES_H_

/*
 *  Debugging and testing.
 */
#if !defined(TL_DEBUG)
#if defined(DEBUG) || defined(_DEBUG)
#define TL_DEBUG (1)
#else
#define TL_DEBUG (0)
#endif
#endif

/**
 *  @brief  When set to 1, the library will include the following LibC headers: <stddef.h> and <stdint.h>.
 *          In debug builds (TL_DEBUG=1), the library will also include <stdio.h> and <stdlib.h>.
 *
 *  You may want to disable this compiling for use in the kernel, or in embedded systems.
 */
#if !defined(TL_AVOID_LIBC)
#define TL_AVOID_LIBC (0) // true or false
#endif

/**
 *  @brief  Removes compile-time dispatching, and replaces it with runtime dispatching.
 *          So the `tl_to_upper` function will invoke the most advanced backend supported by the CPU
 *          running the program, rather than the most advanced backend enabled when compiling
 *          the downstream application. Requires linking against the `textlane_shared` library.
 */
#if !defined(TL_DYNAMIC_DISPATCH)
#define TL_DYNAMIC_DISPATCH (0) // true or false
#endif

#if defined(__LP64__) || defined(_LP64) || defined(__x86_64__) || defined(_WIN64) || defined(__aarch64__) || \
    defined(__arm64__) || defined(__arm64) || defined(_M_ARM64)
#define TL_IS_64BIT_ (1)
#else
#define TL_IS_64BIT_ (0)
#endif

/**
 *  @brief  Infer the target architecture, unless it's overriden by the build system.
 *          Optimized backends exist only for x86_64 and ARM64.
 */
#if !defined(TL_IS_64BIT_X86_)
#if defined(__x86_64__) || defined(_M_X64)
#define TL_IS_64BIT_X86_ (1)
#else
#define TL_IS_64BIT_X86_ (0)
#endif
#endif
#if !defined(TL_IS_64BIT_ARM_)
#if defined(__aarch64__) || defined(__arm64__) || defined(__arm64) || defined(_M_ARM64)
#define TL_IS_64BIT_ARM_ (1)
#else
#define TL_IS_64BIT_ARM_ (0)
#endif
#endif

/*  Annotation for the public API symbols:
 *
 *  - `TL_PUBLIC` is used for functions that are part of the public API.
 *  - `TL_INTERNAL` is used for internal helper functions with unstable APIs.
 *  - `TL_DYNAMIC` is used for functions that are part of the public API, but are dispatched at runtime.
 */
#if TL_DYNAMIC_DISPATCH
#if defined(_WIN32) || defined(__CYGWIN__)
#define TL_DYNAMIC __declspec(dllexport)
#define TL_PUBLIC inline static
#define TL_INTERNAL inline static
#else
#define TL_DYNAMIC extern __attribute__((visibility("default")))
#define TL_PUBLIC __attribute__((unused)) inline static
#define TL_INTERNAL __attribute__((always_inline)) inline static
#endif // _WIN32 || __CYGWIN__
#else
#define TL_DYNAMIC inline static
#define TL_PUBLIC inline static
#define TL_INTERNAL inline static
#endif // TL_DYNAMIC_DISPATCH

#if !TL_AVOID_LIBC
#include <stddef.h> // `size_t`
#include <stdint.h> // `uint8_t`
#endif

/*  The headers needed for the `tl_assert_failure_` function. */
#if TL_DEBUG && !TL_AVOID_LIBC
#include <stdio.h>  // `fprintf`, `stderr`
#include <stdlib.h> // `EXIT_FAILURE`
#endif

/*  Compile-time hardware features detection.
 *  All of those can be controlled by the user.
 */
#if !defined(TL_USE_WESTMERE)
#ifdef __SSE4_1__
#define TL_USE_WESTMERE (1)
#else
#define TL_USE_WESTMERE (0)
#endif
#endif

#if !defined(TL_USE_HASWELL)
#ifdef __AVX2__
#define TL_USE_HASWELL (1)
#else
#define TL_USE_HASWELL (0)
#endif
#endif

#if !defined(TL_USE_NEON)
#ifdef __ARM_NEON
#define TL_USE_NEON (1)
#else
#define TL_USE_NEON (0)
#endif
#endif

/*  Hardware-specific headers for different SIMD intrinsics and register wrappers.
 */
#if TL_USE_WESTMERE || TL_USE_HASWELL
#include <immintrin.h>
#endif
#if TL_USE_NEON
#if !defined(_MSC_VER)
#include <arm_acle.h>
#endif
#include <arm_neon.h>
#endif

#ifdef __cplusplus
extern "C" {
#endif

/*
 *  Let's infer the integer types or pull them from LibC,
 *  if that is allowed by the user.
 */
#if !TL_AVOID_LIBC
typedef uint8_t tl_u8_t;      // Always 8 bits
typedef uint32_t tl_u32_t;    // Always 32 bits
typedef uint64_t tl_u64_t;    // Always 64 bits
typedef size_t tl_size_t;     // Pointer-sized unsigned integer, 32 or 64 bits
#else
typedef unsigned char tl_u8_t;
typedef unsigned int tl_u32_t;
typedef unsigned long long tl_u64_t;
#if TL_IS_64BIT_
typedef unsigned long long tl_size_t;
#else
typedef unsigned int tl_size_t;
#endif // TL_IS_64BIT_
#endif // TL_AVOID_LIBC

/**
 *  @brief  Compile-time assert macro similar to `static_assert` in C++.
 */
#define tl_static_assert(condition, name) typedef char tl_static_assert_##name[(condition) ? 1 : -1]

typedef char *tl_ptr_t;        // A type alias for `char *`
typedef char const *tl_cptr_t; // A type alias for `char const *`

/**
 *  @brief  Similar to `bool` in C++ and `_Bool` in C 99, but guaranteed to be an enum.
 */
typedef enum { tl_false_k = 0, tl_true_k = 1 } tl_bool_t;

/**
 *  @brief A simple signed integer type describing the status of a faulty operation.
 *  @sa tl_success_k, tl_invalid_utf8_k
 */
typedef enum tl_status_t {
    /** For algorithms that return a status, this status indicates that the operation was successful. */
    tl_success_k = 0,
    /** For algorithms that require UTF-8 input, this status indicates that the input is invalid. */
    tl_invalid_utf8_k = -12,
    /** A sink-hole status for unknown errors. */
    tl_status_unknown_k = -1,
} tl_status_t;

/**
 *  @brief  Enumeration of SIMD capabilities of the target architecture.
 *          Used to introspect the supported functionality of the dynamic library,
 *          and to restrict the dispatch table with `tl_dispatch_table_update`.
 */
typedef enum tl_capability_t {
    tl_cap_serial_k = 1,       ///< Serial (non-SIMD) capability
    tl_cap_any_k = 0x7FFFFFFF, ///< Mask representing any capability with `INT_MAX`

    tl_cap_westmere_k = 1 << 3, ///< x86 SSE4.1 capability
    tl_cap_haswell_k = 1 << 5,  ///< x86 AVX2 capability with BMI extensions

    tl_cap_neon_k = 1 << 10, ///< ARM NEON baseline capability

    tl_caps_none_k = 0,
    tl_caps_cpus_k = tl_cap_serial_k | tl_cap_westmere_k | tl_cap_haswell_k | tl_cap_neon_k,
} tl_capability_t;

/**
 *  @brief Maximum number of individual capability flags that can be represented.
 *  @sa tl_capabilities_to_strings_implementation_
 */
#define TL_CAPABILITIES_COUNT 4

/*  Number of bytes consumed per step by each backend.
 *  The remainder of every input, `length % TL_*_LANE_WIDTH`, goes through the serial code path.
 */
#define TL_SERIAL_LANE_WIDTH (1u)
#define TL_WESTMERE_LANE_WIDTH (16u)
#define TL_HASWELL_LANE_WIDTH (32u)
#define TL_NEON_LANE_WIDTH (16u)

tl_static_assert(TL_WESTMERE_LANE_WIDTH > 0 && (TL_WESTMERE_LANE_WIDTH & (TL_WESTMERE_LANE_WIDTH - 1)) == 0,
                 westmere_lane_width_is_power_of_two);
tl_static_assert(TL_HASWELL_LANE_WIDTH > 0 && (TL_HASWELL_LANE_WIDTH & (TL_HASWELL_LANE_WIDTH - 1)) == 0,
                 haswell_lane_width_is_power_of_two);
tl_static_assert(TL_NEON_LANE_WIDTH > 0 && (TL_NEON_LANE_WIDTH & (TL_NEON_LANE_WIDTH - 1)) == 0,
                 neon_lane_width_is_power_of_two);

#pragma region API Signature Types

/** @brief Signature of in-place byte transforms, like `tl_to_upper` and `tl_to_lower`. */
typedef void (*tl_transform_t)(tl_ptr_t, tl_size_t);

#pragma endregion

#pragma region Helper Structures

/**
 *  @brief  Helper structure to simplify work with @b 128-bit registers.
 *          It can help view the contents as 8-bit integers, as well as 1x XMM or NEON register.
 */
typedef union tl_u128_vec_t {
#if TL_USE_WESTMERE || TL_USE_HASWELL
    __m128i xmm;
#endif
#if TL_USE_NEON
    uint8x16_t u8x16;
#endif
    tl_u8_t u8s[16];
} tl_u128_vec_t;

/**
 *  @brief  Helper structure to simplify work with @b 256-bit registers.
 *          It can help view the contents as 8-bit integers, as well as 1x YMM register.
 */
typedef union tl_u256_vec_t {
#if TL_USE_HASWELL
    __m256i ymm;
#endif
    tl_u8_t u8s[32];
} tl_u256_vec_t;

#pragma endregion

#pragma region Helper Functions

#define TL_NULL_CHAR ((tl_cptr_t)0)
#define tl_unused_(x) ((void)(x))

/**
 *  @brief  Similar to `assert`, the `tl_assert_` is used in the `TL_DEBUG` mode
 *          to check the invariants of the library. It's a no-op in the "Release" mode.
 *  @note   If you want to catch it, put a breakpoint at @b `__GI_exit`
 */
#if TL_DEBUG && !TL_AVOID_LIBC
TL_PUBLIC void tl_assert_failure_(char const *condition, char const *file, int line) {
    fprintf(stderr, "Assertion failed: %s, in file %s, line %d\n", condition, file, line);
    exit(EXIT_FAILURE);
}
#define tl_assert_(condition)                                                     \
    do {                                                                          \
        if (!(condition)) { tl_assert_failure_(#condition, __FILE__, __LINE__); } \
    } while (0)
#else
#define tl_assert_(condition) ((void)(condition))
#endif

/*  Intrinsics aliases for MSVC, GCC, and Clang.
 */
#if defined(_MSC_VER) && !defined(__clang__)
#include <intrin.h>
TL_INTERNAL int tl_u32_ctz(tl_u32_t x) {
    unsigned long index;
    _BitScanForward(&index, x);
    return (int)index;
}
TL_INTERNAL int tl_u64_ctz(tl_u64_t x) {
    unsigned long index;
    _BitScanForward64(&index, x);
    return (int)index;
}
#else
TL_INTERNAL int tl_u32_ctz(tl_u32_t x) { return __builtin_ctz(x); }   // ! Undefined if `x == 0`
TL_INTERNAL int tl_u64_ctz(tl_u64_t x) { return __builtin_ctzll(x); } // ! Undefined if `x == 0`
#endif

/**
 *  @brief  Compares two NULL-terminated strings, used to parse capability names.
 *          Reading stops at @p a_end, if it's provided, to allow matching comma-separated lists.
 */
TL_INTERNAL tl_bool_t tl_equal_null_terminated_(char const *a, char const *a_end, char const *b) {
    if (!a || !b) return tl_false_k;
    for (; (a_end ? a < a_end : *a != '\0') && *b; a++, b++)
        if (*a != *b) return tl_false_k;
    return ((a_end ? a == a_end : *a == '\0') && *b == '\0') ? tl_true_k : tl_false_k;
}

#pragma endregion

#ifdef __cplusplus
}
#endif // __cplusplus

#endif // TEXTLANE_TYPES_H_
