/**
 *  @brief  TextLane is a small collection of SIMD-accelerated text primitives: ASCII case conversion,
 *          UTF-8 validation, and UTF-8 character counting over caller-owned byte buffers.
 *          On modern CPUs it uses SSE4.1, AVX2, and NEON @b SIMD instructions, and a serial fallback elsewhere.
 *
 *  @file   textlane.h
 *
 *  @section Introduction
 *
 *  The C 99 core is header-only and is split into:
 *
 *  - `types.h` - shared types, capability flags, lane widths, and assertions.
 *  - `ascii_case.h` - in-place `tl_to_upper` and `tl_to_lower`.
 *  - `utf8.h` - `tl_utf8_valid`, `tl_utf8_count`, `tl_utf8_find_invalid`, and the resumable `tl_utf8_scan`.
 *  - `textlane.h` - umbrella header for the core C API with runtime capability detection.
 *  - `textlane.hpp` - umbrella header for the C++ API.
 *
 *  Every operation has a `_serial` reference implementation and ISA-specific backends with the same semantics.
 *  All of them are byte-for-byte equivalent, and the tail of every input shorter than a SIMD lane
 *  is always processed by the serial backend.
 *
 *  @section Compilation Settings
 *
 *  Consider overriding the following macros to customize the library:
 *
 *  - `TL_DEBUG=0` - whether to enable debug assertions.
 *  - `TL_AVOID_LIBC=0` - whether to avoid including the standard C library headers.
 *  - `TL_DYNAMIC_DISPATCH=0` - whether to use runtime dispatching of the most advanced SIMD backend.
 *
 *  Different generations of CPUs and SIMD capabilities can be enabled or disabled with the following macros:
 *
 *  - `TL_USE_WESTMERE=?` - whether to use SSE4.1 instructions on x86_64.
 *  - `TL_USE_HASWELL=?` - whether to use AVX2 instructions on x86_64.
 *  - `TL_USE_NEON=?` - whether to use NEON instructions on ARM.
 *
 *  The shared library, compiled with `TL_DYNAMIC_DISPATCH=1`, also honors the `TL_CAPABILITIES`
 *  environment variable at load time. It takes a comma-separated list of capability names, like
 *  `TL_CAPABILITIES=serial` or `TL_CAPABILITIES=serial,westmere`, to restrict the backends in use.
 */
#ifndef TEXTLANE_H_
#define TEXTLANE_H_

#define TEXTLANE_H_VERSION_MAJOR 1
#define TEXTLANE_H_VERSION_MINOR 0
#define TEXTLANE_H_VERSION_PATCH 0

#include "types.h"      // `tl_size_t`, `tl_bool_t`, `tl_capability_t`
#include "ascii_case.h" // `tl_to_upper`, `tl_to_lower`
#include "utf8.h"       // `tl_utf8_valid`, `tl_utf8_count`, `tl_utf8_find_invalid`

/* Inferring target OS: Windows, MacOS, or Linux */
#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__) || defined(__CYGWIN__)
#define TL_IS_WINDOWS_ 1
#elif defined(__APPLE__) && defined(__MACH__)
#define TL_IS_APPLE_ 1
#elif defined(__linux__)
#define TL_IS_LINUX_ 1
#endif

/* On Apple Silicon, `mrs` is not allowed in user-space, so we need to use the `sysctl` API */
#if defined(TL_IS_APPLE_)
#include <sys/sysctl.h>
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 *  @brief Internal helper function to convert SIMD capabilities to an array of string pointers.
 *  @param[in] caps The capabilities bitfield
 *  @param[out] strings Output array to store string pointers (should have `TL_CAPABILITIES_COUNT` slots)
 *  @param[in] max_count Maximum number of strings to output
 *  @return Number of capability strings written to the array
 */
TL_INTERNAL tl_size_t tl_capabilities_to_strings_implementation_(tl_capability_t caps, char const **strings,
                                                                 tl_size_t max_count) {
    struct {
        tl_capability_t flag;
        char const *name;
    } capability_map[] = {
        {tl_cap_serial_k, "serial"},
        {tl_cap_westmere_k, "westmere"},
        {tl_cap_haswell_k, "haswell"},
        {tl_cap_neon_k, "neon"},
    };
    int const capabilities_count = sizeof(capability_map) / sizeof(capability_map[0]);

    tl_size_t count = 0;
    for (int i = 0; i < capabilities_count && count < max_count; i++)
        if (caps & capability_map[i].flag) strings[count++] = capability_map[i].name;

    return count;
}

/**
 *  @brief Internal helper to map a single capability name to its flag.
 *  @param[in] name Capability name, like "serial", "haswell", or "any".
 *  @param[in] name_end End of the name, or `NULL` if the @p name is NULL-terminated.
 *  @return `tl_caps_none_k` if unknown name, or a valid capability flag.
 */
TL_INTERNAL tl_capability_t tl_capability_from_string_implementation_(char const *name, char const *name_end) {
    if (tl_equal_null_terminated_(name, name_end, "serial") == tl_true_k) return tl_cap_serial_k;
    if (tl_equal_null_terminated_(name, name_end, "westmere") == tl_true_k) return tl_cap_westmere_k;
    if (tl_equal_null_terminated_(name, name_end, "haswell") == tl_true_k) return tl_cap_haswell_k;
    if (tl_equal_null_terminated_(name, name_end, "neon") == tl_true_k) return tl_cap_neon_k;
    if (tl_equal_null_terminated_(name, name_end, "any") == tl_true_k) return tl_cap_any_k;
    return tl_caps_none_k;
}

/**
 *  @brief Internal helper to parse a comma-separated list of capability names, like "serial,haswell".
 *  @return Union of the named flags, or `tl_caps_none_k` if any of the names is unknown or empty.
 */
TL_INTERNAL tl_capability_t tl_capabilities_from_string_implementation_(char const *names) {
    if (!names || *names == '\0') return tl_caps_none_k;
    unsigned caps = tl_caps_none_k;
    char const *name = names;
    for (;;) {
        char const *name_end = name;
        while (*name_end != '\0' && *name_end != ',') ++name_end;
        tl_capability_t cap = tl_capability_from_string_implementation_(name, name_end);
        if (cap == tl_caps_none_k) return tl_caps_none_k;
        caps |= (unsigned)cap;
        if (*name_end == '\0') break;
        name = name_end + 1;
    }
    return (tl_capability_t)caps;
}

/**
 *  @brief Internal helper function to convert SIMD capabilities to a comma-separated string.
 *  @note  Returns a pointer to a static buffer, overwritten by every call.
 */
TL_INTERNAL tl_cptr_t tl_capabilities_to_string_implementation_(tl_capability_t caps) {

    static char buf[64];
    char *p = buf;
    char *const end = buf + sizeof(buf);

    char const *cap_strings[TL_CAPABILITIES_COUNT];
    tl_size_t cap_count = tl_capabilities_to_strings_implementation_(caps, cap_strings, TL_CAPABILITIES_COUNT);

    for (tl_size_t i = 0; i < cap_count; i++) {
        if (i > 0 && p < end - 1) *p++ = ',';
        char const *s = cap_strings[i];
        while (*s && p < end - 1) *p++ = *s++;
    }

    *p = '\0';
    return buf;
}

/**
 *  @brief  Lane width of the widest backend, compiled into this translation unit, allowed by @p caps.
 *          Handy to pick buffer lengths that stress the boundary between the SIMD and the serial tails.
 */
TL_PUBLIC tl_size_t tl_capability_lane_width(tl_capability_t caps) {
#if TL_USE_HASWELL
    if (caps & tl_cap_haswell_k) return TL_HASWELL_LANE_WIDTH;
#endif
#if TL_USE_WESTMERE
    if (caps & tl_cap_westmere_k) return TL_WESTMERE_LANE_WIDTH;
#endif
#if TL_USE_NEON
    if (caps & tl_cap_neon_k) return TL_NEON_LANE_WIDTH;
#endif
    tl_unused_(caps);
    return TL_SERIAL_LANE_WIDTH;
}

#if TL_IS_64BIT_ARM_

/**
 *  @brief  Function to determine the SIMD capabilities of the current 64-bit Arm machine at @b runtime.
 *  @return A bitmask of the SIMD capabilities represented as a `tl_capability_t` enum value.
 */
TL_PUBLIC tl_capability_t tl_capabilities_implementation_arm_(void) {
#if !TL_USE_NEON
    // Nothing to dispatch to, if the NEON backend isn't compiled in.
    return tl_cap_serial_k;

#elif defined(TL_IS_APPLE_)

    // On Apple Silicon, `mrs` is not allowed in user-space, so we need to use the `sysctl` API.
    uint32_t supports_neon = 0;
    size_t size = sizeof(supports_neon);
    if (sysctlbyname("hw.optional.neon", &supports_neon, &size, NULL, 0) != 0) supports_neon = 0;

    return (tl_capability_t)(              //
        (tl_cap_neon_k * (supports_neon)) | //
        (tl_cap_serial_k));

#elif defined(TL_IS_LINUX_)

    unsigned long id_aa64pfr0_el1 = 0;
    unsigned supports_neon = 0;

    // https://developer.arm.com/documentation/ddi0601/2024-03/AArch64-Registers/ID-AA64PFR0-EL1--AArch64-Processor-Feature-Register-0?lang=en
    __asm__ __volatile__("mrs %0, ID_AA64PFR0_EL1" : "=r"(id_aa64pfr0_el1));

    // AdvSIMD, bits [23:20] of ID_AA64PFR0_EL1, where 0b1111 means NEON is not implemented.
    // It's important to check in case we are running on R-profile CPUs.
    supports_neon = ((id_aa64pfr0_el1 >> 20) & 0xF) != 0xF;

    return (tl_capability_t)(              //
        (tl_cap_neon_k * (supports_neon)) | //
        (tl_cap_serial_k));

#else // if !defined(TL_IS_APPLE_) && !defined(TL_IS_LINUX_)
    return tl_cap_serial_k;
#endif
}

#endif // TL_IS_64BIT_ARM_

#if TL_IS_64BIT_X86_

/**
 *  @brief  Function to determine the SIMD capabilities of the current 64-bit x86 machine at @b runtime.
 *  @return A bitmask of the SIMD capabilities represented as a `tl_capability_t` enum value.
 */
TL_PUBLIC tl_capability_t tl_capabilities_implementation_x86_(void) {

#if TL_USE_WESTMERE || TL_USE_HASWELL

    /// The states of 4 registers populated for a specific "cpuid" assembly call
    union four_registers_t {
        int array[4];
        struct separate_t {
            unsigned eax, ebx, ecx, edx;
        } named;
    } info1, info7;

#if defined(_MSC_VER)
    __cpuidex(info1.array, 1, 0);
    __cpuidex(info7.array, 7, 0);
#else
    __asm__ __volatile__( //
        "cpuid"
        : "=a"(info1.named.eax), "=b"(info1.named.ebx), "=c"(info1.named.ecx), "=d"(info1.named.edx)
        : "a"(1), "c"(0));
    __asm__ __volatile__( //
        "cpuid"
        : "=a"(info7.named.eax), "=b"(info7.named.ebx), "=c"(info7.named.ecx), "=d"(info7.named.edx)
        : "a"(7), "c"(0));
#endif

    // SSE4.1 state is always saved by the OS, unlike the wider AVX registers
    unsigned supports_sse41 = (info1.named.ecx & (1u << 19)) != 0;
    unsigned supports_popcnt = (info1.named.ecx & (1u << 23)) != 0;

    // Gate AVX on OS-enabled extended state (XGETBV)
    unsigned has_osxsave = (info1.named.ecx & (1u << 27)) != 0;
    unsigned has_avx = (info1.named.ecx & (1u << 28)) != 0;

    unsigned long long xcr0 = 0;
    if (has_osxsave) {
#if defined(_MSC_VER)
        xcr0 = _xgetbv(0);
#else
        unsigned eax, edx;
        __asm__ __volatile__(".byte 0x0f, 0x01, 0xd0" : "=a"(eax), "=d"(edx) : "c"(0)); // xgetbv
        xcr0 = ((unsigned long long)edx << 32) | eax;
#endif
    }
    unsigned os_avx_enabled = has_osxsave && has_avx && ((xcr0 & 0x6u) == 0x6u); // XMM+YMM

    // Check for AVX2, BMI1, and BMI2 (Function ID 7), masked by OS state
    // https://github.com/llvm/llvm-project/blob/50598f0ff44f3a4e75706f8c53f3380fe7faa896/clang/lib/Headers/cpuid.h#L148
    unsigned supports_avx2 = os_avx_enabled && ((info7.named.ebx & 0x00000020u) != 0);
    unsigned supports_bmi1 = (info7.named.ebx & 0x00000008u) != 0;
    unsigned supports_bmi2 = (info7.named.ebx & 0x00000100u) != 0;

    return (tl_capability_t)(                                                               //
        (tl_cap_westmere_k * (supports_sse41 && supports_popcnt)) |                         //
        (tl_cap_haswell_k * (supports_avx2 && supports_bmi1 && supports_bmi2 && supports_popcnt)) | //
        (tl_cap_serial_k));
#else
    return tl_cap_serial_k;
#endif
}

#endif // TL_IS_64BIT_X86_

/**
 *  @brief Function to determine the SIMD capabilities of the current machine at @b runtime.
 *  @return A bitmask of the SIMD capabilities represented as a `tl_capability_t` enum value.
 */
TL_PUBLIC tl_capability_t tl_capabilities_implementation_(void) {
#if TL_IS_64BIT_X86_
    return tl_capabilities_implementation_x86_();
#elif TL_IS_64BIT_ARM_
    return tl_capabilities_implementation_arm_();
#else
    return tl_cap_serial_k;
#endif
}

#if TL_DYNAMIC_DISPATCH

TL_DYNAMIC int tl_dynamic_dispatch(void);
TL_DYNAMIC int tl_version_major(void);
TL_DYNAMIC int tl_version_minor(void);
TL_DYNAMIC int tl_version_patch(void);
TL_DYNAMIC tl_capability_t tl_capabilities(void);
TL_DYNAMIC tl_cptr_t tl_capabilities_to_string(tl_capability_t caps);
TL_DYNAMIC tl_capability_t tl_capabilities_from_string(char const *names);
TL_DYNAMIC void tl_dispatch_table_update(tl_capability_t caps);

/**
 *  @brief  Reports the backend behind the dispatched functions, like `tl_to_upper` or `tl_utf8_count`.
 *  @return A single capability flag, always one of the flags in `tl_capabilities()`.
 */
TL_DYNAMIC tl_capability_t tl_dispatch_table_capability(void);

#else

TL_PUBLIC int tl_dynamic_dispatch(void) { return 0; }
TL_PUBLIC int tl_version_major(void) { return TEXTLANE_H_VERSION_MAJOR; }
TL_PUBLIC int tl_version_minor(void) { return TEXTLANE_H_VERSION_MINOR; }
TL_PUBLIC int tl_version_patch(void) { return TEXTLANE_H_VERSION_PATCH; }
TL_PUBLIC tl_capability_t tl_capabilities(void) { return tl_capabilities_implementation_(); }
TL_PUBLIC tl_cptr_t tl_capabilities_to_string(tl_capability_t caps) {
    return tl_capabilities_to_string_implementation_(caps);
}
TL_PUBLIC tl_capability_t tl_capabilities_from_string(char const *names) {
    return tl_capabilities_from_string_implementation_(names);
}
TL_PUBLIC void tl_dispatch_table_update(tl_capability_t caps) { tl_unused_(caps); } // No-op in non-dynamic builds

TL_PUBLIC tl_capability_t tl_dispatch_table_capability(void) {
#if TL_USE_HASWELL
    return tl_cap_haswell_k;
#elif TL_USE_WESTMERE
    return tl_cap_westmere_k;
#elif TL_USE_NEON
    return tl_cap_neon_k;
#else
    return tl_cap_serial_k;
#endif
}

#endif

#ifdef __cplusplus
}
#endif // __cplusplus

#endif // TEXTLANE_H_
