/**
 *  @brief  Shared definitions for the TextLane C++ library.
 *  @file   types.hpp
 *
 *  Provides the primitive type aliases for the @b "types.h" header in the `textlane` namespace:
 *
 *  - `u8_t`, `u32_t`, `u64_t` - sized integers.
 *  - `size_t`, `ptr_t`, `cptr_t` - address-related types.
 *  - `status_t`, `bool_t`, `capability_t` - for logic.
 */
#ifndef TEXTLANE_TYPES_HPP_
#define TEXTLANE_TYPES_HPP_

#include "types.h"

/**
 *  @brief  When set to 1, the library will include the C++ STL headers and implement
 *          automatic conversion from and to `std::string_view` and `std::string`,
 *          as well as exception-throwing variants of the validating functions.
 */
#ifndef TL_AVOID_STL
#define TL_AVOID_STL (0) // true or false
#endif

/*  We need to detect the version of the C++ language we are compiled with.
 *  This will affect recent features like `std::string_view` and `constexpr` on STL members.
 */
#if __cplusplus >= 202002L
#define TL_IS_CPP20_ 1
#else
#define TL_IS_CPP20_ 0
#endif
#if __cplusplus >= 201703L
#define TL_IS_CPP17_ 1
#else
#define TL_IS_CPP17_ 0
#endif
#if __cplusplus >= 201402L
#define TL_IS_CPP14_ 1
#else
#define TL_IS_CPP14_ 0
#endif
#if __cplusplus >= 201103L
#define TL_IS_CPP11_ 1
#else
#define TL_IS_CPP11_ 0
#endif

/**
 *  @brief  Expands to `constexpr` in C++14 and later, and to nothing in C++11.
 *          Useful for functions with loops, as C++11 `constexpr` functions must consist of a single `return`.
 */
#if TL_IS_CPP14_
#define tl_constexpr_if_cpp14 constexpr
#else
#define tl_constexpr_if_cpp14
#endif

/**
 *  @brief  Expands to `constexpr` in C++20 and later, and to nothing in older C++ versions.
 *          Useful for STL conversion operators, as several `std::string` members are `constexpr` in C++20.
 */
#if TL_IS_CPP20_
#define tl_constexpr_if_cpp20 constexpr
#else
#define tl_constexpr_if_cpp20
#endif

namespace textlane {

using u8_t = tl_u8_t;
using u32_t = tl_u32_t;
using u64_t = tl_u64_t;
using size_t = tl_size_t;

using ptr_t = tl_ptr_t;
using cptr_t = tl_cptr_t;

using bool_t = tl_bool_t;
using capability_t = tl_capability_t;

/** @sa tl_status_t */
enum class status_t : int {
    success_k = tl_success_k,
    invalid_utf8_k = tl_invalid_utf8_k,
    unknown_k = tl_status_unknown_k,
};

} // namespace textlane

#endif // TEXTLANE_TYPES_HPP_
