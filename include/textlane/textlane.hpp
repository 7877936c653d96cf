/**
 *  @brief  TextLane C++ wrapper over the C 99 core, adding STL interoperability and exceptions.
 *
 *  This implementation is aiming to be compatible with C++11, adding `std::string_view` support in C++17.
 *  By default, it includes C++ STL headers, but that can be avoided with `TL_AVOID_STL=1`.
 *
 *  Exposes the same operations in two forms:
 *
 *  - free functions: `to_upper`, `to_lower`, `utf8_valid`, `utf8_validate`, `try_utf8_validate`,
 *    `utf8_count`, and `utf8_find_invalid`,
 *  - members of the `text_view` and `text_span` non-owning slices, forwarding to the free functions.
 *
 *  @code{.cpp}
 *      #include <textlane/textlane.hpp>
 *      namespace tl = textlane;
 *
 *      std::string text = "Größe";
 *      tl::to_upper(text);                        // "GRößE", non-ASCII bytes are kept as is
 *      std::size_t chars = tl::utf8_count(text);  // 5
 *      tl::text_view(text).utf8_validate();       // throws `std::invalid_argument` on malformed input
 *  @endcode
 *
 *  @file   textlane.hpp
 */
#ifndef TEXTLANE_HPP_
#define TEXTLANE_HPP_

#include "types.hpp"

#include <cstddef>     // `std::size_t`, `std::nullptr_t`
#include <type_traits> // `std::enable_if`, `std::is_const`

#if !TL_AVOID_STL
#include <stdexcept> // `std::invalid_argument`
#include <string>    // `std::string`
#if TL_IS_CPP17_ && defined(__cpp_lib_string_view)
#include <string_view> // `std::string_view`
#endif
#endif

#include <textlane/textlane.h>

namespace textlane {

template <typename>
class basic_text_slice;

using text_span = basic_text_slice<char>;
using text_view = basic_text_slice<char const>;

#pragma region Helper Types

#if !TL_AVOID_STL
/**
 *  @brief  Converts a non-successful @p status into the matching C++ exception.
 *  @throw  `std::invalid_argument` for `status_t::invalid_utf8_k`.
 */
inline void raise(status_t status) noexcept(false) {
    switch (status) {
    case status_t::invalid_utf8_k: throw std::invalid_argument("Invalid UTF-8 string");
    default: break;
    }
}
#endif

inline tl_constexpr_if_cpp14 std::size_t null_terminated_length(char const *c_string) noexcept {
    char const *end = c_string;
    while (*end) ++end;
    return static_cast<std::size_t>(end - c_string);
}

#pragma endregion

#pragma region Global Operations

inline capability_t capabilities() noexcept { return tl_capabilities(); }

/** @brief Converts lowercase ASCII letters to uppercase @b in-place. @sa tl_to_upper */
inline void to_upper(char *text, std::size_t length) noexcept { tl_to_upper(text, length); }

/** @brief Converts uppercase ASCII letters to lowercase @b in-place. @sa tl_to_lower */
inline void to_lower(char *text, std::size_t length) noexcept { tl_to_lower(text, length); }

inline void to_upper(text_span text) noexcept;
inline void to_lower(text_span text) noexcept;
inline bool utf8_valid(text_view text) noexcept;
inline status_t try_utf8_validate(text_view text) noexcept;
inline std::size_t utf8_count(text_view text) noexcept;
inline std::size_t utf8_find_invalid(text_view text) noexcept;
#if !TL_AVOID_STL
inline void utf8_validate(text_view text) noexcept(false);
#endif

#pragma endregion

/**
 *  @brief  A non-owning slice of a byte buffer, extending it with the TextLane operations.
 *          Read-only operations are available on both views and spans, while in-place case
 *          conversions are only available on mutable spans.
 *
 *  @tparam char_type_ The character type, usually `char const` or `char`. Must be a single byte long.
 */
template <typename char_type_>
class basic_text_slice {

    static_assert(sizeof(char_type_) == 1, "Characters must be a single byte long");
    static_assert(std::is_reference<char_type_>::value == false, "Characters can't be references");

    using char_type = char_type_;
    using mutable_char_type = typename std::remove_const<char_type_>::type;
    using immutable_char_type = typename std::add_const<char_type_>::type;

    char_type *start_;
    std::size_t length_;

  public:
    using value_type = mutable_char_type;
    using pointer = char_type *;
    using const_pointer = immutable_char_type *;
    using iterator = pointer;
    using const_iterator = const_pointer;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    using text_slice = basic_text_slice<char_type>;
    using text_span = basic_text_slice<mutable_char_type>;
    using text_view = basic_text_slice<immutable_char_type>;

    /** @brief Special value for missing matches, like a well-formed input in `utf8_find_invalid`. */
    static constexpr size_type npos = static_cast<size_type>(-1);

#pragma region Constructors and STL Utilities

    constexpr basic_text_slice() noexcept : start_(nullptr), length_(0) {}
    tl_constexpr_if_cpp14 basic_text_slice(pointer c_string) noexcept
        : start_(c_string), length_(null_terminated_length(c_string)) {}
    constexpr basic_text_slice(pointer c_string, size_type length) noexcept : start_(c_string), length_(length) {}

    basic_text_slice(basic_text_slice const &other) noexcept = default;
    basic_text_slice &operator=(basic_text_slice const &other) noexcept = default;
    basic_text_slice(std::nullptr_t) = delete;

    /** @brief Any mutable span can be viewed as an immutable one. */
    template <typename sfinae_ = char_type, typename std::enable_if<std::is_const<sfinae_>::value, int>::type = 0>
    constexpr basic_text_slice(text_span const &other) noexcept : start_(other.data()), length_(other.size()) {}

#if !TL_AVOID_STL

    template <typename sfinae_ = char_type, typename std::enable_if<std::is_const<sfinae_>::value, int>::type = 0>
    tl_constexpr_if_cpp20 basic_text_slice(std::string const &other) noexcept
        : basic_text_slice(other.data(), other.size()) {}

    template <typename sfinae_ = char_type, typename std::enable_if<!std::is_const<sfinae_>::value, int>::type = 0>
    tl_constexpr_if_cpp20 basic_text_slice(std::string &other) noexcept
        : basic_text_slice(&other[0], other.size()) {} // The `.data()` has mutable variant only since C++17

    operator std::string() const { return {data(), size()}; }

#if TL_IS_CPP17_ && defined(__cpp_lib_string_view)

    template <typename sfinae_ = char_type, typename std::enable_if<std::is_const<sfinae_>::value, int>::type = 0>
    constexpr basic_text_slice(std::string_view const &other) noexcept
        : basic_text_slice(other.data(), other.size()) {}

    operator std::string_view() const noexcept { return {data(), size()}; }

#endif

#endif

#pragma endregion

#pragma region Element Access

    iterator begin() const noexcept { return start_; }
    iterator end() const noexcept { return start_ + length_; }
    const_iterator cbegin() const noexcept { return start_; }
    const_iterator cend() const noexcept { return start_ + length_; }
    pointer data() const noexcept { return start_; }
    size_type size() const noexcept { return length_; }
    size_type length() const noexcept { return length_; }
    bool empty() const noexcept { return length_ == 0; }

#pragma endregion

#pragma region UTF-8 Analysis

    /** @brief Checks if the slice is well-formed UTF-8. @sa tl_utf8_valid */
    bool utf8_valid() const noexcept { return textlane::utf8_valid(*this); }

    /** @brief Number of UTF-8 characters in the longest valid prefix. @sa tl_utf8_count */
    size_type utf8_count() const noexcept { return textlane::utf8_count(*this); }

    /** @brief Offset of the first malformed or truncated sequence, or `npos`. @sa tl_utf8_find_invalid */
    size_type utf8_find_invalid() const noexcept { return textlane::utf8_find_invalid(*this); }

    /** @brief Reports malformed UTF-8 with a status code, without throwing. */
    status_t try_utf8_validate() const noexcept { return textlane::try_utf8_validate(*this); }

#if !TL_AVOID_STL
    /** @throw `std::invalid_argument` if the slice is not well-formed UTF-8. */
    void utf8_validate() const noexcept(false) { textlane::utf8_validate(*this); }
#endif

#pragma endregion

#pragma region Modifiers

    /** @brief Converts lowercase ASCII letters to uppercase @b in-place. */
    template <typename sfinae_ = char_type, typename std::enable_if<!std::is_const<sfinae_>::value, int>::type = 0>
    text_slice &to_upper() noexcept {
        textlane::to_upper(*this);
        return *this;
    }

    /** @brief Converts uppercase ASCII letters to lowercase @b in-place. */
    template <typename sfinae_ = char_type, typename std::enable_if<!std::is_const<sfinae_>::value, int>::type = 0>
    text_slice &to_lower() noexcept {
        textlane::to_lower(*this);
        return *this;
    }

#pragma endregion
};

template <typename char_type_>
constexpr typename basic_text_slice<char_type_>::size_type basic_text_slice<char_type_>::npos;

#pragma region Global Operations

inline void to_upper(text_span text) noexcept { tl_to_upper(text.data(), text.size()); }
inline void to_lower(text_span text) noexcept { tl_to_lower(text.data(), text.size()); }

inline bool utf8_valid(text_view text) noexcept { return tl_utf8_valid(text.data(), text.size()) == tl_true_k; }

inline std::size_t utf8_count(text_view text) noexcept { return tl_utf8_count(text.data(), text.size()); }

inline std::size_t utf8_find_invalid(text_view text) noexcept {
    tl_cptr_t invalid = tl_utf8_find_invalid(text.data(), text.size());
    return invalid ? static_cast<std::size_t>(invalid - text.data()) : text_view::npos;
}

inline status_t try_utf8_validate(text_view text) noexcept {
    return utf8_valid(text) ? status_t::success_k : status_t::invalid_utf8_k;
}

#if !TL_AVOID_STL

/**
 *  @brief  Validates the @p text, reporting malformed input with an exception.
 *  @throw  `std::invalid_argument` if the @p text is not well-formed UTF-8.
 */
inline void utf8_validate(text_view text) noexcept(false) { raise(try_utf8_validate(text)); }

inline void to_upper(std::string &text) noexcept { to_upper(text_span(text)); }
inline void to_lower(std::string &text) noexcept { to_lower(text_span(text)); }

#endif

#pragma endregion

namespace literals {
constexpr text_view operator""_tv(char const *str, std::size_t length) noexcept { return {str, length}; }
} // namespace literals

} // namespace textlane

#endif // TEXTLANE_HPP_
