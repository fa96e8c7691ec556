#pragma once
#include <concepts>
#include <expected>
#include <utility>

/**
 * @brief Concept to detect Result-like types (has value(), error(), has_value())
 */
template <typename T>
concept ResultLike = requires(T t) {
    { t.has_value() } -> std::convertible_to<bool>;
    { t.error() };
    { t.value() };
};

/**
 * @brief Propagates the error of a lox::Result from the enclosing function.
 * Evaluates to the unwrapped value on success (GNU statement expression).
 */
#define __Try(expr) \
({ \
    auto&& __res = (expr); \
    static_assert(ResultLike<decltype(__res)>, "__Try expects a Result-like type"); \
    if (!__res) return std::unexpected(std::move(__res.error())); \
    std::move(__res.value()); \
})

/**
 * @brief For Result<void> and for results whose value is not needed.
 */
#define __TryVoid(expr) \
do { \
    auto&& __res = (expr); \
    static_assert(ResultLike<decltype(__res)>, "__TryVoid expects a Result-like type"); \
    if (!__res) return std::unexpected(std::move(__res.error())); \
} while(0)
