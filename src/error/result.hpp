#pragma once

#include <expected>

#include "./err.hpp"

namespace lox {

template <typename T>
using Result = std::expected<T, err::msg>;

} // namespace lox
