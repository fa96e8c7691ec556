#include "value.hpp"

#include <type_traits>

#include "../utility/utility.hpp"

namespace lox
{
bool operator==(const Value &lhs, const Value &rhs)
{
    if (lhs.index() != rhs.index())
        return false;

    return std::visit(
    [&](auto &&l_val) -> bool
    {
        using T = std::decay_t<decltype(l_val)>;
        auto &&r_val = std::get<T>(rhs);

        if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, std::monostate>)
        {
            return true;  // nil == nil, unassigned == unassigned
        }
        else
        {
            return l_val == r_val;
        }
    },
    lhs);
}

bool is_truthy(const Value &value)
{
    if (is_nil(value))
        return false;
    if (is_bool(value))
        return get_bool(value);
    return true;
}

std::string value_to_string(const Value &value)
{
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) return util::number_to_string(v);
            else if constexpr (std::is_same_v<T, bool>) return v ? "true" : "false";
            else if constexpr (std::is_same_v<T, std::string>) return v;
            else if constexpr (std::is_same_v<T, std::nullptr_t>) return "nil";
            else return "unassigned";
        },
        value);
}

Value literal_to_value(const lex::Literal &literal)
{
    if (const double *number = std::get_if<double>(&literal))
        return *number;
    if (const std::string *text = std::get_if<std::string>(&literal))
        return *text;
    return nullptr;
}

}  // namespace lox
