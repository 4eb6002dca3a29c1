/// @file value.hpp
/// @brief Block attribute values and variant helpers.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace docpatch {

/// Represents a JSON null attribute value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A scalar block attribute (heading level, list start, code language).
///
/// Alternatives: Null, bool, int64_t, double, string.
using AttrValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string
>;

/// Block attributes keyed by name, ordered for deterministic output.
using Attrs = std::map<std::string, AttrValue>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const ReplaceEdit& e) { ... },
///     [](const auto&) { ... },
/// }, edit);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed attribute extraction -----------------------------------------------

/// Extract a typed attribute, or nullopt if missing or of another type.
/// @code
/// auto level = get_attr<std::int64_t>(node.attrs, "level");
/// @endcode
template <typename T>
auto get_attr(const Attrs& attrs, const std::string& name) -> std::optional<T> {
    auto it = attrs.find(name);
    if (it == attrs.end()) return std::nullopt;
    if (const auto* t = std::get_if<T>(&it->second)) {
        return *t;
    }
    return std::nullopt;
}

}  // namespace docpatch
