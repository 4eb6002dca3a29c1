/// @file mark.hpp
/// @brief Inline formatting marks and the MarkSet carried by text runs.

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

namespace docpatch {

/// The inline formatting marks a text run can carry.
enum class MarkType : std::uint8_t {
    bold,
    italic,
    underline,
    code,
    strike,
};

/// Convert a MarkType to its schema name.
constexpr auto to_string_view(MarkType type) noexcept -> std::string_view {
    switch (type) {
        case MarkType::bold:      return "bold";
        case MarkType::italic:    return "italic";
        case MarkType::underline: return "underline";
        case MarkType::code:      return "code";
        case MarkType::strike:    return "strike";
    }
    return "unknown";
}

/// Parse a schema mark name. Returns nullopt for unsupported names.
auto parse_mark_type(std::string_view name) -> std::optional<MarkType>;

/// An ordered set of marks without duplicates.
///
/// Stored as a bit set so that iteration order is the enum order no
/// matter in which order marks were added; two runs with the same marks
/// always compare equal.
class MarkSet {
public:
    constexpr MarkSet() = default;

    /// Construct from a list of marks (duplicates collapse).
    MarkSet(std::initializer_list<MarkType> marks) {
        for (auto m : marks) add(m);
    }

    constexpr void add(MarkType m) noexcept { bits_ |= bit(m); }
    constexpr void remove(MarkType m) noexcept { bits_ &= static_cast<std::uint8_t>(~bit(m)); }
    constexpr auto contains(MarkType m) const noexcept -> bool { return (bits_ & bit(m)) != 0; }
    constexpr auto empty() const noexcept -> bool { return bits_ == 0; }

    /// The marks in deterministic (enum) order.
    auto to_vector() const -> std::vector<MarkType>;

    /// Union of two sets.
    constexpr auto operator|(MarkSet other) const noexcept -> MarkSet {
        auto result = *this;
        result.bits_ |= other.bits_;
        return result;
    }

    auto operator==(const MarkSet&) const -> bool = default;

private:
    static constexpr auto bit(MarkType m) noexcept -> std::uint8_t {
        return static_cast<std::uint8_t>(1u << static_cast<unsigned>(m));
    }

    std::uint8_t bits_{0};
};

}  // namespace docpatch
