#ifndef PLIST_HPP
#define PLIST_HPP

#include <cstdint>      // for int64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for pair
#include <variant>      // for variant, monostate
#include <vector>       // for vector

namespace swapcore::plist {

/// @brief Generic property-list tree node.
struct Value final {
    using Array      = std::vector<Value>;
    using Dictionary = std::vector<std::pair<std::string, Value>>;

    std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Dictionary> data{};

    [[nodiscard]] auto is_dict() const noexcept -> bool { return std::holds_alternative<Dictionary>(data); }
    [[nodiscard]] auto is_array() const noexcept -> bool { return std::holds_alternative<Array>(data); }

    /// @return true for std::monostate and for empty dictionaries/arrays.
    [[nodiscard]] auto empty() const noexcept -> bool;

    /// @brief Dictionary lookup.
    /// @return nullptr when this is not a dictionary or the key is missing.
    [[nodiscard]] auto find(std::string_view key) const noexcept -> const Value*;

    /// @brief Nested dictionary lookup with '.' separated keys, e.g "VolumeInfo.BootFromThisVolume".
    [[nodiscard]] auto find_path(std::string_view dotted_path) const noexcept -> const Value*;

    [[nodiscard]] auto as_bool() const noexcept -> std::optional<bool>;
    [[nodiscard]] auto as_integer() const noexcept -> std::optional<std::int64_t>;
    [[nodiscard]] auto as_string() const noexcept -> std::optional<std::string_view>;
};

/// @brief Parses an XML property list.
/// @param xml_content The XML document (e.g output of `diskutil info -plist`).
/// @return The root node, or an empty dictionary when the document cannot be parsed.
auto parse_plist(std::string_view xml_content) noexcept -> Value;

/// @brief Convenience lookups on a dictionary, std::nullopt when missing or mistyped.
auto get_bool(const Value& root, std::string_view dotted_path) noexcept -> std::optional<bool>;
auto get_string(const Value& root, std::string_view dotted_path) noexcept -> std::optional<std::string>;
auto get_integer(const Value& root, std::string_view dotted_path) noexcept -> std::optional<std::int64_t>;

}  // namespace swapcore::plist

#endif  // PLIST_HPP
