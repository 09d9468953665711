#include "swapcore/plist.hpp"
#include "swapcore/string_utils.hpp"

#include <bit>        // for bit_cast
#include <charconv>   // for from_chars
#include <cstdlib>    // for strtod
#include <exception>  // for exception
#include <memory>     // for unique_ptr
#include <utility>    // for move

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using Value = swapcore::plist::Value;

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};

auto node_name(const xmlNode* node) noexcept -> std::string_view {
    return std::string_view{std::bit_cast<const char*>(node->name)};
}

auto node_text(const xmlNode* node) -> std::string {
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return {};
    }
    std::string text{std::bit_cast<const char*>(content)};
    xmlFree(content);
    return text;
}

auto next_element(const xmlNode* node) noexcept -> const xmlNode* {
    while (node != nullptr && node->type != XML_ELEMENT_NODE) {
        node = node->next;
    }
    return node;
}

// NOLINTNEXTLINE(misc-no-recursion)
auto parse_node(const xmlNode* node) -> Value {
    const auto name = node_name(node);
    if (name == "dict"sv) {
        Value::Dictionary dict{};
        const xmlNode* child = next_element(node->children);
        while (child != nullptr) {
            if (node_name(child) != "key"sv) {
                child = next_element(child->next);
                continue;
            }
            auto key          = node_text(child);
            const auto* value = next_element(child->next);
            if (value == nullptr) {
                break;
            }
            dict.emplace_back(std::move(key), parse_node(value));
            child = next_element(value->next);
        }
        return Value{.data = std::move(dict)};
    }
    if (name == "array"sv) {
        Value::Array array{};
        for (const xmlNode* child = next_element(node->children); child != nullptr; child = next_element(child->next)) {
            array.emplace_back(parse_node(child));
        }
        return Value{.data = std::move(array)};
    }
    if (name == "true"sv) {
        return Value{.data = true};
    }
    if (name == "false"sv) {
        return Value{.data = false};
    }
    if (name == "integer"sv) {
        const auto text = node_text(node);
        const auto trimmed = swapcore::utils::trim(text);
        std::int64_t number{0};
        std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
        return Value{.data = number};
    }
    if (name == "real"sv) {
        const auto text = node_text(node);
        return Value{.data = std::strtod(text.c_str(), nullptr)};
    }
    // string, date, data: kept verbatim
    return Value{.data = node_text(node)};
}

}  // namespace

namespace swapcore::plist {

auto Value::empty() const noexcept -> bool {
    if (std::holds_alternative<std::monostate>(data)) {
        return true;
    }
    if (const auto* dict = std::get_if<Dictionary>(&data)) {
        return dict->empty();
    }
    if (const auto* array = std::get_if<Array>(&data)) {
        return array->empty();
    }
    return false;
}

auto Value::find(std::string_view key) const noexcept -> const Value* {
    const auto* dict = std::get_if<Dictionary>(&data);
    if (dict == nullptr) {
        return nullptr;
    }
    for (const auto& [entry_key, entry_value] : *dict) {
        if (entry_key == key) {
            return &entry_value;
        }
    }
    return nullptr;
}

auto Value::find_path(std::string_view dotted_path) const noexcept -> const Value* {
    const Value* node = this;
    for (auto&& key : utils::make_split_view(dotted_path, '.')) {
        node = node->find(key);
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

auto Value::as_bool() const noexcept -> std::optional<bool> {
    if (const auto* value = std::get_if<bool>(&data)) {
        return *value;
    }
    return std::nullopt;
}

auto Value::as_integer() const noexcept -> std::optional<std::int64_t> {
    if (const auto* value = std::get_if<std::int64_t>(&data)) {
        return *value;
    }
    return std::nullopt;
}

auto Value::as_string() const noexcept -> std::optional<std::string_view> {
    if (const auto* value = std::get_if<std::string>(&data)) {
        return std::string_view{*value};
    }
    return std::nullopt;
}

auto parse_plist(std::string_view xml_content) noexcept -> Value {
    Value empty_tree{.data = Value::Dictionary{}};
    if (xml_content.empty()) {
        return empty_tree;
    }

    static constexpr int parse_options = XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    std::unique_ptr<xmlDoc, XmlDocDeleter> doc{xmlReadMemory(xml_content.data(), static_cast<int>(xml_content.size()), "plist.xml", nullptr, parse_options)};
    if (!doc) {
        spdlog::warn("[plist] Failed to parse property list ({} bytes)", xml_content.size());
        return empty_tree;
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (root == nullptr || node_name(root) != "plist"sv) {
        spdlog::warn("[plist] Document root is not <plist>");
        return empty_tree;
    }
    const xmlNode* top = next_element(root->children);
    if (top == nullptr) {
        return empty_tree;
    }
    try {
        return parse_node(top);
    } catch (const std::exception& e) {
        spdlog::error("[plist] Failed to build property tree: {}", e.what());
    }
    return empty_tree;
}

auto get_bool(const Value& root, std::string_view dotted_path) noexcept -> std::optional<bool> {
    const auto* node = root.find_path(dotted_path);
    return node != nullptr ? node->as_bool() : std::nullopt;
}

auto get_string(const Value& root, std::string_view dotted_path) noexcept -> std::optional<std::string> {
    const auto* node = root.find_path(dotted_path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (auto str = node->as_string()) {
        return std::string{*str};
    }
    return std::nullopt;
}

auto get_integer(const Value& root, std::string_view dotted_path) noexcept -> std::optional<std::int64_t> {
    const auto* node = root.find_path(dotted_path);
    return node != nullptr ? node->as_integer() : std::nullopt;
}

}  // namespace swapcore::plist
