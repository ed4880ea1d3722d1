/**
 * @file utils.cpp
 * @brief Text helpers.
 */

#include <eventwire/utils.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace eventwire {

namespace {

constexpr std::array<std::string_view, 5> TRUE_VALUES = {"1", "TRUE", "T", "Y", "YES"};
constexpr std::array<std::string_view, 7> FALSE_VALUES = {"0", "FALSE", "F", "N",
                                                          "NO", "NONE", ""};

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Trimmed, upper-cased copy; an absent value reads as "NONE"
std::string normalize(std::optional<std::string_view> value) {
    if (!value.has_value()) {
        return "NONE";
    }
    std::string_view text = *value;
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }

    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
    return out;
}

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& values, std::string_view value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

std::string escape_json_control_chars(std::string_view text) {
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size() && (text[i + 1] == 'n' || text[i + 1] == 'r')) {
            out += "\\\\";
            out += text[++i];
        } else {
            out += c;
        }
    }
    return out;
}

bool is_true(std::optional<std::string_view> value) {
    return contains(TRUE_VALUES, normalize(value));
}

bool is_false(std::optional<std::string_view> value) {
    return contains(FALSE_VALUES, normalize(value));
}

double datetime_to_seconds(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace eventwire
