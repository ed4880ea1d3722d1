/**
 * @file utils.hpp
 * @brief Text helpers used while preparing event fields.
 */

#ifndef EVENTWIRE_UTILS_HPP
#define EVENTWIRE_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace eventwire {

/**
 * @brief Double the backslash of literal "\r" and "\n" sequences.
 *
 * Only a backslash followed by the letter r or n is touched; real CR and
 * LF bytes pass through. Apply once, before JSON encoding: a second pass
 * escapes again.
 *
 * @param text Source text
 * @return Escaped copy
 */
std::string escape_json_control_chars(std::string_view text);

/**
 * @brief Whether a configuration value reads as true.
 *
 * Case-insensitive, surrounding whitespace ignored: 1, TRUE, T, Y, YES.
 */
[[nodiscard]] bool is_true(std::optional<std::string_view> value);

/**
 * @brief Whether a configuration value reads as false.
 *
 * Case-insensitive, surrounding whitespace ignored: 0, FALSE, F, N, NO,
 * NONE and the empty string. An absent value is false.
 */
[[nodiscard]] bool is_false(std::optional<std::string_view> value);

/**
 * @brief Seconds since the Unix epoch, with fraction.
 */
[[nodiscard]] double datetime_to_seconds(std::chrono::system_clock::time_point tp) noexcept;

} // namespace eventwire

#endif // EVENTWIRE_UTILS_HPP
