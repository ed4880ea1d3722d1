/**
 * @file eventwire.hpp
 * @brief eventwire public API.
 *
 * Two independent layers, composed by the caller:
 * - payload decompression (gzip.hpp, zip.hpp) recovers raw bytes from a
 *   compressed single-file container and rejects anything ambiguous;
 * - event formatting (event.hpp, xml_format.hpp, hec_format.hpp) turns
 *   Event records into wire-ready XML stream or HEC JSON strings.
 *
 * Typical use:
 * @code
 * std::vector<std::uint8_t> raw;
 * if (eventwire::is_gzip(payload)) {
 *     raw = eventwire::decompress_gzip(payload);
 * }
 * std::vector<eventwire::Event> events;
 * events.emplace_back(std::string(raw.begin(), raw.end()), now,
 *                     eventwire::EventOptions{.index = "main", .stanza = "my_input://a"});
 * for (const auto& doc : eventwire::format_xml_events(events)) {
 *     send(doc);
 * }
 * @endcode
 */

#ifndef EVENTWIRE_HPP
#define EVENTWIRE_HPP

#include "config.hpp"
#include "error.hpp"
#include "event.hpp"
#include "gzip.hpp"
#include "hec_format.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "xml_format.hpp"
#include "zip.hpp"

namespace eventwire {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace eventwire

#endif // EVENTWIRE_HPP
