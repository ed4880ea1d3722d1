/**
 * @file xml_format.hpp
 * @brief Streaming XML wire format.
 *
 * Each returned document has the form
 * @code
 * <stream><event stanza="..." unbroken="1"><time>..</time>...<data>..</data><done /></event>...</stream>
 * @endcode
 * with element and attribute naming, ordering and spacing fixed by the
 * receiving parser.
 */

#ifndef EVENTWIRE_XML_FORMAT_HPP
#define EVENTWIRE_XML_FORMAT_HPP

#include "event.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace eventwire {

/**
 * @brief How events are split into <stream> documents.
 *
 * Zero limits are unlimited. With the defaults every contiguous run of
 * events sharing a stanza becomes one document.
 */
struct XmlFormatOptions {
    bool split_on_stanza = true;        ///< New document when the stanza changes
    std::size_t max_events_per_stream = 0;
    std::size_t max_stream_bytes = 0;   ///< An oversized event still gets its own document
};

/**
 * @brief Escape element text (&, <, >).
 *
 * Newlines and other characters are kept as they are.
 */
std::string xml_escape_text(std::string_view text);

/**
 * @brief Escape a double-quoted attribute value.
 *
 * Escapes &, <, >, " and the whitespace characters that attribute value
 * normalization would otherwise fold into spaces.
 */
std::string xml_escape_attribute(std::string_view text);

/**
 * @brief Serialize one event as an <event> element.
 */
std::string to_xml(const Event& event);

/**
 * @brief Serialize events into one or more <stream> documents.
 *
 * Event order is preserved across and within documents, so fragments can
 * be reassembled in sequence. No events yield no documents.
 *
 * @param events Events in emission order
 * @param options Batching policy
 * @return One string per document
 */
std::vector<std::string> format_xml_events(const std::vector<Event>& events,
                                           const XmlFormatOptions& options = {});

} // namespace eventwire

#endif // EVENTWIRE_XML_FORMAT_HPP
