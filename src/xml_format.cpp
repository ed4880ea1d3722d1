/**
 * @file xml_format.cpp
 * @brief Streaming XML serialization.
 */

#include <eventwire/logging.hpp>
#include <eventwire/xml_format.hpp>

#include <utility>

namespace eventwire {

namespace {

constexpr std::string_view STREAM_OPEN = "<stream>";
constexpr std::string_view STREAM_CLOSE = "</stream>";

void append_element(std::string& out, std::string_view tag, std::string_view text) {
    if (text.empty()) {
        return;
    }
    out += '<';
    out += tag;
    out += '>';
    out += xml_escape_text(text);
    out += "</";
    out += tag;
    out += '>';
}

} // namespace

std::string xml_escape_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string xml_escape_attribute(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\n':
            out += "&#10;";
            break;
        case '\r':
            out += "&#13;";
            break;
        case '\t':
            out += "&#9;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string to_xml(const Event& event) {
    std::string out;
    out.reserve(event.data().size() + 192);

    out += "<event stanza=\"";
    out += xml_escape_attribute(event.stanza());
    out += '"';
    if (event.unbroken()) {
        out += " unbroken=\"1\"";
    }
    out += '>';

    append_element(out, "time", format_time(event.time()));
    append_element(out, "index", event.index());
    append_element(out, "host", event.host());
    append_element(out, "source", event.source());
    append_element(out, "sourcetype", event.sourcetype());
    append_element(out, "data", event.data());

    if (event.done()) {
        out += "<done />";
    }
    out += "</event>";
    return out;
}

std::vector<std::string> format_xml_events(const std::vector<Event>& events,
                                           const XmlFormatOptions& options) {
    std::vector<std::string> streams;
    std::string current;
    std::size_t count = 0;
    const std::string* stanza = nullptr;

    auto flush = [&]() {
        current += STREAM_CLOSE;
        logger()->trace("xml stream closed: {} event(s), {} bytes", count, current.size());
        streams.push_back(std::move(current));
        current.clear();
        count = 0;
    };

    for (const Event& event : events) {
        std::string element = to_xml(event);

        if (count > 0) {
            bool stanza_changed = options.split_on_stanza && event.stanza() != *stanza;
            bool too_many =
                options.max_events_per_stream != 0 && count >= options.max_events_per_stream;
            bool too_big = options.max_stream_bytes != 0 &&
                           current.size() + element.size() + STREAM_CLOSE.size() >
                               options.max_stream_bytes;
            if (stanza_changed || too_many || too_big) {
                flush();
            }
        }

        if (count == 0) {
            current += STREAM_OPEN;
        }
        current += element;
        stanza = &event.stanza();
        ++count;
    }

    if (count > 0) {
        flush();
    }
    return streams;
}

} // namespace eventwire
