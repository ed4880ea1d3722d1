/**
 * @file event.hpp
 * @brief Immutable event record shared by the wire formatters.
 */

#ifndef EVENTWIRE_EVENT_HPP
#define EVENTWIRE_EVENT_HPP

#include "config.hpp"
#include "error.hpp"

#include <optional>
#include <string>

namespace eventwire {

/**
 * @brief Routing metadata and fragment flags of an event.
 *
 * Empty strings mean "not set"; formatters skip them.
 */
struct EventOptions {
    std::string index;
    std::string host;
    std::string source;
    std::string sourcetype;
    std::string stanza;    ///< Input configuration that produced the event
    bool unbroken = false; ///< Fragment of a larger logical event
    bool done = false;     ///< Last fragment of a broken event
};

/**
 * @brief One unit of collected data plus its metadata.
 *
 * An Event is built once and then only read. unbroken and done are
 * independent: the last fragment of a multi-part event carries both.
 */
class Event {
public:
    /**
     * @brief Construct an event.
     *
     * @param data Event text (any bytes, UTF-8 expected)
     * @param time Seconds since the Unix epoch, with fraction
     * @param options Routing metadata and fragment flags
     *
     * @throws ConstructionException if time is absent or not finite
     */
    Event(std::string data, std::optional<double> time, EventOptions options = {});

    [[nodiscard]] const std::string& data() const noexcept {
        return data_;
    }

    [[nodiscard]] double time() const noexcept {
        return time_;
    }

    [[nodiscard]] const std::string& index() const noexcept {
        return options_.index;
    }

    [[nodiscard]] const std::string& host() const noexcept {
        return options_.host;
    }

    [[nodiscard]] const std::string& source() const noexcept {
        return options_.source;
    }

    [[nodiscard]] const std::string& sourcetype() const noexcept {
        return options_.sourcetype;
    }

    [[nodiscard]] const std::string& stanza() const noexcept {
        return options_.stanza;
    }

    [[nodiscard]] bool unbroken() const noexcept {
        return options_.unbroken;
    }

    [[nodiscard]] bool done() const noexcept {
        return options_.done;
    }

private:
    std::string data_;
    double time_;
    EventOptions options_;
};

/// Events compare by value
bool operator==(const Event& a, const Event& b) noexcept;

inline bool operator!=(const Event& a, const Event& b) noexcept {
    return !(a == b);
}

/**
 * @brief Render an event time in fixed notation.
 *
 * Uses the shortest digit string that reads back as the same double, so
 * 1372274622.493 prints as "1372274622.493", never rounded or padded.
 */
std::string format_time(double seconds);

/**
 * @brief JSON object holding every field of an event.
 *
 * For diagnostics. Unset strings are written as null.
 */
std::string to_json(const Event& event);

} // namespace eventwire

#endif // EVENTWIRE_EVENT_HPP
