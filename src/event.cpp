/**
 * @file event.cpp
 * @brief Event construction and text form.
 */

#include <eventwire/event.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace eventwire {

namespace {

nlohmann::ordered_json optional_string(const std::string& value) {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

} // namespace

Event::Event(std::string data, std::optional<double> time, EventOptions options)
    : data_(std::move(data)), time_(0.0), options_(std::move(options)) {
    if (!time.has_value()) {
        throw ConstructionException("Event requires a time");
    }
    if (!std::isfinite(*time)) {
        throw ConstructionException("Event time must be a finite number");
    }
    time_ = *time;
}

bool operator==(const Event& a, const Event& b) noexcept {
    return a.data() == b.data() && a.time() == b.time() && a.index() == b.index() &&
           a.host() == b.host() && a.source() == b.source() &&
           a.sourcetype() == b.sourcetype() && a.stanza() == b.stanza() &&
           a.unbroken() == b.unbroken() && a.done() == b.done();
}

std::string format_time(double seconds) {
    // Fixed notation of a finite double needs at most ~330 characters
    std::array<char, 512> buffer;
    auto [end, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), seconds, std::chars_format::fixed);
    if (ec != std::errc()) {
        throw std::length_error("time value does not fit the format buffer");
    }
    return std::string(buffer.data(), end);
}

std::string to_json(const Event& event) {
    nlohmann::ordered_json object;
    object["data"] = event.data();
    object["time"] = event.time();
    object["index"] = optional_string(event.index());
    object["host"] = optional_string(event.host());
    object["source"] = optional_string(event.source());
    object["sourcetype"] = optional_string(event.sourcetype());
    object["stanza"] = optional_string(event.stanza());
    object["unbroken"] = event.unbroken();
    object["done"] = event.done();
    return object.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace eventwire
