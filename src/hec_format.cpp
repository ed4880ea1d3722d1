/**
 * @file hec_format.cpp
 * @brief HEC JSON serialization and batching.
 */

#include <eventwire/hec_format.hpp>
#include <eventwire/logging.hpp>
#include <eventwire/utils.hpp>

#include <nlohmann/json.hpp>

#include <utility>

namespace eventwire {

namespace {

void set_if_present(nlohmann::ordered_json& object, const char* key, const std::string& value) {
    if (!value.empty()) {
        object[key] = value;
    }
}

} // namespace

std::string to_hec(const Event& event, const HecFormatOptions& options) {
    nlohmann::ordered_json object;
    object["time"] = event.time();
    set_if_present(object, "index", event.index());
    set_if_present(object, "host", event.host());
    set_if_present(object, "source", event.source());
    set_if_present(object, "sourcetype", event.sourcetype());
    if (options.escape_control_chars) {
        object[options.event_field] = escape_json_control_chars(event.data());
    } else {
        object[options.event_field] = event.data();
    }
    return object.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::vector<std::string> format_hec_events(const std::vector<Event>& events,
                                           const HecFormatOptions& options) {
    std::vector<std::string> batches;
    std::string current;
    std::size_t count = 0;
    std::size_t fragments = 0;

    for (const Event& event : events) {
        if (event.unbroken() || event.done()) {
            ++fragments;
        }

        std::string line = to_hec(event, options);

        if (count > 0) {
            bool too_many =
                options.max_events_per_batch != 0 && count >= options.max_events_per_batch;
            bool too_big = options.max_batch_bytes != 0 &&
                           current.size() + 1 + line.size() > options.max_batch_bytes;
            if (too_many || too_big) {
                logger()->trace("hec batch closed: {} event(s), {} bytes", count, current.size());
                batches.push_back(std::move(current));
                current.clear();
                count = 0;
            }
        }

        if (count > 0) {
            current += '\n';
        }
        current += line;
        ++count;
    }

    if (count > 0) {
        logger()->trace("hec batch closed: {} event(s), {} bytes", count, current.size());
        batches.push_back(std::move(current));
    }

    if (fragments > 0) {
        logger()->debug("hec format dropped unbroken/done flags of {} event(s)", fragments);
    }
    return batches;
}

} // namespace eventwire
