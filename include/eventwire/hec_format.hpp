/**
 * @file hec_format.hpp
 * @brief HEC (newline-delimited JSON) wire format.
 *
 * One JSON object per event with the keys time, index, host, source,
 * sourcetype and event; unset metadata is left out.
 *
 * The unbroken and done flags have no HEC counterpart and are not written.
 * A broken event sent this way arrives as independent events.
 */

#ifndef EVENTWIRE_HEC_FORMAT_HPP
#define EVENTWIRE_HEC_FORMAT_HPP

#include "config.hpp"
#include "event.hpp"

#include <string>
#include <vector>

namespace eventwire {

/**
 * @brief Key naming and batching policy for HEC output.
 *
 * Zero limits are unlimited.
 */
struct HecFormatOptions {
    std::string event_field = "event"; ///< Key holding the event data
    std::size_t max_batch_bytes = DEFAULT_MAX_HEC_BATCH_BYTES;
    std::size_t max_events_per_batch = 0;
    bool escape_control_chars = false; ///< Run escape_json_control_chars() on data first
};

/**
 * @brief Serialize one event as a single-line JSON object.
 *
 * Multi-byte UTF-8 is written as is; invalid UTF-8 sequences become U+FFFD.
 */
std::string to_hec(const Event& event, const HecFormatOptions& options = {});

/**
 * @brief Serialize events into newline-joined batches.
 *
 * A batch is closed when the next object, with its separator, would take
 * it past max_batch_bytes or when it holds max_events_per_batch objects.
 * An object larger than max_batch_bytes is sent in a batch of its own.
 *
 * @param events Events in emission order
 * @param options Key naming and batching policy
 * @return One string per batch, in order
 */
std::vector<std::string> format_hec_events(const std::vector<Event>& events,
                                           const HecFormatOptions& options = {});

} // namespace eventwire

#endif // EVENTWIRE_HEC_FORMAT_HPP
