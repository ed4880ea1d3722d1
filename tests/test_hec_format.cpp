/**
 * @file test_hec_format.cpp
 * @brief Unit tests for the HEC JSON format.
 */

#include <catch2/catch_test_macros.hpp>
#include <eventwire/hec_format.hpp>

#include <nlohmann/json.hpp>

#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace eventwire;

namespace {

constexpr double EVENT_TIME = 1372274622.493;

Event make_event(std::string data, bool unbroken = false, bool done = false) {
    EventOptions options;
    options.index = "main";
    options.host = "localhost";
    options.source = "Splunk";
    options.sourcetype = "misc";
    options.stanza = "test_scheme://test";
    options.unbroken = unbroken;
    options.done = done;
    return Event(std::move(data), EVENT_TIME, std::move(options));
}

std::vector<std::string> split_lines(const std::string& batch) {
    std::vector<std::string> lines;
    std::istringstream in(batch);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::set<std::string> keys_of(const nlohmann::json& object) {
    std::set<std::string> keys;
    for (const auto& item : object.items()) {
        keys.insert(item.key());
    }
    return keys;
}

} // namespace

TEST_CASE("HEC batch of a broken event", "[hec]") {
    std::vector<Event> events = {make_event("This is a test data1.", true, false),
                                 make_event("This is a test data2.", true, true)};

    auto batches = format_hec_events(events);
    REQUIRE(batches.size() == 1);

    auto lines = split_lines(batches[0]);
    REQUIRE(lines.size() == 2);

    const std::set<std::string> expected_keys = {"time", "index", "host",
                                                 "source", "sourcetype", "event"};
    auto first = nlohmann::json::parse(lines[0]);
    REQUIRE(keys_of(first) == expected_keys);
    REQUIRE(first == nlohmann::json::parse(
                         R"({"event": "This is a test data1.", "host": "localhost",
                             "index": "main", "source": "Splunk", "sourcetype": "misc",
                             "time": 1372274622.493})"));

    auto second = nlohmann::json::parse(lines[1]);
    REQUIRE(keys_of(second) == expected_keys);
    REQUIRE(second["event"] == "This is a test data2.");
}

TEST_CASE("HEC single event object", "[hec]") {
    SECTION("key order and time precision") {
        auto line = to_hec(make_event("x"));
        REQUIRE(line == R"({"time":1372274622.493,"index":"main","host":"localhost",)"
                        R"("source":"Splunk","sourcetype":"misc","event":"x"})");
    }

    SECTION("unset metadata is omitted") {
        Event event("bare", 5.25);
        REQUIRE(to_hec(event) == R"({"time":5.25,"event":"bare"})");
    }

    SECTION("stanza and fragment flags are not written") {
        auto parsed = nlohmann::json::parse(to_hec(make_event("x", true, true)));
        REQUIRE_FALSE(parsed.contains("stanza"));
        REQUIRE_FALSE(parsed.contains("unbroken"));
        REQUIRE_FALSE(parsed.contains("done"));
    }

    SECTION("multi-byte UTF-8 is written as is") {
        auto line = to_hec(make_event("snow \xe2\x98\x83 man"));
        REQUIRE(line.find("snow \xe2\x98\x83 man") != std::string::npos);
        REQUIRE(line.find("\\u2603") == std::string::npos);
    }

    SECTION("invalid UTF-8 is replaced") {
        auto line = to_hec(make_event("bad \xff byte"));
        REQUIRE(line.find("bad \xef\xbf\xbd byte") != std::string::npos);
        REQUIRE_NOTHROW(nlohmann::json::parse(line));
    }

    SECTION("JSON escaping of data") {
        auto line = to_hec(make_event("quote \" newline \n tab \t"));
        REQUIRE(line.find(R"(quote \" newline \n tab \t)") != std::string::npos);
        REQUIRE(nlohmann::json::parse(line)["event"] == "quote \" newline \n tab \t");
    }
}

TEST_CASE("HEC options", "[hec]") {
    SECTION("custom event field") {
        HecFormatOptions options;
        options.event_field = "message";
        auto parsed = nlohmann::json::parse(to_hec(make_event("x"), options));
        REQUIRE(parsed["message"] == "x");
        REQUIRE_FALSE(parsed.contains("event"));
    }

    SECTION("control character escaping") {
        HecFormatOptions options;
        options.escape_control_chars = true;
        auto parsed = nlohmann::json::parse(to_hec(make_event("a\\nb"), options));
        REQUIRE(parsed["event"] == "a\\\\nb");

        auto plain = nlohmann::json::parse(to_hec(make_event("a\\nb")));
        REQUIRE(plain["event"] == "a\\nb");
    }
}

TEST_CASE("HEC batching", "[hec]") {
    std::vector<Event> events;
    for (int i = 0; i < 5; ++i) {
        events.push_back(make_event("event " + std::to_string(i)));
    }

    SECTION("no events") {
        REQUIRE(format_hec_events({}).empty());
    }

    SECTION("default limit keeps small input together") {
        auto batches = format_hec_events(events);
        REQUIRE(batches.size() == 1);
        REQUIRE(split_lines(batches[0]).size() == 5);
        REQUIRE(batches[0].back() == '}');
    }

    SECTION("event count limit") {
        HecFormatOptions options;
        options.max_events_per_batch = 2;
        auto batches = format_hec_events(events, options);
        REQUIRE(batches.size() == 3);
        REQUIRE(split_lines(batches[0]).size() == 2);
        REQUIRE(split_lines(batches[2]).size() == 1);
    }

    SECTION("byte limit counts the separators") {
        const std::size_t line = to_hec(events[0]).size();
        HecFormatOptions options;
        options.max_batch_bytes = 2 * line + 1;
        auto batches = format_hec_events(events, options);
        REQUIRE(batches.size() == 3);
        for (const auto& batch : batches) {
            REQUIRE(batch.size() <= options.max_batch_bytes);
        }

        options.max_batch_bytes = 2 * line;
        REQUIRE(format_hec_events(events, options).size() == 5);
    }

    SECTION("oversized event is sent alone") {
        events.insert(events.begin() + 1, make_event(std::string(4096, 'x')));
        HecFormatOptions options;
        options.max_batch_bytes = 1024;
        auto batches = format_hec_events(events, options);
        REQUIRE(batches.size() == 3);
        REQUIRE(split_lines(batches[0]).size() == 1);
        REQUIRE(split_lines(batches[1]).size() == 1);
        REQUIRE(batches[1].size() > options.max_batch_bytes);
        REQUIRE(split_lines(batches[2]).size() == 4);
    }

    SECTION("order is preserved") {
        HecFormatOptions options;
        options.max_events_per_batch = 2;
        std::vector<std::string> data;
        for (const auto& batch : format_hec_events(events, options)) {
            for (const auto& line : split_lines(batch)) {
                data.push_back(nlohmann::json::parse(line)["event"].get<std::string>());
            }
        }
        const std::vector<std::string> expected = {"event 0", "event 1", "event 2", "event 3",
                                                   "event 4"};
        REQUIRE(data == expected);
    }
}
