// event_log.hpp
//
// Event log rows, CSV loading with a configurable column mapping,
// UTC timestamps and the per-case grouping used by the state computer.
#ifndef EVENT_LOG_HPP
#define EVENT_LOG_HPP

#include <chrono>
#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using Timestamp = std::chrono::system_clock::time_point;

class EventLogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------
// Data structures
// ---------------------------

struct Event {
    std::string case_id;
    std::string activity;
    std::string resource;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;     // empty => ongoing
    std::optional<Timestamp> enabled_time;
};

// Names of the CSV columns holding each standard field.
struct EventLogIDs {
    std::string case_id = "case_id";
    std::string activity = "activity";
    std::string resource = "resource";
    std::string enabled_time = "enable_time";
    std::string start_time = "start_time";
    std::string end_time = "end_time";
};

struct LogStats {
    std::size_t cases = 0;
    std::size_t events = 0;
    std::optional<Timestamp> earliest_start;
    std::optional<Timestamp> latest_end;
};

// ---------------------------
// Timestamps
// ---------------------------

// Accepts "YYYY-MM-DD[T| ]HH:MM:SS[.fraction][Z|+HH:MM|-HHMM]" and a bare
// date. Offsets are applied so that the result is UTC. Returns nullopt for
// empty or malformed text.
std::optional<Timestamp> parse_timestamp(const std::string& text);

// ISO-8601 in UTC, e.g. "2023-05-01T10:15:00+00:00". Microseconds are
// appended only when non-zero.
std::string format_timestamp(const Timestamp& ts);

// ---------------------------
// Loading
// ---------------------------

// Parses {"case_id": "CaseId", ...}. Keys that are absent keep their default.
EventLogIDs parse_column_mapping(const std::string& json_text);

std::vector<Event> read_event_log(std::istream& in, const EventLogIDs& ids = {});
std::vector<Event> read_event_log(const std::string& csv_path, const EventLogIDs& ids = {});

// Splits one CSV record, honoring double-quoted fields.
std::vector<std::string> split_csv_record(const std::string& line);

// ---------------------------
// Transformations
// ---------------------------

// The log as it was observable at `cut`: events starting after the cut are
// dropped, end and enabled times after the cut are cleared.
std::vector<Event> cut_event_log(const std::vector<Event>& events, const Timestamp& cut);

// Events per case, each group stably sorted by start time (missing last).
std::map<std::string, std::vector<Event>> group_by_case(const std::vector<Event>& events);

LogStats basic_log_stats(const std::vector<Event>& events);

#endif
