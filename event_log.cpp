// event_log.cpp

#include "event_log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>

using namespace std;

// ---------------------------
// Calendar helpers
// ---------------------------

// Days since 1970-01-01 for a proleptic Gregorian date.
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = (unsigned)(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (int64_t)doe - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = (unsigned)(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = (int64_t)yoe + era * 400 + (m <= 2);
}

static bool read_digits(const string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!isdigit((unsigned char)c)) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += count;
    return true;
}

static bool expect_char(const string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) { ++pos; return true; }
    return false;
}

static string trim(const string& s) {
    size_t i = 0, j = s.size();
    while (i < j && isspace((unsigned char)s[i])) ++i;
    while (j > i && isspace((unsigned char)s[j-1])) --j;
    return s.substr(i, j - i);
}

// ---------------------------
// Timestamps
// ---------------------------

optional<Timestamp> parse_timestamp(const string& text) {
    const string s = trim(text);
    if (s.empty()) return nullopt;

    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(s, pos, 4, year) || !expect_char(s, pos, '-') ||
        !read_digits(s, pos, 2, month) || !expect_char(s, pos, '-') ||
        !read_digits(s, pos, 2, day)) {
        return nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return nullopt;

    int64_t micros = 0;
    int64_t offset_seconds = 0;
    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != ' ') return nullopt;
        ++pos;
        if (!read_digits(s, pos, 2, hour) || !expect_char(s, pos, ':') ||
            !read_digits(s, pos, 2, minute)) {
            return nullopt;
        }
        if (expect_char(s, pos, ':') && !read_digits(s, pos, 2, second)) return nullopt;
        if (hour > 23 || minute > 59 || second > 60) return nullopt;

        if (expect_char(s, pos, '.')) {
            // keep microsecond precision, ignore finer digits
            int64_t scale = 100000;
            size_t digits = 0;
            while (pos < s.size() && isdigit((unsigned char)s[pos])) {
                if (scale > 0) {
                    micros += (s[pos] - '0') * scale;
                    scale /= 10;
                }
                ++pos;
                ++digits;
            }
            if (digits == 0) return nullopt;
        }

        if (pos < s.size()) {
            char sign = s[pos];
            if (sign == 'Z') {
                ++pos;
            } else if (sign == '+' || sign == '-') {
                ++pos;
                int oh = 0, om = 0;
                if (!read_digits(s, pos, 2, oh)) return nullopt;
                expect_char(s, pos, ':');
                if (pos < s.size() && !read_digits(s, pos, 2, om)) return nullopt;
                offset_seconds = (int64_t)(oh * 3600 + om * 60) * (sign == '+' ? 1 : -1);
            } else {
                return nullopt;
            }
        }
        if (pos != s.size()) return nullopt;
    }

    int64_t days = days_from_civil(year, (unsigned)month, (unsigned)day);
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    auto since_epoch = chrono::seconds(seconds) + chrono::microseconds(micros);
    return Timestamp(chrono::duration_cast<Timestamp::duration>(since_epoch));
}

string format_timestamp(const Timestamp& ts) {
    int64_t us = chrono::duration_cast<chrono::microseconds>(ts.time_since_epoch()).count();
    int64_t secs = us / 1000000;
    int64_t frac = us % 1000000;
    if (frac < 0) { frac += 1000000; --secs; }
    int64_t days = secs / 86400;
    int64_t rem = secs % 86400;
    if (rem < 0) { rem += 86400; --days; }

    int64_t y; unsigned m, d;
    civil_from_days(days, y, m, d);

    char buf[64];
    snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d",
             (long long)y, m, d, (int)(rem / 3600), (int)(rem % 3600 / 60), (int)(rem % 60));
    string out = buf;
    if (frac != 0) {
        snprintf(buf, sizeof(buf), ".%06lld", (long long)frac);
        out += buf;
    }
    out += "+00:00";
    return out;
}

// ---------------------------
// CSV loading
// ---------------------------

vector<string> split_csv_record(const string& line) {
    vector<string> out;
    string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
                else quoted = false;
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(field);
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    out.push_back(field);
    return out;
}

EventLogIDs parse_column_mapping(const string& json_text) {
    EventLogIDs ids;
    if (trim(json_text).empty()) return ids;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw EventLogError(string("Invalid column mapping: ") + e.what());
    }
    if (!j.is_object()) throw EventLogError("Column mapping must be a JSON object.");

    const pair<const char*, string*> fields[] = {
        {"case_id", &ids.case_id},
        {"activity", &ids.activity},
        {"resource", &ids.resource},
        {"enable_time", &ids.enabled_time},
        {"enabled_time", &ids.enabled_time},
        {"start_time", &ids.start_time},
        {"end_time", &ids.end_time},
    };
    for (const auto& f : fields) {
        auto it = j.find(f.first);
        if (it == j.end()) continue;
        if (!it->is_string()) {
            throw EventLogError(string("Column mapping value for '") + f.first + "' must be a string.");
        }
        *f.second = it->get<string>();
    }
    return ids;
}

static int column_index(const vector<string>& header, const string& name) {
    auto it = find(header.begin(), header.end(), name);
    return it == header.end() ? -1 : (int)(it - header.begin());
}

vector<Event> read_event_log(istream& in, const EventLogIDs& ids) {
    string line;
    if (!getline(in, line)) throw EventLogError("Event log is empty (no header row).");
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    vector<string> header = split_csv_record(line);
    for (auto& h : header) h = trim(h);

    int c_case = column_index(header, ids.case_id);
    int c_act = column_index(header, ids.activity);
    int c_start = column_index(header, ids.start_time);
    int c_end = column_index(header, ids.end_time);
    int c_res = column_index(header, ids.resource);
    int c_enabled = column_index(header, ids.enabled_time);
    if (c_case < 0) throw EventLogError("Missing case id column '" + ids.case_id + "'.");
    if (c_act < 0) throw EventLogError("Missing activity column '" + ids.activity + "'.");
    if (c_start < 0) throw EventLogError("Missing start time column '" + ids.start_time + "'.");

    vector<Event> events;
    size_t line_no = 1;
    while (getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        vector<string> fields = split_csv_record(line);
        if (fields.size() != header.size()) {
            throw EventLogError("Line " + to_string(line_no) + ": expected " + to_string(header.size()) +
                                " fields, found " + to_string(fields.size()) + ".");
        }

        Event e;
        e.case_id = trim(fields[c_case]);
        e.activity = trim(fields[c_act]);
        e.start_time = parse_timestamp(fields[c_start]);
        if (c_end >= 0) e.end_time = parse_timestamp(fields[c_end]);
        if (c_res >= 0) e.resource = trim(fields[c_res]);
        if (c_enabled >= 0) e.enabled_time = parse_timestamp(fields[c_enabled]);
        events.push_back(std::move(e));
    }
    return events;
}

vector<Event> read_event_log(const string& csv_path, const EventLogIDs& ids) {
    ifstream in(csv_path);
    if (!in) throw EventLogError("Error: Could not open event log " + csv_path);
    return read_event_log(in, ids);
}

// ---------------------------
// Transformations
// ---------------------------

vector<Event> cut_event_log(const vector<Event>& events, const Timestamp& cut) {
    vector<Event> out;
    out.reserve(events.size());
    for (const auto& e : events) {
        if (!e.start_time || *e.start_time > cut) continue;
        Event c = e;
        if (c.end_time && *c.end_time > cut) c.end_time.reset();
        if (c.enabled_time && *c.enabled_time > cut) c.enabled_time.reset();
        out.push_back(std::move(c));
    }
    return out;
}

map<string, vector<Event>> group_by_case(const vector<Event>& events) {
    map<string, vector<Event>> groups;
    for (const auto& e : events) groups[e.case_id].push_back(e);
    for (auto& kv : groups) {
        stable_sort(kv.second.begin(), kv.second.end(), [](const Event& a, const Event& b) {
            if (!a.start_time) return false;
            if (!b.start_time) return true;
            return *a.start_time < *b.start_time;
        });
    }
    return groups;
}

LogStats basic_log_stats(const vector<Event>& events) {
    LogStats stats;
    set<string> cases;
    for (const auto& e : events) {
        cases.insert(e.case_id);
        if (e.start_time && (!stats.earliest_start || *e.start_time < *stats.earliest_start))
            stats.earliest_start = e.start_time;
        if (e.end_time && (!stats.latest_end || *e.end_time > *stats.latest_end))
            stats.latest_end = e.end_time;
    }
    stats.cases = cases.size();
    stats.events = events.size();
    return stats;
}
