// concurrency_oracle.cpp

#include "concurrency_oracle.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace std;

ConcurrencyOracle::ConcurrencyOracle(map<string, set<string>> concurrency)
    : concurrency_(std::move(concurrency)) {}

bool ConcurrencyOracle::has_activity(const string& activity) const {
    lock_guard<mutex> lock(mutex_);
    return concurrency_.count(activity) > 0;
}

void ConcurrencyOracle::register_activity(const string& activity) {
    lock_guard<mutex> lock(mutex_);
    concurrency_.emplace(activity, set<string>{});
}

set<string> ConcurrencyOracle::concurrent_with(const string& activity) const {
    lock_guard<mutex> lock(mutex_);
    auto it = concurrency_.find(activity);
    if (it == concurrency_.end()) {
        throw invalid_argument("Activity '" + activity + "' is not tracked by the concurrency oracle.");
    }
    return it->second;
}

map<string, set<string>> ConcurrencyOracle::table() const {
    lock_guard<mutex> lock(mutex_);
    return concurrency_;
}

optional<Timestamp> ConcurrencyOracle::enabled_since(const vector<Event>& history, const Event& event) const {
    const set<string> concurrent = concurrent_with(event.activity);
    if (!event.start_time) return nullopt;

    optional<Timestamp> previous;
    for (const auto& e : history) {
        if (!e.end_time || *e.end_time > *event.start_time) continue;
        if (concurrent.count(e.activity)) continue;
        if (!previous || *e.end_time > *previous) previous = e.end_time;
    }
    return previous;
}

// ---------------------------
// Directly-follows discovery
// ---------------------------

DirectlyFollowsConcurrencyOracle::DirectlyFollowsConcurrencyOracle(const vector<Event>& log)
    : ConcurrencyOracle(discover(log)) {}

map<string, set<string>> DirectlyFollowsConcurrencyOracle::discover(const vector<Event>& log) {
    map<string, set<string>> concurrency;
    set<pair<string, string>> df;

    for (auto& kv : group_by_case(log)) {
        vector<Event>& trace = kv.second;
        stable_sort(trace.begin(), trace.end(), [](const Event& a, const Event& b) {
            if (a.start_time != b.start_time) {
                if (!a.start_time) return false;
                if (!b.start_time) return true;
                return *a.start_time < *b.start_time;
            }
            if (!a.end_time) return false;
            if (!b.end_time) return true;
            return *a.end_time < *b.end_time;
        });
        for (size_t i = 0; i < trace.size(); ++i) {
            concurrency[trace[i].activity];
            if (i > 0) df.insert({trace[i-1].activity, trace[i].activity});
        }
    }

    for (const auto& rel : df) {
        if (rel.first != rel.second && df.count({rel.second, rel.first})) {
            concurrency[rel.first].insert(rel.second);
        }
    }
    return concurrency;
}
