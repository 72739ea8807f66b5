// state_output.cpp

#include "state_output.hpp"

#include <fstream>
#include <stdexcept>

using namespace std;

static nlohmann::json time_or_null(const optional<Timestamp>& t) {
    if (!t) return nullptr;
    return format_timestamp(*t);
}

static nlohmann::json enabled_list(const vector<EnabledElement>& elements) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : elements) {
        out.push_back({{"id", e.id}, {"enabled_time", time_or_null(e.enabled_time)}});
    }
    return out;
}

nlohmann::json case_states_to_json(const CaseStates& states) {
    nlohmann::json cases = nlohmann::json::object();
    for (const auto& kv : states) {
        const CaseState& s = kv.second;

        nlohmann::json ongoing = nlohmann::json::array();
        for (const auto& a : s.ongoing_activities) {
            ongoing.push_back({
                {"id", a.id ? nlohmann::json(*a.id) : nlohmann::json(nullptr)},
                {"start_time", time_or_null(a.start_time)},
                {"resource", a.resource},
                {"enabled_time", time_or_null(a.enabled_time)}
            });
        }

        cases[kv.first] = {
            {"control_flow_state", {
                {"flows", s.control_flow_state.flows},
                {"activities", s.control_flow_state.activities}
            }},
            {"ongoing_activities", ongoing},
            {"enabled_activities", enabled_list(s.enabled_activities)},
            {"enabled_gateways", enabled_list(s.enabled_gateways)}
        };
    }
    return {{"cases", cases}};
}

void write_case_states(const CaseStates& states, const string& path) {
    ofstream out(path);
    if (!out) throw runtime_error("Error: Could not write output file " + path);
    out << case_states_to_json(states).dump(4) << "\n";
}
