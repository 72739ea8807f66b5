// state_computer.cpp

#include "state_computer.hpp"
#include "bpmn_handler.hpp"
#include "concurrency_oracle.hpp"
#include "n_gram_index.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

using namespace std;

// ---------------------------
// Helpers
// ---------------------------

static optional<Timestamp> max_end_time(const vector<Event>& events) {
    optional<Timestamp> out;
    for (const auto& e : events)
        if (e.end_time && (!out || *e.end_time > *out)) out = e.end_time;
    return out;
}

static optional<Timestamp> min_start_time(const vector<Event>& events) {
    optional<Timestamp> out;
    for (const auto& e : events)
        if (e.start_time && (!out || *e.start_time < *out)) out = e.start_time;
    return out;
}

static void add_unique(vector<EnabledElement>& out, const string& id, const optional<Timestamp>& t) {
    for (const auto& e : out)
        if (e.id == id) return;
    out.push_back({id, t});
}

// ---------------------------
// StateComputer
// ---------------------------

StateComputer::StateComputer(const TraceMatcher& n_gram_index,
                             const ReachabilityGraph& reachability_graph,
                             const BPMNHandler& bpmn_handler,
                             ConcurrencyOracle& concurrency_oracle)
    : n_gram_index_(n_gram_index),
      reachability_graph_(reachability_graph),
      bpmn_handler_(bpmn_handler),
      concurrency_oracle_(concurrency_oracle) {}

CaseStates StateComputer::compute_case_states(const vector<Event>& event_log) const {
    CaseStates case_states;
    for (auto& kv : group_by_case(event_log)) {
        auto state = compute_case_state(kv.first, std::move(kv.second));
        if (state) case_states.emplace(kv.first, std::move(*state));
    }
    return case_states;
}

optional<CaseState> StateComputer::compute_case_state(const string& case_id, vector<Event> group) const {
    stable_sort(group.begin(), group.end(), [](const Event& a, const Event& b) {
        if (!a.start_time) return false;
        if (!b.start_time) return true;
        return *a.start_time < *b.start_time;
    });

    // Ongoing and finished events
    vector<Event> finished;
    vector<OngoingActivity> ongoing_activities;
    set<string> ongoing_activity_ids;
    for (const auto& e : group) {
        if (e.end_time) {
            finished.push_back(e);
            continue;
        }
        OngoingActivity a;
        const string* task_id = bpmn_handler_.get_task_id_by_name(e.activity);
        if (task_id) {
            a.id = *task_id;
            ongoing_activity_ids.insert(*task_id);
        }
        a.start_time = e.start_time;
        a.resource = e.resource;
        if (task_id && e.start_time && concurrency_oracle_.has_activity(e.activity)) {
            a.enabled_time = e.enabled_time;
        }
        ongoing_activities.push_back(std::move(a));
    }

    // Marking of the whole trace, ongoing activities included
    vector<string> n_gram{NGramIndex::TRACE_START};
    for (const auto& e : group) n_gram.push_back(e.activity);
    Marking state_marking = n_gram_index_.get_best_marking_state_for(n_gram);
    Marking state_flows = narrow_to_ongoing(state_marking, ongoing_activity_ids);

    CaseState state;

    for (const auto& flow_id : state_flows) {
        const string* target_ref = bpmn_handler_.get_flow_target(flow_id);
        if (!target_ref || !bpmn_handler_.is_activity(*target_ref)) continue;
        const string& activity_name = *bpmn_handler_.get_task_name(*target_ref);
        add_unique(state.enabled_activities, *target_ref, activity_enabled_time(case_id, activity_name, group, finished));
    }

    // Gateways and events; skipped while a task feeding them is still running
    for (const auto& flow_id : state_flows) {
        const string* gw_id = bpmn_handler_.get_flow_target(flow_id);
        if (!gw_id || bpmn_handler_.is_activity(*gw_id)) continue;

        set<string> tasks_upstream = bpmn_handler_.get_upstream_tasks_through_gateways(*gw_id);
        bool blocked = any_of(tasks_upstream.begin(), tasks_upstream.end(),
                              [&](const string& t) { return ongoing_activity_ids.count(t) > 0; });
        if (blocked) continue;

        optional<Timestamp> gw_enabled_time = compute_gateway_enabled_time(*gw_id, finished);
        if (gw_enabled_time) add_unique(state.enabled_gateways, *gw_id, gw_enabled_time);
    }

    for (const auto& gateway : state.enabled_gateways) {
        if (bpmn_handler_.is_end_event(gateway.id)) return nullopt;
    }

    state.control_flow_state.flows.assign(state_flows.begin(), state_flows.end());
    state.control_flow_state.activities.assign(ongoing_activity_ids.begin(), ongoing_activity_ids.end());
    state.ongoing_activities = std::move(ongoing_activities);
    return state;
}

// The matcher treats ongoing activities as completed. For each of them, take
// the marking the graph was in before the activity fired and keep only the
// flows present there as well.
Marking StateComputer::narrow_to_ongoing(const Marking& state_marking, const set<string>& ongoing_ids) const {
    Marking state_flows = state_marking;
    if (state_marking.empty()) return state_flows;

    optional<int> current = reachability_graph_.find_node(state_marking);
    if (!current) return state_flows;
    auto in = reachability_graph_.incoming_edges.find(*current);
    if (in == reachability_graph_.incoming_edges.end()) return state_flows;

    for (const auto& t_id : ongoing_ids) {
        // incoming edges are in ascending id order, the first match wins
        for (int edge_id : in->second) {
            if (reachability_graph_.edge_to_activity.at(edge_id) != t_id) continue;
            int source = reachability_graph_.edges.at(edge_id).first;
            const Marking& source_marking = reachability_graph_.markings.at(source);
            Marking narrowed;
            set_intersection(state_flows.begin(), state_flows.end(),
                             source_marking.begin(), source_marking.end(),
                             inserter(narrowed, narrowed.end()));
            state_flows = std::move(narrowed);
            break;
        }
    }
    return state_flows;
}

optional<Timestamp> StateComputer::activity_enabled_time(const string& case_id,
                                                         const string& activity_name,
                                                         const vector<Event>& group,
                                                         const vector<Event>& finished) const {
    if (finished.empty()) return min_start_time(group);

    concurrency_oracle_.register_activity(activity_name);
    Timestamp probe_time = *max_end_time(finished) + chrono::seconds(1);
    Event probe;
    probe.case_id = case_id;
    probe.activity = activity_name;
    probe.start_time = probe_time;
    probe.end_time = probe_time;
    return concurrency_oracle_.enabled_since(finished, probe);
}

optional<Timestamp> StateComputer::compute_gateway_enabled_time(const string& gateway_id,
                                                                const vector<Event>& finished) const {
    set<string> tasks_upstream = bpmn_handler_.get_upstream_tasks_through_gateways(gateway_id);
    if (tasks_upstream.empty()) return max_end_time(finished);

    set<string> task_names;
    for (const auto& t_id : tasks_upstream) {
        if (const string* name = bpmn_handler_.get_task_name(t_id)) task_names.insert(*name);
    }
    vector<Event> upstream_events;
    for (const auto& e : finished)
        if (task_names.count(e.activity)) upstream_events.push_back(e);

    optional<Timestamp> max_et = max_end_time(upstream_events);
    if (!max_et) max_et = max_end_time(finished);
    return max_et;
}
