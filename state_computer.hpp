// state_computer.hpp
//
// Reconstructs the runtime state of every in-flight case from its partial
// trace: the flows holding tokens, the running activities, and the
// activities and gateways that are enabled together with the time they
// became enabled.
#ifndef STATE_COMPUTER_HPP
#define STATE_COMPUTER_HPP

#include "event_log.hpp"
#include "reachability_graph.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

class BPMNHandler;
class ConcurrencyOracle;
class TraceMatcher;

// ---------------------------
// Case state records
// ---------------------------

struct OngoingActivity {
    std::optional<std::string> id;     // empty when the name is not in the model
    std::optional<Timestamp> start_time;
    std::string resource;
    std::optional<Timestamp> enabled_time;
};

struct EnabledElement {
    std::string id;
    std::optional<Timestamp> enabled_time;
};

struct ControlFlowState {
    std::vector<std::string> flows;
    std::vector<std::string> activities;
};

struct CaseState {
    ControlFlowState control_flow_state;
    std::vector<OngoingActivity> ongoing_activities;
    std::vector<EnabledElement> enabled_activities;
    std::vector<EnabledElement> enabled_gateways;
};

using CaseStates = std::map<std::string, CaseState>;

// ---------------------------
// StateComputer
// ---------------------------

class StateComputer {
public:
    // The oracle is shared and gets unknown activities registered while
    // states are computed.
    StateComputer(const TraceMatcher& n_gram_index,
                  const ReachabilityGraph& reachability_graph,
                  const BPMNHandler& bpmn_handler,
                  ConcurrencyOracle& concurrency_oracle);

    // Cases with an enabled end event are left out.
    CaseStates compute_case_states(const std::vector<Event>& event_log) const;

    // nullopt when the case is left out
    std::optional<CaseState> compute_case_state(const std::string& case_id, std::vector<Event> group) const;

    /**
     * Latest end time among the finished events of the tasks upstream of the
     * gateway. Falls back to the latest end time of all finished events when
     * the gateway has no upstream task or none of them has finished yet.
     */
    std::optional<Timestamp> compute_gateway_enabled_time(const std::string& gateway_id,
                                                          const std::vector<Event>& finished) const;

private:
    Marking narrow_to_ongoing(const Marking& state_marking,
                              const std::set<std::string>& ongoing_ids) const;

    std::optional<Timestamp> activity_enabled_time(const std::string& case_id,
                                                   const std::string& activity_name,
                                                   const std::vector<Event>& group,
                                                   const std::vector<Event>& finished) const;

    const TraceMatcher& n_gram_index_;
    const ReachabilityGraph& reachability_graph_;
    const BPMNHandler& bpmn_handler_;
    ConcurrencyOracle& concurrency_oracle_;
};

#endif
