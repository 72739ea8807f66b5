// bpmn_handler.hpp
//
// Process model adapter: activities, sequence flows, gateways and events of a
// BPMN document, with lookups by id and by name and upstream traversal.
#ifndef BPMN_HANDLER_HPP
#define BPMN_HANDLER_HPP

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tinyxml2 { class XMLElement; }

class ModelParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class NodeKind {
    Activity,
    ExclusiveGateway,
    ParallelGateway,
    InclusiveGateway,
    EventBasedGateway,
    ComplexGateway,
    StartEvent,
    IntermediateEvent,
    EndEvent
};

struct SequenceFlow {
    std::string id;
    std::string source_ref;
    std::string target_ref;
};

class BPMNHandler {
public:
    // Both throw ModelParseError.
    static BPMNHandler from_file(const std::string& path);
    static BPMNHandler from_string(const std::string& xml);

    bool is_end_event(const std::string& element_id) const;
    bool is_activity(const std::string& element_id) const;

    // nullptr when the name is not a model activity
    const std::string* get_task_id_by_name(const std::string& name) const;
    const std::string* get_task_name(const std::string& task_id) const;

    // target element of a flow, nullptr for unknown flows
    const std::string* get_flow_target(const std::string& flow_id) const;
    const std::string* get_flow_source(const std::string& flow_id) const;

    /**
     * Walks sequence flows backwards from start_id and collects the first
     * activities met on every path. Activities bound the search, so nothing
     * upstream of a task is visited. Returns {start_id} when start_id is an
     * activity and an empty set when no path reaches one.
     */
    std::set<std::string> get_upstream_tasks_through_gateways(const std::string& start_id) const;

    NodeKind kind_of(const std::string& element_id) const;
    bool has_node(const std::string& element_id) const;

    const std::vector<std::string>& incoming_flows(const std::string& element_id) const;
    const std::vector<std::string>& outgoing_flows(const std::string& element_id) const;

    const std::map<std::string, std::string>& activities() const { return activities_; }
    const std::map<std::string, SequenceFlow>& sequence_flows() const { return sequence_flows_; }
    const std::unordered_set<std::string>& end_events() const { return end_events_; }
    const std::vector<std::string>& start_events() const { return start_events_; }
    const std::map<std::string, NodeKind>& nodes() const { return nodes_; }

    void print_structure() const;

private:
    BPMNHandler() = default;

    void parse_element(const tinyxml2::XMLElement* elem);
    void add_node(const std::string& id, NodeKind kind);
    void finalize();

    std::map<std::string, std::string> activities_;          // id -> name
    std::unordered_map<std::string, std::string> task_name_to_id_;
    std::map<std::string, SequenceFlow> sequence_flows_;
    std::unordered_set<std::string> end_events_;
    std::vector<std::string> start_events_;
    std::map<std::string, NodeKind> nodes_;

    std::unordered_map<std::string, std::vector<std::string>> incoming_;
    std::unordered_map<std::string, std::vector<std::string>> outgoing_;
};

const char* to_string(NodeKind kind);

#endif
