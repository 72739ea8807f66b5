// bpmn_handler.cpp

#include "bpmn_handler.hpp"

#include <tinyxml2.h>

#include <cstring>
#include <iostream>

using namespace std;

// ---------------------------
// Element classification
// ---------------------------

// "bpmn:endEvent" and "endEvent" both name an end event.
static string local_name(const char* qualified) {
    const char* colon = strrchr(qualified, ':');
    return colon ? string(colon + 1) : string(qualified);
}

static bool is_task_element(const string& name) {
    static const unordered_set<string> task_names = {
        "task", "userTask", "serviceTask", "scriptTask", "manualTask",
        "sendTask", "receiveTask", "businessRuleTask", "callActivity"
    };
    return task_names.count(name) > 0;
}

// Sub-processes are kept collapsed: one activity, inner elements ignored.
static bool is_sub_process_element(const string& name) {
    return name == "subProcess" || name == "transaction" || name == "adHocSubProcess";
}

static bool gateway_kind(const string& name, NodeKind& kind) {
    if (name == "exclusiveGateway") kind = NodeKind::ExclusiveGateway;
    else if (name == "parallelGateway") kind = NodeKind::ParallelGateway;
    else if (name == "inclusiveGateway") kind = NodeKind::InclusiveGateway;
    else if (name == "eventBasedGateway") kind = NodeKind::EventBasedGateway;
    else if (name == "complexGateway") kind = NodeKind::ComplexGateway;
    else return false;
    return true;
}

static string required_attribute(const tinyxml2::XMLElement* elem, const char* attr, const string& what) {
    const char* value = elem->Attribute(attr);
    if (!value || !*value) {
        throw ModelParseError("Missing '" + string(attr) + "' attribute on " + what + " element.");
    }
    return value;
}

const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Activity:          return "activity";
        case NodeKind::ExclusiveGateway:  return "exclusive gateway";
        case NodeKind::ParallelGateway:   return "parallel gateway";
        case NodeKind::InclusiveGateway:  return "inclusive gateway";
        case NodeKind::EventBasedGateway: return "event-based gateway";
        case NodeKind::ComplexGateway:    return "complex gateway";
        case NodeKind::StartEvent:        return "start event";
        case NodeKind::IntermediateEvent: return "intermediate event";
        case NodeKind::EndEvent:          return "end event";
    }
    return "unknown";
}

// ---------------------------
// Parsing
// ---------------------------

void BPMNHandler::add_node(const string& id, NodeKind kind) {
    if (!nodes_.emplace(id, kind).second) {
        throw ModelParseError("Duplicate element id: " + id);
    }
}

void BPMNHandler::parse_element(const tinyxml2::XMLElement* elem) {
    for (const tinyxml2::XMLElement* child = elem->FirstChildElement();
         child != nullptr; child = child->NextSiblingElement())
    {
        const string name = local_name(child->Name());
        NodeKind gw;

        if (is_task_element(name) || is_sub_process_element(name)) {
            string t_id = required_attribute(child, "id", name);
            const char* t_name_attr = child->Attribute("name");
            string t_name = (t_name_attr && *t_name_attr) ? string(t_name_attr) : "Unnamed Task " + t_id;

            auto by_name = task_name_to_id_.find(t_name);
            if (by_name != task_name_to_id_.end() && by_name->second != t_id) {
                throw ModelParseError("Duplicate task name '" + t_name + "' used by " +
                                      by_name->second + " and " + t_id);
            }
            add_node(t_id, NodeKind::Activity);
            activities_[t_id] = t_name;
            task_name_to_id_[t_name] = t_id;
        } else if (name == "endEvent") {
            string event_id = required_attribute(child, "id", name);
            add_node(event_id, NodeKind::EndEvent);
            end_events_.insert(event_id);
        } else if (name == "startEvent") {
            string event_id = required_attribute(child, "id", name);
            add_node(event_id, NodeKind::StartEvent);
            start_events_.push_back(event_id);
        } else if (name == "intermediateCatchEvent" || name == "intermediateThrowEvent" ||
                   name == "boundaryEvent") {
            add_node(required_attribute(child, "id", name), NodeKind::IntermediateEvent);
        } else if (gateway_kind(name, gw)) {
            add_node(required_attribute(child, "id", name), gw);
        } else if (name == "sequenceFlow") {
            SequenceFlow sf;
            sf.id = required_attribute(child, "id", name);
            sf.source_ref = required_attribute(child, "sourceRef", "sequenceFlow " + sf.id);
            sf.target_ref = required_attribute(child, "targetRef", "sequenceFlow " + sf.id);
            sequence_flows_[sf.id] = sf;
        } else {
            // containers: definitions, process, laneSet, ...
            parse_element(child);
        }
    }
}

void BPMNHandler::finalize() {
    // Consistency check for flows
    for (const auto& kv : sequence_flows_) {
        const SequenceFlow& sf = kv.second;
        if (!nodes_.count(sf.source_ref))
            throw ModelParseError("Invalid sequenceFlow source ID found: " + sf.source_ref + " (" + sf.id + ")");
        if (!nodes_.count(sf.target_ref))
            throw ModelParseError("Invalid sequenceFlow target ID found: " + sf.target_ref + " (" + sf.id + ")");
        outgoing_[sf.source_ref].push_back(sf.id);
        incoming_[sf.target_ref].push_back(sf.id);
    }
}

BPMNHandler BPMNHandler::from_file(const string& path) {
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError e = doc.LoadFile(path.c_str());
    if (e != tinyxml2::XML_SUCCESS) {
        throw ModelParseError("Error: Could not read BPMN file " + path + ": " + doc.ErrorStr());
    }
    const tinyxml2::XMLElement* root = doc.RootElement();
    if (!root) throw ModelParseError("No root element found in " + path);

    BPMNHandler handler;
    handler.parse_element(root);
    handler.finalize();
    return handler;
}

BPMNHandler BPMNHandler::from_string(const string& xml) {
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError e = doc.Parse(xml.c_str(), xml.size());
    if (e != tinyxml2::XML_SUCCESS) {
        throw ModelParseError(string("Malformed BPMN document: ") + doc.ErrorStr());
    }
    const tinyxml2::XMLElement* root = doc.RootElement();
    if (!root) throw ModelParseError("No root element found in BPMN document.");

    BPMNHandler handler;
    handler.parse_element(root);
    handler.finalize();
    return handler;
}

// ---------------------------
// Queries
// ---------------------------

bool BPMNHandler::is_end_event(const string& element_id) const {
    return end_events_.count(element_id) > 0;
}

bool BPMNHandler::is_activity(const string& element_id) const {
    return activities_.count(element_id) > 0;
}

const string* BPMNHandler::get_task_id_by_name(const string& name) const {
    auto it = task_name_to_id_.find(name);
    return it == task_name_to_id_.end() ? nullptr : &it->second;
}

const string* BPMNHandler::get_task_name(const string& task_id) const {
    auto it = activities_.find(task_id);
    return it == activities_.end() ? nullptr : &it->second;
}

const string* BPMNHandler::get_flow_target(const string& flow_id) const {
    auto it = sequence_flows_.find(flow_id);
    return it == sequence_flows_.end() ? nullptr : &it->second.target_ref;
}

const string* BPMNHandler::get_flow_source(const string& flow_id) const {
    auto it = sequence_flows_.find(flow_id);
    return it == sequence_flows_.end() ? nullptr : &it->second.source_ref;
}

set<string> BPMNHandler::get_upstream_tasks_through_gateways(const string& start_id) const {
    unordered_set<string> visited;
    vector<string> stack{start_id};
    set<string> tasks_found;
    while (!stack.empty()) {
        string current = stack.back();
        stack.pop_back();
        if (is_activity(current)) {
            tasks_found.insert(current);
            continue;
        }
        for (const auto& sf_id : incoming_flows(current)) {
            const string& src = sequence_flows_.at(sf_id).source_ref;
            if (visited.insert(src).second) stack.push_back(src);
        }
    }
    return tasks_found;
}

NodeKind BPMNHandler::kind_of(const string& element_id) const {
    auto it = nodes_.find(element_id);
    if (it == nodes_.end()) throw out_of_range("Unknown BPMN element: " + element_id);
    return it->second;
}

bool BPMNHandler::has_node(const string& element_id) const {
    return nodes_.count(element_id) > 0;
}

const vector<string>& BPMNHandler::incoming_flows(const string& element_id) const {
    static const vector<string> none;
    auto it = incoming_.find(element_id);
    return it == incoming_.end() ? none : it->second;
}

const vector<string>& BPMNHandler::outgoing_flows(const string& element_id) const {
    static const vector<string> none;
    auto it = outgoing_.find(element_id);
    return it == outgoing_.end() ? none : it->second;
}

void BPMNHandler::print_structure() const {
    cout << "\n--- Model Structure ---\n";
    cout << "Activities:\n";
    for (const auto& kv : activities_) {
        cout << " - " << kv.first << " (" << kv.second << ")\n";
    }
    cout << "\nGateways and events:\n";
    for (const auto& kv : nodes_) {
        if (kv.second == NodeKind::Activity) continue;
        cout << " - " << kv.first << " [" << to_string(kv.second) << "]\n";
    }
    cout << "\nSequence flows:\n";
    for (const auto& kv : sequence_flows_) {
        cout << " - " << kv.first << ": " << kv.second.source_ref << " -> " << kv.second.target_ref << "\n";
    }
}
