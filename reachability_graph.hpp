// reachability_graph.hpp
//
// Graph of markings (sets of sequence-flow ids holding a token) connected by
// activity-labeled transitions, plus its explicit breadth-first construction
// from a BPMN model.
#ifndef REACHABILITY_GRAPH_HPP
#define REACHABILITY_GRAPH_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

class BPMNHandler;

using Marking = std::set<std::string>;

// Sorted member ids joined by ','. Flow ids are XML ids and never contain
// a comma.
std::string canonical_key(const Marking& marking);

struct ReachabilityGraph {
    std::map<int, Marking> markings;                       // node id -> marking
    std::map<int, std::pair<int, int>> edges;              // edge id -> (source, target)
    std::map<int, std::string> edge_to_activity;           // edge id -> activity id
    std::map<int, std::vector<int>> incoming_edges;        // ascending edge ids
    std::map<int, std::vector<int>> outgoing_edges;
    std::map<std::string, std::set<int>> activity_to_edges;
    std::unordered_map<std::string, int> marking_to_key;   // canonical key -> node id
    int initial_node = -1;

    // Returns the id of the existing node when the marking is known.
    int add_marking(const Marking& marking, bool is_initial = false);
    // Parallel edges with the same label are collapsed.
    int add_edge(const std::string& activity, int source, int target);

    std::optional<int> find_node(const Marking& marking) const;

private:
    std::map<std::tuple<int, int, std::string>, int> edge_index_;
};

struct AnalysisConfig { std::size_t MAX_STATES = 100000; std::size_t MAX_DEPTH = 2000; };

struct ReachabilityResult {
    ReachabilityGraph graph;
    bool finished = true;
    std::size_t explored = 0;
};

// Breadth-first from the start events. Stored markings are advanced through
// every gateway that involves no choice, so their tokens wait in front of
// tasks, decision gateways or end events. Throws std::runtime_error when the
// model has no start event with an outgoing flow.
ReachabilityResult build_reachability_graph(const BPMNHandler& model, const AnalysisConfig& cfg = {});

#endif
