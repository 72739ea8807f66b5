// reachability_graph.cpp

#include "reachability_graph.hpp"
#include "bpmn_handler.hpp"

#include <deque>
#include <queue>
#include <stdexcept>
#include <unordered_set>

using namespace std;

string canonical_key(const Marking& marking) {
    string key;
    for (const auto& flow : marking) {
        key += flow;
        key.push_back(',');
    }
    return key;
}

// ---------------------------
// Graph bookkeeping
// ---------------------------

int ReachabilityGraph::add_marking(const Marking& marking, bool is_initial) {
    string key = canonical_key(marking);
    auto it = marking_to_key.find(key);
    int id;
    if (it != marking_to_key.end()) {
        id = it->second;
    } else {
        id = (int)markings.size();
        markings[id] = marking;
        marking_to_key[key] = id;
        incoming_edges[id];
        outgoing_edges[id];
    }
    if (is_initial) initial_node = id;
    return id;
}

int ReachabilityGraph::add_edge(const string& activity, int source, int target) {
    auto k = make_tuple(source, target, activity);
    auto it = edge_index_.find(k);
    if (it != edge_index_.end()) return it->second;

    int id = (int)edges.size();
    edges[id] = {source, target};
    edge_to_activity[id] = activity;
    incoming_edges[target].push_back(id);
    outgoing_edges[source].push_back(id);
    activity_to_edges[activity].insert(id);
    edge_index_[k] = id;
    return id;
}

optional<int> ReachabilityGraph::find_node(const Marking& marking) const {
    auto it = marking_to_key.find(canonical_key(marking));
    if (it == marking_to_key.end()) return nullopt;
    return it->second;
}

// ---------------------------
// Token game
// ---------------------------

static bool is_silent(NodeKind kind) {
    switch (kind) {
        case NodeKind::ExclusiveGateway:
        case NodeKind::ParallelGateway:
        case NodeKind::InclusiveGateway:
        case NodeKind::EventBasedGateway:
        case NodeKind::ComplexGateway:
        case NodeKind::IntermediateEvent:
            return true;
        default:
            return false;
    }
}

// For every task: the gateways/intermediate events that lead to it without
// crossing another task, and the flows that point towards it.
struct SilentIndex {
    unordered_map<string, set<string>> ancestors;
    unordered_map<string, unordered_set<string>> toward;
    unordered_map<string, set<string>> flow_to_tasks;
};

static SilentIndex build_silent_index(const BPMNHandler& model) {
    SilentIndex idx;
    for (const auto& kv : model.activities()) {
        const string& task = kv.first;
        auto& anc = idx.ancestors[task];
        auto& toward = idx.toward[task];
        vector<string> stack{task};
        while (!stack.empty()) {
            string current = stack.back();
            stack.pop_back();
            for (const auto& sf_id : model.incoming_flows(current)) {
                toward.insert(sf_id);
                idx.flow_to_tasks[sf_id].insert(task);
                const string& src = *model.get_flow_source(sf_id);
                if (is_silent(model.kind_of(src)) && anc.insert(src).second) stack.push_back(src);
            }
        }
    }
    return idx;
}

static bool task_enabled(const BPMNHandler& model, const string& task, const Marking& M) {
    for (const auto& f : model.incoming_flows(task))
        if (M.count(f)) return true;
    return false;
}

static vector<Marking> fire_task(const BPMNHandler& model, const string& task, const Marking& M) {
    vector<Marking> results;
    for (const auto& f : model.incoming_flows(task)) {
        if (!M.count(f)) continue;
        Marking M2 = M;
        M2.erase(f);
        for (const auto& o : model.outgoing_flows(task)) M2.insert(o);
        results.push_back(std::move(M2));
    }
    return results;
}

// toward == nullptr lets a choice go to any outgoing flow.
static vector<Marking> fire_gateway(const BPMNHandler& model, const string& node, const Marking& M,
                                    const unordered_set<string>* toward) {
    vector<Marking> results;
    const auto& in = model.incoming_flows(node);
    const auto& out = model.outgoing_flows(node);
    if (in.empty() || out.empty()) return results;
    auto leads = [&](const string& f) { return toward == nullptr || toward->count(f) > 0; };

    switch (model.kind_of(node)) {
        case NodeKind::ParallelGateway: {
            for (const auto& f : in)
                if (!M.count(f)) return results;
            Marking M2 = M;
            for (const auto& f : in) M2.erase(f);
            for (const auto& o : out) M2.insert(o);
            results.push_back(std::move(M2));
            break;
        }
        case NodeKind::InclusiveGateway: {
            Marking base = M;
            bool any = false;
            for (const auto& f : in) {
                if (base.erase(f)) any = true;
            }
            if (!any) break;
            // every non-empty subset of the outputs that reaches the target
            size_t n = out.size();
            if (n > 16) n = 16;
            for (unsigned long mask = 1; mask < (1ul << n); ++mask) {
                bool reaches = false;
                Marking M2 = base;
                for (size_t i = 0; i < n; ++i) {
                    if (!(mask & (1ul << i))) continue;
                    M2.insert(out[i]);
                    if (leads(out[i])) reaches = true;
                }
                if (reaches) results.push_back(std::move(M2));
            }
            break;
        }
        default: {
            for (const auto& f : in) {
                if (!M.count(f)) continue;
                for (const auto& o : out) {
                    if (!leads(o)) continue;
                    Marking M2 = M;
                    M2.erase(f);
                    M2.insert(o);
                    results.push_back(std::move(M2));
                }
            }
            break;
        }
    }
    return results;
}

// An inclusive join waits while a token elsewhere in the marking can still
// reach one of its empty incoming flows.
static bool or_join_ready(const BPMNHandler& model, const string& join, const Marking& M) {
    unordered_set<string> pending;
    bool any = false;
    for (const auto& f : model.incoming_flows(join)) {
        if (M.count(f)) any = true;
        else pending.insert(f);
    }
    if (!any) return false;
    if (pending.empty()) return true;

    unordered_set<string> visited{join};
    vector<string> stack;
    for (const auto& f : M) {
        const string& node = *model.get_flow_target(f);
        if (visited.insert(node).second) stack.push_back(node);
    }
    while (!stack.empty()) {
        string current = stack.back();
        stack.pop_back();
        for (const auto& o : model.outgoing_flows(current)) {
            if (pending.count(o)) return false;
            const string& next = *model.get_flow_target(o);
            if (visited.insert(next).second) stack.push_back(next);
        }
    }
    return true;
}

// Moves tokens through every gateway or intermediate event whose firing
// involves no choice: parallel gateways, and joins or pass-through nodes with
// a single outgoing flow. Decision points keep their tokens.
static Marking advance(const BPMNHandler& model, Marking M) {
    size_t budget = model.sequence_flows().size() * 4 + 16;
    bool changed = true;
    while (changed && budget-- > 0) {
        changed = false;
        for (const auto& f : M) {
            const string& node = *model.get_flow_target(f);
            NodeKind kind = model.kind_of(node);
            if (!is_silent(kind)) continue;
            if (kind != NodeKind::ParallelGateway && model.outgoing_flows(node).size() != 1) continue;
            if (kind == NodeKind::InclusiveGateway && !or_join_ready(model, node, M)) continue;

            vector<Marking> next = fire_gateway(model, node, M, nullptr);
            if (next.empty()) continue;
            M = std::move(next.front());
            changed = true;
            break;
        }
    }
    return M;
}

// Markings reachable from M through silent moves towards `task` in which the
// task is enabled. Expansion stops at the first marking enabling the task.
static vector<Marking> firing_points(const BPMNHandler& model, const SilentIndex& idx,
                                     const string& task, const Marking& M, size_t limit) {
    vector<Marking> points;
    unordered_set<string> seen{canonical_key(M)};
    deque<Marking> q{M};
    const auto& anc = idx.ancestors.at(task);
    const auto& toward = idx.toward.at(task);
    while (!q.empty() && seen.size() <= limit) {
        Marking X = std::move(q.front());
        q.pop_front();
        if (task_enabled(model, task, X)) {
            points.push_back(std::move(X));
            continue;
        }
        for (const auto& g : anc) {
            for (auto& Y : fire_gateway(model, g, X, &toward)) {
                if (seen.insert(canonical_key(Y)).second) q.push_back(std::move(Y));
            }
        }
    }
    return points;
}

// ---------------------------
// Explicit reachability (BFS)
// ---------------------------

ReachabilityResult build_reachability_graph(const BPMNHandler& model, const AnalysisConfig& cfg) {
    ReachabilityResult R;
    ReachabilityGraph& G = R.graph;

    Marking M0;
    for (const auto& s : model.start_events())
        for (const auto& f : model.outgoing_flows(s)) M0.insert(f);
    if (M0.empty()) throw runtime_error("Model has no start event with an outgoing sequence flow.");
    M0 = advance(model, M0);

    SilentIndex idx = build_silent_index(model);

    int n0 = G.add_marking(M0, true);
    queue<pair<int, size_t>> q;
    q.push({n0, 0});
    while (!q.empty()) {
        auto [node, depth] = q.front(); q.pop();
        R.explored++;
        if (G.markings.size() >= cfg.MAX_STATES || depth >= cfg.MAX_DEPTH) { R.finished = false; continue; }

        const Marking M = G.markings.at(node);
        set<string> candidates;
        for (const auto& f : M) {
            auto it = idx.flow_to_tasks.find(f);
            if (it != idx.flow_to_tasks.end()) candidates.insert(it->second.begin(), it->second.end());
        }

        for (const auto& t : candidates) {
            for (const auto& X : firing_points(model, idx, t, M, cfg.MAX_STATES)) {
                for (auto& fired : fire_task(model, t, X)) {
                    Marking M2 = advance(model, std::move(fired));
                    size_t before = G.markings.size();
                    int target = G.add_marking(M2);
                    G.add_edge(t, node, target);
                    if (G.markings.size() > before) q.push({target, depth + 1});
                }
            }
        }
    }
    return R;
}
