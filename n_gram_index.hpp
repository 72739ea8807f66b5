// n_gram_index.hpp
#ifndef N_GRAM_INDEX_HPP
#define N_GRAM_INDEX_HPP

#include "reachability_graph.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// Maps the activity sequence executed so far by a case to a marking.
class TraceMatcher {
public:
    virtual ~TraceMatcher() = default;

    // n_gram starts with the trace-start sentinel. An empty marking means no
    // match.
    virtual Marking get_best_marking_state_for(const std::vector<std::string>& n_gram) const = 0;
};

/**
 * Index from activity-label n-grams to the reachability graph nodes they lead
 * to. Every node is indexed under each label sequence of length <= limit
 * ending in it; sequences that reach back to the initial node are also stored
 * with TRACE_START in front.
 *
 * A query looks up suffixes of the trace of growing length until one resolves
 * to a single node. A suffix that was never indexed ends the search; if the
 * previous suffix was still ambiguous the lowest node id among its
 * candidates is returned.
 */
class NGramIndex : public TraceMatcher {
public:
    static const std::string TRACE_START;

    // labels maps the activity ids on the graph edges to the names used in
    // event logs; ids without a label are indexed under the id itself.
    NGramIndex(const ReachabilityGraph& graph,
               std::unordered_map<std::string, std::string> labels,
               std::size_t n_gram_size_limit = 5);

    void build();

    Marking get_best_marking_state_for(const std::vector<std::string>& n_gram) const override;

    std::size_t size() const { return markings_by_n_gram_.size(); }
    std::size_t n_gram_size_limit() const { return limit_; }

private:
    void index_backwards(int node, int current, std::vector<std::string>& suffix);
    const std::string& label_of(int edge) const;

    const ReachabilityGraph& graph_;
    std::unordered_map<std::string, std::string> labels_;
    std::size_t limit_;
    std::map<std::vector<std::string>, std::set<int>> markings_by_n_gram_;
};

#endif
