// n_gram_index.cpp

#include "n_gram_index.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std;

const string NGramIndex::TRACE_START = "DEFAULT_TRACE_START_LABEL";

NGramIndex::NGramIndex(const ReachabilityGraph& graph,
                       unordered_map<string, string> labels,
                       size_t n_gram_size_limit)
    : graph_(graph), labels_(std::move(labels)), limit_(n_gram_size_limit) {
    if (limit_ == 0) throw invalid_argument("n-gram size limit must be at least 1");
}

const string& NGramIndex::label_of(int edge) const {
    const string& activity = graph_.edge_to_activity.at(edge);
    auto it = labels_.find(activity);
    return it == labels_.end() ? activity : it->second;
}

void NGramIndex::index_backwards(int node, int current, vector<string>& suffix) {
    // suffix holds the labels latest first
    if (current == graph_.initial_node && suffix.size() < limit_) {
        vector<string> n_gram{TRACE_START};
        n_gram.insert(n_gram.end(), suffix.rbegin(), suffix.rend());
        markings_by_n_gram_[n_gram].insert(node);
    }
    if (suffix.size() == limit_) return;

    auto it = graph_.incoming_edges.find(current);
    if (it == graph_.incoming_edges.end()) return;
    for (int edge : it->second) {
        suffix.push_back(label_of(edge));
        markings_by_n_gram_[vector<string>(suffix.rbegin(), suffix.rend())].insert(node);
        index_backwards(node, graph_.edges.at(edge).first, suffix);
        suffix.pop_back();
    }
}

void NGramIndex::build() {
    markings_by_n_gram_.clear();
    vector<string> suffix;
    for (const auto& kv : graph_.markings) {
        index_backwards(kv.first, kv.first, suffix);
    }
}

Marking NGramIndex::get_best_marking_state_for(const vector<string>& n_gram) const {
    set<int> candidates;
    size_t max_k = min(limit_, n_gram.size());
    for (size_t k = 1; k <= max_k; ++k) {
        vector<string> suffix(n_gram.end() - (ptrdiff_t)k, n_gram.end());
        auto it = markings_by_n_gram_.find(suffix);
        if (it == markings_by_n_gram_.end()) break;
        candidates = it->second;
        if (candidates.size() == 1) break;
    }
    if (candidates.empty()) return {};
    return graph_.markings.at(*candidates.begin());
}
