// test_reachability_graph.cpp

#include "bpmn_handler.hpp"
#include "reachability_graph.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace std;

// ---------------------------
// Graph bookkeeping
// ---------------------------

TEST(CanonicalKey, IsOrderIndependent) {
    Marking a{"f2", "f1"};
    Marking b{"f1", "f2"};
    EXPECT_EQ(canonical_key(a), canonical_key(b));
    EXPECT_NE(canonical_key(Marking{"f1"}), canonical_key(Marking{"f1", "f2"}));
    EXPECT_EQ(canonical_key(Marking{}), "");
}

TEST(ReachabilityGraphBookkeeping, AddMarkingReturnsExistingNode) {
    ReachabilityGraph g;
    int n0 = g.add_marking({"f0"}, true);
    int n1 = g.add_marking({"f1", "f2"});
    EXPECT_EQ(n0, 0);
    EXPECT_EQ(n1, 1);
    EXPECT_EQ(g.add_marking({"f2", "f1"}), n1);
    EXPECT_EQ(g.initial_node, n0);
    EXPECT_EQ(g.markings.size(), 2u);
    ASSERT_TRUE(g.find_node({"f1", "f2"}).has_value());
    EXPECT_EQ(*g.find_node({"f1", "f2"}), n1);
    EXPECT_FALSE(g.find_node({"f9"}).has_value());
}

TEST(ReachabilityGraphBookkeeping, AddEdgeCollapsesDuplicates) {
    ReachabilityGraph g;
    int n0 = g.add_marking({"f0"}, true);
    int n1 = g.add_marking({"f1"});
    int e0 = g.add_edge("t_a", n0, n1);
    int again = g.add_edge("t_a", n0, n1);
    int e1 = g.add_edge("t_b", n0, n1);
    EXPECT_EQ(e0, again);
    EXPECT_NE(e0, e1);
    EXPECT_EQ(g.edges.size(), 2u);
    EXPECT_EQ(g.incoming_edges.at(n1), (vector<int>{e0, e1}));
    EXPECT_EQ(g.outgoing_edges.at(n0), (vector<int>{e0, e1}));
    EXPECT_EQ(g.activity_to_edges.at("t_b"), (set<int>{e1}));
    EXPECT_TRUE(g.incoming_edges.at(n0).empty());
}

// ---------------------------
// Construction from models
// ---------------------------

class ReachabilityGraphTest : public ::testing::Test {
protected:
    static ReachabilityGraph build(const char* xml) {
        BPMNHandler model = BPMNHandler::from_string(xml);
        ReachabilityResult r = build_reachability_graph(model);
        EXPECT_TRUE(r.finished);
        return r.graph;
    }

    static bool has_edge(const ReachabilityGraph& g, const Marking& from, const string& activity, const Marking& to) {
        auto s = g.find_node(from);
        auto t = g.find_node(to);
        if (!s || !t) return false;
        for (int e : g.outgoing_edges.at(*s)) {
            if (g.edges.at(e).second == *t && g.edge_to_activity.at(e) == activity) return true;
        }
        return false;
    }
};

TEST_F(ReachabilityGraphTest, SequenceIsAChain) {
    ReachabilityGraph g = build(fixtures::SEQUENCE_BPMN);
    EXPECT_EQ(g.markings.size(), 3u);
    EXPECT_EQ(g.edges.size(), 2u);
    EXPECT_EQ(g.markings.at(g.initial_node), (Marking{"f0"}));
    EXPECT_TRUE(has_edge(g, {"f0"}, "t_a", {"f1"}));
    EXPECT_TRUE(has_edge(g, {"f1"}, "t_b", {"f2"}));
    // the token in front of the end event stays
    EXPECT_TRUE(g.outgoing_edges.at(*g.find_node({"f2"})).empty());
}

TEST_F(ReachabilityGraphTest, ExclusiveSplitKeepsTheDecisionToken) {
    ReachabilityGraph g = build(fixtures::EXCLUSIVE_BPMN);
    EXPECT_EQ(g.markings.size(), 4u);
    EXPECT_EQ(g.edges.size(), 4u);
    EXPECT_TRUE(has_edge(g, {"f0"}, "t_a", {"f1"}));
    // the join has a single output and is passed right away
    EXPECT_TRUE(has_edge(g, {"f1"}, "t_b", {"f6"}));
    EXPECT_TRUE(has_edge(g, {"f1"}, "t_c", {"f6"}));
    EXPECT_TRUE(has_edge(g, {"f6"}, "t_d", {"f7"}));
    EXPECT_FALSE(g.find_node({"f2"}).has_value());
}

TEST_F(ReachabilityGraphTest, ParallelSplitAndJoinInterleave) {
    ReachabilityGraph g = build(fixtures::PARALLEL_BPMN);
    EXPECT_EQ(g.markings.size(), 6u);
    EXPECT_EQ(g.edges.size(), 6u);
    EXPECT_TRUE(has_edge(g, {"f0"}, "t_a", {"f2", "f3"}));
    EXPECT_TRUE(has_edge(g, {"f2", "f3"}, "t_b", {"f3", "f4"}));
    EXPECT_TRUE(has_edge(g, {"f2", "f3"}, "t_c", {"f2", "f5"}));
    EXPECT_TRUE(has_edge(g, {"f3", "f4"}, "t_c", {"f6"}));
    EXPECT_TRUE(has_edge(g, {"f2", "f5"}, "t_b", {"f6"}));
    EXPECT_TRUE(has_edge(g, {"f6"}, "t_d", {"f7"}));
    // D never fires before both branches are done
    for (int e : g.activity_to_edges.at("t_d")) {
        EXPECT_EQ(g.markings.at(g.edges.at(e).first), (Marking{"f6"}));
    }
}

TEST_F(ReachabilityGraphTest, InitialMarkingIsAdvancedThroughParallelSplit) {
    ReachabilityGraph g = build(fixtures::PARALLEL_START_BPMN);
    EXPECT_EQ(g.markings.at(g.initial_node), (Marking{"f1", "f2"}));
    EXPECT_EQ(g.markings.size(), 4u);
    EXPECT_TRUE(has_edge(g, {"f1", "f2"}, "t_b", {"f2", "f3"}));
    EXPECT_TRUE(has_edge(g, {"f1", "f4"}, "t_b", {"f5"}));
}

TEST_F(ReachabilityGraphTest, InclusiveJoinWaitsForPendingBranches) {
    ReachabilityGraph g = build(fixtures::INCLUSIVE_BPMN);
    // only B chosen: the join fires at once
    EXPECT_TRUE(has_edge(g, {"f1"}, "t_b", {"f6"}));
    // B and C chosen: the join waits for C
    EXPECT_TRUE(has_edge(g, {"f1"}, "t_b", {"f3", "f4"}));
    EXPECT_TRUE(has_edge(g, {"f3", "f4"}, "t_c", {"f6"}));
    EXPECT_TRUE(has_edge(g, {"f1"}, "t_c", {"f2", "f5"}));
    EXPECT_FALSE(g.find_node({"f4", "f5"}).has_value());
    EXPECT_TRUE(has_edge(g, {"f6"}, "t_d", {"f7"}));
}

TEST_F(ReachabilityGraphTest, IncomingEdgesAscend) {
    ReachabilityGraph g = build(fixtures::PARALLEL_BPMN);
    for (const auto& kv : g.incoming_edges) {
        EXPECT_TRUE(is_sorted(kv.second.begin(), kv.second.end()));
    }
}

TEST_F(ReachabilityGraphTest, LimitsStopExploration) {
    BPMNHandler model = BPMNHandler::from_string(fixtures::PARALLEL_BPMN);
    AnalysisConfig cfg;
    cfg.MAX_STATES = 2;
    ReachabilityResult r = build_reachability_graph(model, cfg);
    EXPECT_FALSE(r.finished);
    EXPECT_LT(r.graph.markings.size(), 6u);
}

TEST_F(ReachabilityGraphTest, ModelWithoutStartEventIsRejected) {
    const char* xml = R"(<definitions><process id="p">
        <task id="t_a" name="A" /><endEvent id="e" />
        <sequenceFlow id="f0" sourceRef="t_a" targetRef="e" />
      </process></definitions>)";
    BPMNHandler model = BPMNHandler::from_string(xml);
    EXPECT_THROW(build_reachability_graph(model), std::runtime_error);
}
