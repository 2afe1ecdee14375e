#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "trustflow/core/edge_decay.hpp"
#include "trustflow/core/error.hpp"
#include "trustflow/core/rank_flow.hpp"
#include "trustflow/core/teleport.hpp"
#include "test_utils.hpp"

using namespace trustflow::core;
using namespace trustflow::core::test;

TEST(RankFlow, TwoNodeWorkedExample) {
  auto g = make_single_edge_graph();
  auto w = decayed_weights(g, 0, 0.0);
  const std::vector<double> teleport = {0.5, 0.5};
  auto r = rank_flow(g, w, teleport, 0.5, 1);
  ASSERT_EQ(r.size(), 2u);
  EXPECT_NEAR(r[0], 0.375, 1e-15);
  EXPECT_NEAR(r[1], 0.625, 1e-15);
  expect_mass_conserved(r);
}

TEST(RankFlow, ZeroIterationsReturnsUniform) {
  auto g = make_example_graph();
  auto w = decayed_weights(g, 10, 0.1);
  auto r = rank_flow(g, w, uniform_teleport(6), 0.85, 0);
  for (double v : r) EXPECT_DOUBLE_EQ(v, 1.0 / 6.0);
}

TEST(RankFlow, MassConservedAfterEveryIterationCount) {
  auto g = make_random_graph(20, 60, 10, 12345u);
  const std::vector<NodeId> experts = {1, 3};
  auto teleport = build_teleport_vector(20, experts, 0.8);
  auto w = decayed_weights(g, 5, 0.3);
  for (double d : {0.0, 0.15, 0.5, 0.85, 1.0}) {
    for (std::int32_t it = 0; it <= 15; ++it) {
      SCOPED_TRACE(testing::Message() << "d=" << d << " iterations=" << it);
      expect_mass_conserved(rank_flow(g, w, teleport, d, it));
    }
  }
}

TEST(RankFlow, IsolatedNodesFeedDanglingPool) {
  // 0->1 plus an isolated node 2; d=1 removes teleportation
  const Edge edges[1] = {{0, 1, 0}};
  auto g = TemporalGraph::from_edges(3, edges);
  const std::vector<double> w = {1.0};
  auto r = rank_flow(g, w, uniform_teleport(3), 1.0, 1);
  // Node 0 routes 1/3 to node 1; nodes 1 and 2 spill 2/3 evenly (2/9 each)
  EXPECT_NEAR(r[0], 2.0 / 9.0, 1e-15);
  EXPECT_NEAR(r[1], 1.0 / 3.0 + 2.0 / 9.0, 1e-15);
  EXPECT_NEAR(r[2], 2.0 / 9.0, 1e-15);
  expect_mass_conserved(r);
}

TEST(RankFlow, DecayedCapacityBecomesDangling) {
  auto g = make_single_edge_graph();
  const std::vector<double> w = {0.5};
  const std::vector<double> teleport = {0.5, 0.5};
  auto r = rank_flow(g, w, teleport, 0.5, 1);
  // seed [0.25, 0.25]; edge adds 0.125; dangling 0.125 + 0.25 split in half
  EXPECT_NEAR(r[0], 0.4375, 1e-15);
  EXPECT_NEAR(r[1], 0.5625, 1e-15);
}

TEST(RankFlow, NormalizesByStaticOutDegree) {
  // Two parallel edges 0->1, only one active. Dividing by the active outflow
  // would send all of node 0's mass to node 1 (0.5); the structural degree
  // of 2 sends half of it and recycles the rest.
  const Edge edges[2] = {{0, 1, 0}, {0, 1, 5}};
  auto g = TemporalGraph::from_edges(2, edges);
  const std::vector<double> w = {1.0, 0.0};
  const std::vector<double> teleport = {0.5, 0.5};
  auto r = rank_flow(g, w, teleport, 1.0, 1);
  EXPECT_NEAR(r[0], 0.375, 1e-15);
  EXPECT_NEAR(r[1], 0.625, 1e-15);
}

TEST(RankFlow, AllEdgesInactiveSpreadsMassUniformly) {
  auto g = make_example_graph();
  auto w = decayed_weights(g, 0, 0.1);  // no edge exists at t=0
  const std::vector<NodeId> experts = {0};
  auto teleport = build_teleport_vector(6, experts, 0.8);
  auto r = rank_flow(g, w, teleport, 0.5, 10);
  EXPECT_NEAR(r[0], 0.5, 1e-12);
  for (std::size_t i = 1; i < 6; ++i) EXPECT_NEAR(r[i], 0.1, 1e-12);
}

TEST(RankFlow, ZeroDampingReturnsTeleport) {
  auto g = make_example_graph();
  auto w = decayed_weights(g, 8, 0.1);
  const std::vector<NodeId> experts = {0, 4};
  auto teleport = build_teleport_vector(6, experts, 0.8);
  auto r = rank_flow(g, w, teleport, 0.0, 3);
  for (std::size_t i = 0; i < 6; ++i) EXPECT_NEAR(r[i], teleport[i], 1e-15);
}

TEST(RankFlow, SelfLoopHoldsAllMass) {
  const Edge edges[1] = {{0, 0, 0}};
  auto g = TemporalGraph::from_edges(1, edges);
  const std::vector<double> w = {1.0};
  const std::vector<double> teleport = {1.0};
  auto r = rank_flow(g, w, teleport, 0.85, 25);
  ASSERT_EQ(r.size(), 1u);
  EXPECT_NEAR(r[0], 1.0, 1e-12);
}

TEST(RankFlow, ExpertsAttractMoreRank) {
  auto g = make_line_graph(5);
  const std::vector<double> w(4, 1.0);
  const std::vector<NodeId> experts = {2};
  auto biased = rank_flow(g, w, build_teleport_vector(5, experts, 0.8), 0.5, 20);
  auto plain = rank_flow(g, w, uniform_teleport(5), 0.5, 20);
  EXPECT_GT(biased[2], plain[2]);
  expect_mass_conserved(biased);
}

TEST(RankFlow, Deterministic) {
  auto g = make_random_graph(50, 200, 20, 7u);
  auto w = decayed_weights(g, 12, 0.1);
  const std::vector<NodeId> experts = {0, 5, 9};
  auto teleport = build_teleport_vector(50, experts, 0.8);
  auto a = rank_flow(g, w, teleport, 0.5, 10);
  auto b = rank_flow(g, w, teleport, 0.5, 10);
  EXPECT_EQ(a, b);
}

TEST(RankFlow, OptionsOverloadMatchesDefaults) {
  auto g = make_example_graph();
  auto w = decayed_weights(g, 9, kDefaultDecayConstant);
  const std::vector<NodeId> experts = {0};
  auto teleport = build_teleport_vector(6, experts, kDefaultExpertFraction);
  EXPECT_EQ(rank_flow(g, w, teleport, RankFlowOptions{}),
            rank_flow(g, w, teleport, kDefaultDampingFactor, kDefaultIterations));
}

TEST(RankFlow, DoesNotModifyInputs) {
  auto g = make_example_graph();
  auto w = decayed_weights(g, 7, 0.1);
  const auto w_copy = w;
  auto teleport = uniform_teleport(6);
  const auto t_copy = teleport;
  (void)rank_flow(g, w, teleport, 0.5, 10);
  EXPECT_EQ(w, w_copy);
  EXPECT_EQ(teleport, t_copy);
}

TEST(RankFlowInvalidInput, TeleportWrongLength) {
  auto g = make_single_edge_graph();
  const std::vector<double> w = {1.0};
  const std::vector<double> teleport = {1.0 / 3, 1.0 / 3, 1.0 / 3};
  EXPECT_THROW((void)rank_flow(g, w, teleport, 0.5, 1), InvalidInput);
}

TEST(RankFlowInvalidInput, WeightsWrongLength) {
  auto g = make_single_edge_graph();
  const std::vector<double> w = {1.0, 1.0};
  EXPECT_THROW((void)rank_flow(g, w, uniform_teleport(2), 0.5, 1), InvalidInput);
  EXPECT_THROW((void)rank_flow(g, {}, uniform_teleport(2), 0.5, 1), InvalidInput);
}

TEST(RankFlowInvalidInput, DampingOutOfRange) {
  auto g = make_single_edge_graph();
  const std::vector<double> w = {1.0};
  auto t = uniform_teleport(2);
  EXPECT_THROW((void)rank_flow(g, w, t, -0.01, 1), InvalidInput);
  EXPECT_THROW((void)rank_flow(g, w, t, 1.01, 1), InvalidInput);
  EXPECT_THROW((void)rank_flow(g, w, t, std::numeric_limits<double>::quiet_NaN(), 1), InvalidInput);
  EXPECT_NO_THROW((void)rank_flow(g, w, t, 0.0, 1));
  EXPECT_NO_THROW((void)rank_flow(g, w, t, 1.0, 1));
}

TEST(RankFlowInvalidInput, TeleportNotNormalized) {
  auto g = make_single_edge_graph();
  const std::vector<double> w = {1.0};
  const std::vector<double> short_mass = {0.5, 0.4};
  const std::vector<double> negative = {1.5, -0.5};
  EXPECT_THROW((void)rank_flow(g, w, short_mass, 0.5, 1), InvalidInput);
  EXPECT_THROW((void)rank_flow(g, w, negative, 0.5, 1), InvalidInput);
}

TEST(RankFlowInvalidInput, BadWeightsOrIterations) {
  auto g = make_single_edge_graph();
  auto t = uniform_teleport(2);
  const std::vector<double> negative = {-1.0};
  const std::vector<double> nan = {std::numeric_limits<double>::quiet_NaN()};
  const std::vector<double> ok = {1.0};
  EXPECT_THROW((void)rank_flow(g, negative, t, 0.5, 1), InvalidInput);
  EXPECT_THROW((void)rank_flow(g, nan, t, 0.5, 1), InvalidInput);
  EXPECT_THROW((void)rank_flow(g, ok, t, 0.5, -1), InvalidInput);
}
