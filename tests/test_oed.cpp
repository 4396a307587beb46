/**
 * @file test_oed.cpp
 * @brief Tests for OED-with-Swap decisions and end-to-end forwarding steps.
 *
 * Validates:
 *  - oed_criterion truth table (strictly greater, or equal and odd)
 *  - decide() computes every edge from one snapshot
 *  - Scenario A: a packet one hop from its destination is absorbed
 *  - Scenario B: the oldest packet of a buffer forwards first
 *  - Scenario C: even tie swaps the youngest packet backward
 *  - The last edge always forwards when non-empty
 *  - Missing path edges act as gaps
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include "aqt/net/buffer_network.hpp"
#include "aqt/protocol/oed.hpp"

using aqt::net::Buffer;
using aqt::net::BufferNetwork;
using aqt::net::PacketFactory;
using aqt::net::PacketPath;
using aqt::protocol::EdgeDecision;
using aqt::protocol::OedWithSwap;

namespace {

PacketPath nodes_upto(std::size_t last) {
  PacketPath p(last + 1);
  for (std::size_t i = 0; i <= last; ++i) p[i] = i;
  return p;
}

std::vector<std::uint64_t> rounds_of(const Buffer* buf) {
  std::vector<std::uint64_t> out;
  if (!buf) return out;
  for (const auto& p : *buf) out.push_back(p.injection_round());
  return out;
}

} // namespace

// --------------------------- Criterion -------------------------------------

/**
 * @test Criterion_Truth_Table
 */
TEST(OedWithSwap, Criterion_Truth_Table) {
  static_assert(OedWithSwap::oed_criterion(2, 1));
  EXPECT_TRUE(OedWithSwap::oed_criterion(3, 0));
  EXPECT_TRUE(OedWithSwap::oed_criterion(1, 1));
  EXPECT_TRUE(OedWithSwap::oed_criterion(3, 3));
  EXPECT_FALSE(OedWithSwap::oed_criterion(2, 2));
  EXPECT_FALSE(OedWithSwap::oed_criterion(0, 0));
  EXPECT_FALSE(OedWithSwap::oed_criterion(1, 2));
}

/**
 * @test Capacity_Is_One
 */
TEST(OedWithSwap, Capacity_Is_One) {
  EXPECT_EQ(OedWithSwap{}.capacity(), 1u);
}

// --------------------------- Scenarios -------------------------------------

/**
 * @test Scenario_A_Absorption
 * @brief 10-buffer path, packet with path 0..9 sitting on (8,9): absorbed in one step.
 */
TEST(OedWithSwap, Scenario_A_Absorption) {
  auto net = aqt::net::presets::construct_path(10);
  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create(nodes_upto(9), 0, 8), net);
  ASSERT_EQ(net.load(8, 9), 1u);

  auto absorbed = oed.forward_packets(net);
  EXPECT_EQ(net.load(8, 9), 0u);
  ASSERT_EQ(absorbed.size(), 1u);
  EXPECT_EQ(absorbed[0].id(), 0u);
  EXPECT_TRUE(absorbed[0].is_absorbed());
  EXPECT_EQ(net.total_load(), 0u);
}

/**
 * @test Scenario_B_Oldest_Forwards_First
 */
TEST(OedWithSwap, Scenario_B_Oldest_Forwards_First) {
  auto net = aqt::net::presets::construct_path(10);
  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create(nodes_upto(10), 1, 0), net);
  oed.add_packet(f.create(nodes_upto(10), 0, 0), net);

  auto absorbed = oed.forward_packets(net);
  EXPECT_TRUE(absorbed.empty());
  EXPECT_EQ(rounds_of(net.peek(0, 1)), (std::vector<std::uint64_t>{1}));
  EXPECT_EQ(rounds_of(net.peek(1, 2)), (std::vector<std::uint64_t>{0}));
}

/**
 * @test Scenario_C_Even_Swap
 * @brief Loads 2 and 2 (even tie): the round-2 packet of (1,2) swaps back into
 *        (0,1), the round-0 packet of (0,1) advances, the round-1 packet of
 *        (1,2) stays in the network.
 */
TEST(OedWithSwap, Scenario_C_Even_Swap) {
  auto net = aqt::net::presets::construct_path(10);
  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create(nodes_upto(10), 0, 0), net);
  oed.add_packet(f.create(nodes_upto(10), 1, 0), net);
  oed.add_packet(f.create(nodes_upto(10), 1, 1), net);
  const auto swapped = f.create(nodes_upto(10), 2, 1);
  oed.add_packet(swapped, net);

  const auto d = oed.decide(net);
  ASSERT_EQ(d.size(), 10u);
  EXPECT_EQ(d[0], (EdgeDecision{true, false}));
  EXPECT_EQ(d[1], (EdgeDecision{true, true}));

  auto absorbed = oed.forward_packets(net);
  EXPECT_TRUE(absorbed.empty());
  EXPECT_EQ(net.total_load(), 4u);

  EXPECT_EQ(rounds_of(net.peek(0, 1)), (std::vector<std::uint64_t>{1, 2}));
  EXPECT_EQ(rounds_of(net.peek(1, 2)), (std::vector<std::uint64_t>{0}));
  EXPECT_EQ(rounds_of(net.peek(2, 3)), (std::vector<std::uint64_t>{1}));

  const Buffer* back = net.peek(0, 1);
  ASSERT_NE(back, nullptr);
  EXPECT_EQ(back->back(), swapped);
  EXPECT_EQ(back->back().cursor(), 0u);
}

// --------------------------- Decisions -------------------------------------

/**
 * @test Decide_Empty_Network
 */
TEST(OedWithSwap, Decide_Empty_Network) {
  auto net = aqt::net::presets::construct_path(4);
  const auto d = OedWithSwap{}.decide(net);
  ASSERT_EQ(d.size(), 4u);
  for (const auto& e : d) EXPECT_EQ(e, EdgeDecision{});
}

/**
 * @test Last_Edge_Always_Forwards
 * @brief The final path edge has no successor to compare with.
 */
TEST(OedWithSwap, Last_Edge_Always_Forwards) {
  auto net = aqt::net::presets::construct_path(3);
  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create(nodes_upto(3), 0, 2), net);
  oed.add_packet(f.create(nodes_upto(3), 1, 2), net);

  const auto d = oed.decide(net);
  EXPECT_TRUE(d[2].forward);

  auto absorbed = oed.forward_packets(net);
  ASSERT_EQ(absorbed.size(), 1u);
  EXPECT_EQ(absorbed[0].injection_round(), 0u);
  EXPECT_EQ(net.load(2, 3), 1u);
}

/**
 * @test Blocked_When_Next_Is_Fuller_And_Older
 * @brief Criterion false and successor's youngest is older: no forward move.
 */
TEST(OedWithSwap, Blocked_When_Next_Is_Fuller_And_Older) {
  auto net = aqt::net::presets::construct_path(3);
  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create(nodes_upto(3), 0, 1), net);
  oed.add_packet(f.create(nodes_upto(3), 0, 1), net);
  oed.add_packet(f.create(nodes_upto(3), 5, 0), net);

  const auto d = oed.decide(net);
  EXPECT_FALSE(d[0].forward);
  EXPECT_FALSE(d[0].backward);
  EXPECT_TRUE(d[1].forward);
  // Youngest of (1,2) is older than the oldest of (0,1): no swap.
  EXPECT_FALSE(d[1].backward);
}

/**
 * @test Gap_In_Path_Treated_As_Last_Edge
 * @brief Edge (1,2) missing: (0,1) forwards like a last edge, (2,3) never swaps back.
 */
TEST(OedWithSwap, Gap_In_Path_Treated_As_Last_Edge) {
  BufferNetwork net;
  for (int i = 0; i < 4; ++i) (void)net.add_node();
  net.add_edge(0, 1);
  net.add_edge(2, 3);

  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create({0, 1}, 0, 0), net);
  oed.add_packet(f.create({2, 3}, 0, 0), net);

  const auto d = oed.decide(net);
  ASSERT_EQ(d.size(), 3u);
  EXPECT_EQ(d[0], (EdgeDecision{true, false}));
  EXPECT_EQ(d[1], EdgeDecision{});
  EXPECT_EQ(d[2], (EdgeDecision{true, false}));

  auto absorbed = oed.forward_packets(net);
  EXPECT_EQ(absorbed.size(), 2u);
  EXPECT_EQ(net.total_load(), 0u);
}

/**
 * @test No_Swap_Into_Edge_That_Passes_Criterion
 * @brief (0,1) passes the criterion against (1,2), so (1,2) never sends back into it.
 */
TEST(OedWithSwap, No_Swap_Into_Edge_That_Passes_Criterion) {
  auto net = aqt::net::presets::construct_path(4);
  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create(nodes_upto(4), 0, 0), net);
  oed.add_packet(f.create(nodes_upto(4), 0, 0), net);
  oed.add_packet(f.create(nodes_upto(4), 9, 1), net);

  const auto d = oed.decide(net);
  EXPECT_TRUE(d[0].forward);
  EXPECT_TRUE(d[1].forward);
  EXPECT_FALSE(d[1].backward);

  (void)oed.forward_packets(net);
  EXPECT_EQ(net.total_load(), 3u);
  EXPECT_EQ(net.load(0, 1), 1u);
  EXPECT_EQ(net.load(1, 2), 1u);
  EXPECT_EQ(net.load(2, 3), 1u);
}

/**
 * @test Odd_Tie_Forwards_Without_Swap
 * @brief Loads 1 and 1: criterion holds (odd), the packet moves on and nothing swaps back.
 */
TEST(OedWithSwap, Odd_Tie_Forwards_Without_Swap) {
  auto net = aqt::net::presets::construct_path(4);
  OedWithSwap oed;
  PacketFactory f;
  oed.add_packet(f.create(nodes_upto(4), 3, 0), net);
  oed.add_packet(f.create(nodes_upto(4), 0, 1), net);

  const auto d = oed.decide(net);
  EXPECT_EQ(d[0], (EdgeDecision{true, false}));
  EXPECT_EQ(d[1], (EdgeDecision{true, false}));

  (void)oed.forward_packets(net);
  EXPECT_EQ(rounds_of(net.peek(1, 2)), (std::vector<std::uint64_t>{3}));
  EXPECT_EQ(rounds_of(net.peek(2, 3)), (std::vector<std::uint64_t>{0}));
}
