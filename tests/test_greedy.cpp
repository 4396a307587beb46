/**
 * @file test_greedy.cpp
 * @brief Tests for the priority order and the Greedy-FIFO / Greedy-LIS protocols.
 *
 * Validates:
 *  - higher_priority: round first, id second; oldest/youngest/LIS index helpers
 *  - FIFO forwards from the front, up to `capacity` per buffer
 *  - LIS forwards the smallest injection round, first found on ties
 *  - Moves are decided from the start-of-round state (one hop per call)
 *  - Packets reaching their last node are absorbed and returned
 *  - Protocol variant dispatch and name parsing
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include "aqt/net/buffer_network.hpp"
#include "aqt/protocol/greedy.hpp"
#include "aqt/protocol/priority.hpp"
#include "aqt/protocol/protocol.hpp"

using aqt::net::Buffer;
using aqt::net::BufferNetwork;
using aqt::net::Packet;
using aqt::net::PacketFactory;
using aqt::net::PacketPath;
using aqt::protocol::GreedyFifo;
using aqt::protocol::GreedyLis;
using aqt::protocol::Protocol;
using aqt::protocol::ProtocolKind;

namespace {

PacketPath full_path(std::size_t num_nodes) {
  PacketPath p(num_nodes);
  for (std::size_t i = 0; i < num_nodes; ++i) p[i] = i;
  return p;
}

std::vector<std::uint64_t> ids_of(const Buffer* buf) {
  std::vector<std::uint64_t> out;
  if (!buf) return out;
  for (const auto& p : *buf) out.push_back(p.id());
  return out;
}

} // namespace

// --------------------------- Priority --------------------------------------

/**
 * @test Priority_Round_Then_Id
 */
TEST(Priority, Priority_Round_Then_Id) {
  PacketFactory f;
  auto a = f.create({0, 1}, 1, 0); // id 0, rd 1
  auto b = f.create({0, 1}, 0, 0); // id 1, rd 0
  auto c = f.create({0, 1}, 1, 0); // id 2, rd 1

  EXPECT_TRUE(aqt::protocol::higher_priority(b, a));
  EXPECT_FALSE(aqt::protocol::higher_priority(a, b));
  EXPECT_TRUE(aqt::protocol::higher_priority(a, c));
  EXPECT_TRUE(aqt::protocol::higher_priority(b, c));
  EXPECT_FALSE(aqt::protocol::higher_priority(c, b));
  EXPECT_FALSE(aqt::protocol::higher_priority(a, a));
}

/**
 * @test Priority_Strict_Total_Order
 * @brief Over a mixed set: irreflexive, antisymmetric, total on distinct packets, transitive.
 */
TEST(Priority, Priority_Strict_Total_Order) {
  using aqt::protocol::higher_priority;
  PacketFactory f;
  std::vector<Packet> ps;
  for (std::uint64_t rd : {2u, 0u, 1u, 0u, 2u, 1u}) ps.push_back(f.create({0, 1}, rd, 0));

  for (const auto& p : ps) {
    EXPECT_FALSE(higher_priority(p, p)) << p.to_string();
    for (const auto& q : ps) {
      if (p == q) continue;
      // Exactly one direction holds for distinct packets.
      EXPECT_NE(higher_priority(p, q), higher_priority(q, p)) << p.to_string() << " vs " << q.to_string();
      for (const auto& r : ps) {
        if (higher_priority(p, q) && higher_priority(q, r)) {
          EXPECT_TRUE(higher_priority(p, r))
              << p.to_string() << " > " << q.to_string() << " > " << r.to_string();
        }
      }
    }
  }
}

/**
 * @test Priority_Buffer_Helpers
 */
TEST(Priority, Priority_Buffer_Helpers) {
  PacketFactory f;
  Buffer buf;
  EXPECT_FALSE(aqt::protocol::oldest_index(buf).has_value());
  EXPECT_FALSE(aqt::protocol::youngest_index(buf).has_value());
  EXPECT_FALSE(aqt::protocol::longest_in_system_index(buf).has_value());

  buf.push_back(f.create({0, 1}, 2, 0)); // id 0
  buf.push_back(f.create({0, 1}, 1, 0)); // id 1
  buf.push_back(f.create({0, 1}, 3, 0)); // id 2
  buf.push_back(f.create({0, 1}, 1, 0)); // id 3

  EXPECT_EQ(aqt::protocol::oldest_index(buf), 1u);
  EXPECT_EQ(aqt::protocol::youngest_index(buf), 2u);
  EXPECT_EQ(aqt::protocol::longest_in_system_index(buf), 1u);
}

// --------------------------- Greedy-FIFO -----------------------------------

/**
 * @test Fifo_Forwards_Front_One_Hop
 * @brief Capacity 1: only the front packet moves, and only one hop per call.
 */
TEST(GreedyFifo, Fifo_Forwards_Front_One_Hop) {
  auto net = aqt::net::presets::construct_path(3);
  GreedyFifo fifo{1};
  PacketFactory f;
  fifo.add_packet(f.create(full_path(4), 0, 0), net); // id 0
  fifo.add_packet(f.create(full_path(4), 0, 0), net); // id 1

  auto absorbed = fifo.forward_packets(net);
  EXPECT_TRUE(absorbed.empty());
  EXPECT_EQ(ids_of(net.peek(0, 1)), (std::vector<std::uint64_t>{1}));
  EXPECT_EQ(ids_of(net.peek(1, 2)), (std::vector<std::uint64_t>{0}));
  EXPECT_EQ(ids_of(net.peek(2, 3)), (std::vector<std::uint64_t>{}));
}

/**
 * @test Fifo_Capacity_Bounds_Removals
 * @brief Each buffer loses at most `capacity` packets per call.
 */
TEST(GreedyFifo, Fifo_Capacity_Bounds_Removals) {
  auto net = aqt::net::presets::construct_path(2);
  GreedyFifo fifo{2};
  PacketFactory f;
  for (int i = 0; i < 5; ++i) fifo.add_packet(f.create(full_path(3), 0, 0), net);

  (void)fifo.forward_packets(net);
  EXPECT_EQ(net.load(0, 1), 3u);
  EXPECT_EQ(ids_of(net.peek(1, 2)), (std::vector<std::uint64_t>{0, 1}));
  EXPECT_EQ(net.total_load(), 5u);
}

/**
 * @test Fifo_Absorbs_At_Last_Node
 */
TEST(GreedyFifo, Fifo_Absorbs_At_Last_Node) {
  auto net = aqt::net::presets::construct_path(3);
  GreedyFifo fifo{1};
  PacketFactory f;
  fifo.add_packet(f.create(full_path(4), 0, 2), net); // on (2,3)
  fifo.add_packet(f.create({0, 1}, 0, 0), net);       // on (0,1), path ends at 1

  auto absorbed = fifo.forward_packets(net);
  ASSERT_EQ(absorbed.size(), 2u);
  EXPECT_TRUE(absorbed[0].is_absorbed());
  EXPECT_TRUE(absorbed[1].is_absorbed());
  EXPECT_EQ(net.total_load(), 0u);
}

/**
 * @test Fifo_Conserves_Packets
 * @brief Across several rounds, in-network + absorbed stays equal to injected.
 */
TEST(GreedyFifo, Fifo_Conserves_Packets) {
  auto net = aqt::net::presets::construct_path(4);
  GreedyFifo fifo{1};
  PacketFactory f;
  std::size_t injected = 0;
  std::size_t absorbed = 0;
  for (std::uint64_t rd = 1; rd <= 12; ++rd) {
    fifo.add_packet(f.create(full_path(5), rd, rd % 3), net);
    ++injected;
    absorbed += fifo.forward_packets(net).size();
    EXPECT_EQ(net.total_load() + absorbed, injected);
  }
  EXPECT_GT(absorbed, 0u);
}

// --------------------------- Greedy-LIS ------------------------------------

/**
 * @test Lis_Forwards_Oldest_Round
 */
TEST(GreedyLis, Lis_Forwards_Oldest_Round) {
  auto net = aqt::net::presets::construct_path(2);
  GreedyLis lis{1};
  PacketFactory f;
  lis.add_packet(f.create(full_path(3), 5, 0), net); // id 0
  lis.add_packet(f.create(full_path(3), 2, 0), net); // id 1
  lis.add_packet(f.create(full_path(3), 4, 0), net); // id 2

  (void)lis.forward_packets(net);
  EXPECT_EQ(ids_of(net.peek(1, 2)), (std::vector<std::uint64_t>{1}));
  EXPECT_EQ(ids_of(net.peek(0, 1)), (std::vector<std::uint64_t>{0, 2}));
}

/**
 * @test Lis_Ties_First_Found
 * @brief Equal rounds: the earlier packet in the buffer wins, re-scanned per slot.
 */
TEST(GreedyLis, Lis_Ties_First_Found) {
  auto net = aqt::net::presets::construct_path(2);
  GreedyLis lis{2};
  PacketFactory f;
  lis.add_packet(f.create(full_path(3), 3, 0), net); // id 0
  lis.add_packet(f.create(full_path(3), 1, 0), net); // id 1
  lis.add_packet(f.create(full_path(3), 3, 0), net); // id 2

  (void)lis.forward_packets(net);
  EXPECT_EQ(ids_of(net.peek(1, 2)), (std::vector<std::uint64_t>{1, 0}));
  EXPECT_EQ(ids_of(net.peek(0, 1)), (std::vector<std::uint64_t>{2}));
}

// --------------------------- Protocol variant ------------------------------

/**
 * @test Protocol_Kind_Names
 */
TEST(Protocol, Protocol_Kind_Names) {
  EXPECT_EQ(aqt::protocol::parse_protocol_kind("greedy_fifo"), ProtocolKind::GreedyFifo);
  EXPECT_EQ(aqt::protocol::parse_protocol_kind("greedy_lis"), ProtocolKind::GreedyLis);
  EXPECT_EQ(aqt::protocol::parse_protocol_kind("oed_with_swap"), ProtocolKind::OedWithSwap);
  EXPECT_FALSE(aqt::protocol::parse_protocol_kind("fifo").has_value());

  auto p = Protocol::make(ProtocolKind::GreedyLis, 3);
  EXPECT_EQ(p.kind(), ProtocolKind::GreedyLis);
  EXPECT_STREQ(p.name(), "greedy_lis");
  EXPECT_EQ(p.capacity(), 3u);
  EXPECT_EQ(Protocol::make(ProtocolKind::OedWithSwap, 7).capacity(), 1u);
}

/**
 * @test Protocol_Dispatches_To_Alternative
 */
TEST(Protocol, Protocol_Dispatches_To_Alternative) {
  auto net = aqt::net::presets::construct_path(1);
  auto p = Protocol::greedy_fifo(1);
  PacketFactory f;
  p.add_packet(f.create({0, 1}, 0, 0), net);
  EXPECT_EQ(net.load(0, 1), 1u);
  auto absorbed = p.forward_packets(net);
  ASSERT_EQ(absorbed.size(), 1u);
  EXPECT_EQ(absorbed[0].id(), 0u);
}

// --------------------------- Contract violations ---------------------------

TEST(GreedyDeathTest, Zero_Capacity_Aborts) {
  EXPECT_DEATH((void)GreedyFifo{0}, "capacity must be at least 1");
  EXPECT_DEATH((void)GreedyLis{0}, "capacity must be at least 1");
}

TEST(GreedyDeathTest, Add_Absorbed_Packet_Aborts) {
  auto net = aqt::net::presets::construct_path(1);
  GreedyFifo fifo{1};
  PacketFactory f;
  EXPECT_DEATH(fifo.add_packet(f.create({0, 1}, 0, 2), net), "absorbed or has no next hop");
}
