/**
 * @file test_packet.cpp
 * @brief Tests for Packet cursor semantics and PacketFactory id assignment.
 *
 * Validates:
 *  - Ids are unique and increasing per factory, independent across factories
 *  - current_node / next_node / will_absorb_next / is_absorbed along a path
 *  - dist_to_go counts the absorption step
 *  - Equality compares ids only
 *  - Contract violations abort (advance past the end, retreat from 0, bad cursor)
 */

#include <gtest/gtest.h>
#include <vector>

#include "aqt/net/packet.hpp"

using aqt::net::Packet;
using aqt::net::PacketFactory;
using aqt::net::PacketPath;

// --------------------------- Factory ---------------------------------------

/**
 * @test Factory_Ids_Unique_And_Increasing
 * @brief Consecutive create() calls hand out 0, 1, 2, ...
 */
TEST(PacketFactory, Factory_Ids_Unique_And_Increasing) {
  PacketFactory f;
  EXPECT_EQ(f.next_id(), 0u);

  auto a = f.create({0, 1}, 1, 0);
  auto b = f.create({0, 1}, 1, 0);
  auto c = f.create({0, 1}, 2, 0);

  EXPECT_EQ(a.id(), 0u);
  EXPECT_EQ(b.id(), 1u);
  EXPECT_EQ(c.id(), 2u);
  EXPECT_EQ(f.next_id(), 3u);
}

/**
 * @test Factory_Independent_Per_Instance
 * @brief Two factories do not share a counter.
 */
TEST(PacketFactory, Factory_Independent_Per_Instance) {
  PacketFactory f1;
  PacketFactory f2;
  (void)f1.create({0, 1}, 0, 0);
  auto p = f2.create({0, 1}, 0, 0);
  EXPECT_EQ(p.id(), 0u);
}

/**
 * @test Factory_Keeps_Path_Round_Cursor
 */
TEST(PacketFactory, Factory_Keeps_Path_Round_Cursor) {
  PacketFactory f;
  const PacketPath path{3, 4, 5, 6};
  auto p = f.create(path, 7, 2);
  EXPECT_EQ(p.path(), path);
  EXPECT_EQ(p.injection_round(), 7u);
  EXPECT_EQ(p.cursor(), 2u);
}

// --------------------------- Cursor ----------------------------------------

/**
 * @test Cursor_Walk_To_Absorption
 * @brief Walk a 3-node path; check every query at every cursor position.
 */
TEST(Packet, Cursor_Walk_To_Absorption) {
  PacketFactory f;
  auto p = f.create({10, 11, 12}, 0, 0);

  EXPECT_EQ(p.current_node(), 10u);
  EXPECT_EQ(p.next_node(), 11u);
  EXPECT_FALSE(p.will_absorb_next());
  EXPECT_FALSE(p.is_absorbed());
  EXPECT_EQ(p.dist_to_go(), 3u);

  p.advance();
  EXPECT_EQ(p.current_node(), 11u);
  EXPECT_EQ(p.next_node(), 12u);
  EXPECT_EQ(p.dist_to_go(), 2u);

  p.advance();
  EXPECT_EQ(p.current_node(), 12u);
  EXPECT_FALSE(p.next_node().has_value());
  EXPECT_TRUE(p.will_absorb_next());
  EXPECT_FALSE(p.is_absorbed());
  EXPECT_EQ(p.dist_to_go(), 1u);

  p.advance();
  EXPECT_TRUE(p.is_absorbed());
  EXPECT_FALSE(p.will_absorb_next());
  EXPECT_FALSE(p.current_node().has_value());
  EXPECT_FALSE(p.next_node().has_value());
  EXPECT_EQ(p.dist_to_go(), 0u);
}

/**
 * @test Cursor_Retreat_Undoes_Advance
 */
TEST(Packet, Cursor_Retreat_Undoes_Advance) {
  PacketFactory f;
  auto p = f.create({0, 1, 2, 3}, 0, 2);
  p.retreat();
  EXPECT_EQ(p.cursor(), 1u);
  EXPECT_EQ(p.current_node(), 1u);
  p.advance();
  EXPECT_EQ(p.cursor(), 2u);
}

/**
 * @test Cursor_At_End_Is_Absorbed
 * @brief A packet created with cursor == len(path) is already absorbed.
 */
TEST(Packet, Cursor_At_End_Is_Absorbed) {
  PacketFactory f;
  auto p = f.create({0, 1}, 0, 2);
  EXPECT_TRUE(p.is_absorbed());
}

/**
 * @test Equality_By_Id_Only
 */
TEST(Packet, Equality_By_Id_Only) {
  PacketFactory f;
  auto a = f.create({0, 1, 2}, 0, 0);
  auto b = f.create({0, 1, 2}, 0, 0);
  auto a2 = a;
  a2.advance();

  EXPECT_EQ(a, a2);
  EXPECT_NE(a, b);
}

/**
 * @test ToString_Format
 */
TEST(Packet, ToString_Format) {
  PacketFactory f;
  auto p = f.create({5, 6}, 3, 0);
  EXPECT_EQ(p.to_string(), "Packet{id=0, cur=5, rd=3}");
  p.advance();
  p.advance();
  EXPECT_EQ(p.to_string(), "Packet{id=0, cur=absorbed, rd=3}");
}

// --------------------------- Contract violations ---------------------------

TEST(PacketDeathTest, Advance_Past_End_Aborts) {
  PacketFactory f;
  auto p = f.create({0, 1}, 0, 2);
  EXPECT_DEATH(p.advance(), "already been absorbed");
}

TEST(PacketDeathTest, Retreat_From_Start_Aborts) {
  PacketFactory f;
  auto p = f.create({0, 1}, 0, 0);
  EXPECT_DEATH(p.retreat(), "start of its path");
}

TEST(PacketDeathTest, Create_Cursor_Beyond_Path_Aborts) {
  PacketFactory f;
  EXPECT_DEATH((void)f.create({0, 1}, 0, 3), "cursor beyond end of path");
}
