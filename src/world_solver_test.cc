// Copyright 2022 Ola Rozenfeld
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "src/world_solver.h"

#include <iterator>
#include <set>

#include "ortools/base/logging.h"
#include "src/deck.h"
#include "src/knowledge_store.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace clue {
namespace {

using std::set;

const Card kHiddenCards[] = {
    MISS_SCARLET, MR_GREEN, MRS_PEACOCK, CANDLESTICK, KNIFE, REVOLVER,
    LIBRARY, LOUNGE
};

Deal ThreePlayerDeal() {
  return Deal(NewGuess(MISS_SCARLET, CANDLESTICK, LIBRARY), {
      {COLONEL_MUSTARD, PROFESSOR_PLUM, ROPE, LEAD_PIPE, KITCHEN, STUDY},
      {MR_GREEN, MRS_WHITE, KNIFE, WRENCH, CONSERVATORY, HALL},
      {MRS_PEACOCK, REVOLVER, DINING_ROOM, BILLIARD_ROOM, LOUNGE, BALLROOM}});
}

// Knows the holder of every card but the hidden ones. Player 1 misses two
// cards, player 2 three, and the envelope has 3 x 3 x 2 choices, which makes
// 18 * C(5, 2) = 180 worlds.
KnowledgeStore PartiallyRevealedStore(const Deal& deal) {
  KnowledgeStore store(OBSERVER, deal.HandSizes());
  const set<Card> hidden(std::begin(kHiddenCards), std::end(kHiddenCards));
  for (Card card : BuildDeck()) {
    if (!hidden.contains(card)) {
      const absl::Status st = store.AssertPositive(card, deal.HolderOf(card));
      CHECK(st.ok()) << st;
    }
  }
  return store;
}

// Whether the world agrees with every fact of the store.
bool AgreesWithStore(const SolverResponse::World& world,
                     const KnowledgeStore& store) {
  for (Card card : BuildDeck()) {
    const int holder = world.holders(CardIndex(card));
    if (store.IsNegative(card, holder)) {
      return false;
    }
  }
  return true;
}

TEST(WorldSolver, OmniscientStoreHasOneWorld) {
  const Deal deal = ThreePlayerDeal();
  SolverRequest request;
  request.set_keep_worlds(true);
  const SolverResponse r = Solve(KnowledgeStore::Omniscient(deal), request);
  EXPECT_TRUE(r.complete());
  ASSERT_EQ(r.num_worlds(), 1);
  ASSERT_EQ(r.worlds_size(), 1);
  for (Card card : BuildDeck()) {
    EXPECT_EQ(r.worlds(0).holders(CardIndex(card)), deal.HolderOf(card))
        << CardName(card);
  }
}

TEST(WorldSolver, CountsPartiallyRevealedWorlds) {
  const Deal deal = ThreePlayerDeal();
  const KnowledgeStore store = PartiallyRevealedStore(deal);
  SolverRequest request;
  request.set_keep_worlds(true);
  const SolverResponse r = Solve(store, request);
  EXPECT_TRUE(r.complete());
  EXPECT_EQ(r.num_worlds(), 180);
  ASSERT_EQ(r.worlds_size(), 180);
  set<vector<int>> distinct;
  for (const auto& world : r.worlds()) {
    EXPECT_TRUE(AgreesWithStore(world, store));
    distinct.insert(vector<int>(world.holders().begin(),
                                world.holders().end()));
  }
  EXPECT_EQ(distinct.size(), 180);
  EXPECT_EQ(r.envelope_counts(CardIndex(MISS_SCARLET)), 60);
  EXPECT_EQ(r.envelope_counts(CardIndex(LIBRARY)), 90);
  EXPECT_EQ(r.envelope_counts(CardIndex(COLONEL_MUSTARD)), 0);
  EXPECT_EQ(r.player_counts(CardIndex(COLONEL_MUSTARD) * 3 + 0), 180);
  // Given its envelope choice, Miss Scarlet goes to player 1 in 2 of 5
  // cases: 120 * 2 / 5.
  EXPECT_EQ(r.player_counts(CardIndex(MISS_SCARLET) * 3 + 1), 48);
}

TEST(WorldSolver, SetConstraintsAndExcludedSolutions) {
  const Deal deal = ThreePlayerDeal();
  KnowledgeStore store = PartiallyRevealedStore(deal);
  ASSERT_TRUE(store.AssertNotSolution(
      NewGuess(MRS_PEACOCK, REVOLVER, LOUNGE)).ok());
  ASSERT_TRUE(store.AssertSetConstraint(2, {MR_GREEN, KNIFE}).ok());
  SolverRequest request;
  request.set_keep_worlds(true);
  const SolverResponse r = Solve(store, request);
  EXPECT_TRUE(r.complete());
  EXPECT_GT(r.num_worlds(), 0);
  EXPECT_LT(r.num_worlds(), 180);
  for (const auto& world : r.worlds()) {
    auto holder = [&world](Card card) {
      return world.holders(CardIndex(card));
    };
    EXPECT_TRUE(holder(MR_GREEN) == 2 || holder(KNIFE) == 2);
    EXPECT_FALSE(holder(MRS_PEACOCK) == kEnvelope &&
                 holder(REVOLVER) == kEnvelope && holder(LOUNGE) == kEnvelope);
  }
}

TEST(WorldSolver, StopAfterFirstSolution) {
  const Deal deal = ThreePlayerDeal();
  const KnowledgeStore store = PartiallyRevealedStore(deal);
  SolverRequest request;
  request.set_stop_after_first_solution(true);
  const SolverResponse r = Solve(store, request);
  EXPECT_EQ(r.num_worlds(), 1);
  EXPECT_FALSE(r.complete());
  EXPECT_TRUE(IsValidWorld(store));
}

TEST(WorldSolver, MaxWorlds) {
  const Deal deal = ThreePlayerDeal();
  SolverRequest request;
  request.set_max_worlds(10);
  const SolverResponse r = Solve(PartiallyRevealedStore(deal), request);
  EXPECT_EQ(r.num_worlds(), 10);
  EXPECT_FALSE(r.complete());
}

TEST(WorldSolver, ContradictionHasNoWorlds) {
  KnowledgeStore store(OBSERVER, HandSizes(3));
  ASSERT_TRUE(store.AssertPositive(ROPE, 0).ok());
  ASSERT_TRUE(IsContradiction(store.AssertPositive(ROPE, 1)));
  const SolverResponse r = Solve(store);
  EXPECT_EQ(r.num_worlds(), 0);
  EXPECT_TRUE(r.complete());
  EXPECT_FALSE(IsValidWorld(store));
}

}  // namespace
}  // namespace clue

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
