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

#include "src/game.h"

#include <memory>
#include <optional>
#include <utility>

#include "ortools/base/logging.h"
#include "src/deck.h"
#include "src/knowledge_store.h"
#include "src/strategy.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace clue {
namespace {

using std::make_unique;
using testing::ElementsAre;

// Always makes the same guess, and the same accusation if there is one.
class FixedStrategy : public Strategy {
 public:
  FixedStrategy(const Guess& guess, optional<Guess> accusation)
      : guess_(guess), accusation_(accusation) {}
  string Name() const override { return "fixed"; }
  Guess ChooseGuess(const KnowledgeStore& store,
                    const EstimatorResponse& posterior) override {
    return guess_;
  }
  optional<Guess> ChooseAccusation(
      const KnowledgeStore& store, const EstimatorResponse& posterior) override {
    return accusation_;
  }

 private:
  Guess guess_;
  optional<Guess> accusation_;
};

Deal MustDeal(int num_players, uint64_t seed) {
  const auto deal = DealCards(num_players, seed);
  CHECK(deal.ok()) << deal.status();
  return *deal;
}

// A triple that differs from the envelope in the weapon only.
Guess WrongAccusation(const Deal& deal) {
  const Guess& envelope = deal.Envelope();
  const Card weapon = envelope.weapon() == ROPE ? KNIFE : ROPE;
  return NewGuess(envelope.person(), weapon, envelope.room());
}

// A guess with a person card held by some player. Nobody disproves it only
// when the guesser holds that card.
Guess SafeGuess(const Deal& deal) {
  const Card person = deal.Envelope().person() == MR_GREEN ? MRS_WHITE :
                      MR_GREEN;
  return NewGuess(person, ROPE, HALL);
}

vector<unique_ptr<Strategy>> FixedStrategies(const Deal& deal,
                                             optional<Guess> accusation) {
  vector<unique_ptr<Strategy>> strategies;
  for (int i = 0; i < deal.NumPlayers(); ++i) {
    strategies.push_back(make_unique<FixedStrategy>(SafeGuess(deal),
                                                    accusation));
  }
  return strategies;
}

vector<unique_ptr<Strategy>> NamedStrategies(const vector<string>& names,
                                             uint64_t seed) {
  vector<unique_ptr<Strategy>> strategies;
  for (int i = 0; i < names.size(); ++i) {
    auto strategy = NewStrategy(names[i], seed + i, 1);
    CHECK(strategy.ok()) << strategy.status();
    strategies.push_back(std::move(*strategy));
  }
  return strategies;
}

// The last event must be the winning accusation.
void ExpectCorrectWin(const Game& game, const GameResult& result) {
  ASSERT_EQ(result.end_state(), WIN);
  ASSERT_GE(result.winner(), 0);
  ASSERT_GT(game.Log().events_size(), 0);
  const Event& last = game.Log().events(game.Log().events_size() - 1);
  ASSERT_TRUE(last.has_accusation());
  EXPECT_EQ(last.accusation().accuser(), result.winner());
  EXPECT_TRUE(last.accusation().correct());
  EXPECT_TRUE(last.accusation().accusation() == game.GetDeal().Envelope());
  EXPECT_FALSE(game.Context().eliminated[result.winner()]);
  EXPECT_EQ(result.winner_strategy(),
            game.Log().strategies(result.winner()));
}

TEST(PhaseName, Names) {
  EXPECT_EQ(PhaseName(Phase::kTurnStart), "TURN_START");
  EXPECT_EQ(PhaseName(Phase::kMaybeAccuse), "MAYBE_ACCUSE");
  EXPECT_EQ(PhaseName(Phase::kAllEliminated), "ALL_ELIMINATED");
}

TEST(Game, StepsThroughOneTurn) {
  const Deal deal = MustDeal(4, 7);
  Game game(deal, FixedStrategies(deal, std::nullopt), GameOptions());
  EXPECT_EQ(game.Context().phase, Phase::kTurnStart);
  EXPECT_EQ(game.Log().setup().num_players(), 4);
  EXPECT_TRUE(game.Step());
  EXPECT_EQ(game.Context().phase, Phase::kGuess);
  EXPECT_EQ(game.Context().turn, 1);
  EXPECT_TRUE(game.Step());
  EXPECT_EQ(game.Context().phase, Phase::kResolve);
  EXPECT_TRUE(game.Step());
  EXPECT_EQ(game.Context().phase, Phase::kMaybeAccuse);
  ASSERT_EQ(game.Log().events_size(), 1);
  const GuessEvent& event = game.Log().events(0).guess();
  EXPECT_EQ(event.guesser(), 0);
  EXPECT_TRUE(event.guess() == SafeGuess(deal));
  EXPECT_TRUE(game.Step());
  EXPECT_EQ(game.Context().phase, Phase::kTurnEnd);
  EXPECT_TRUE(game.Step());
  EXPECT_EQ(game.Context().phase, Phase::kTurnStart);
  EXPECT_EQ(game.Context().active_player, 1);
  EXPECT_FALSE(game.IsOver());
}

TEST(Game, TurnLimit) {
  const Deal deal = MustDeal(4, 7);
  GameOptions options;
  options.max_turns = 5;
  Game game(deal, FixedStrategies(deal, std::nullopt), options);
  const GameResult result = game.Play();
  EXPECT_EQ(result.end_state(), TURN_LIMIT);
  EXPECT_EQ(result.turn_count(), 5);
  EXPECT_EQ(result.winner(), kNoPlayer);
  EXPECT_EQ(game.Log().events_size(), 5);
  EXPECT_GE(result.final_posterior_accuracy(), 0);
  EXPECT_LE(result.final_posterior_accuracy(), 1 + 1e-9);
}

TEST(Game, AllEliminated) {
  const Deal deal = MustDeal(3, 11);
  const Guess wrong = WrongAccusation(deal);
  Game game(deal, FixedStrategies(deal, wrong), GameOptions());
  const GameResult result = game.Play();
  EXPECT_EQ(result.end_state(), ALL_ELIMINATED);
  EXPECT_EQ(result.turn_count(), 3);
  EXPECT_THAT(result.eliminated(), ElementsAre(0, 1, 2));
  for (int i = 0; i < 3; ++i) {
    ASSERT_EQ(game.Store(i).ExcludedSolutions().size(), 1);
    EXPECT_TRUE(game.Store(i).ExcludedSolutions()[0] == wrong);
  }
  // Guesses and accusations alternate.
  ASSERT_EQ(game.Log().events_size(), 6);
  EXPECT_TRUE(game.Log().events(1).has_accusation());
  EXPECT_FALSE(game.Log().events(1).accusation().correct());
}

TEST(Game, EliminatedPlayersSkipTurns) {
  const Deal deal = MustDeal(3, 11);
  vector<unique_ptr<Strategy>> strategies;
  strategies.push_back(make_unique<FixedStrategy>(
      SafeGuess(deal), WrongAccusation(deal)));
  strategies.push_back(make_unique<FixedStrategy>(
      SafeGuess(deal), std::nullopt));
  strategies.push_back(make_unique<FixedStrategy>(
      SafeGuess(deal), std::nullopt));
  GameOptions options;
  options.max_turns = 7;
  Game game(deal, std::move(strategies), options);
  const GameResult result = game.Play();
  EXPECT_EQ(result.end_state(), TURN_LIMIT);
  EXPECT_THAT(result.eliminated(), ElementsAre(0));
  for (const Event& event : game.Log().events()) {
    if (event.turn() > 1) {
      ASSERT_TRUE(event.has_guess());
      EXPECT_NE(event.guess().guesser(), 0);
    }
  }
}

TEST(Game, HeuristicGamesEndWithACorrectWinner) {
  for (int seed = 0; seed < 5; ++seed) {
    const Deal deal = MustDeal(4, seed);
    Game game(deal, NamedStrategies({"good", "basic", "good", "basic"}, seed),
              GameOptions());
    const GameResult result = game.Play();
    ExpectCorrectWin(game, result);
    EXPECT_LE(result.turn_count(), kDefaultMaxTurns);
    EXPECT_GT(result.final_posterior_accuracy(), 0);
  }
}

TEST(Game, RecordMissesAgainstBasicPlayers) {
  for (int seed = 0; seed < 3; ++seed) {
    const Deal deal = MustDeal(6, seed);
    Game game(deal,
              NamedStrategies({"record_misses", "basic", "basic", "basic",
                               "basic", "basic"}, seed),
              GameOptions());
    ExpectCorrectWin(game, game.Play());
  }
}

TEST(Game, MleGamesEndWithACorrectWinner) {
  for (int seed = 0; seed < 3; ++seed) {
    const Deal deal = MustDeal(3, seed);
    Game game(deal, NamedStrategies({"mle", "good", "mle"}, seed),
              GameOptions());
    const GameResult result = game.Play();
    ExpectCorrectWin(game, result);
  }
}

TEST(Game, StoresStayConsistentWithTheDeal) {
  const Deal deal = MustDeal(5, 3);
  Game game(deal, NamedStrategies({"random", "basic", "good", "mle", "random"},
                                  3), GameOptions());
  game.Play();
  for (int i = 0; i < deal.NumPlayers(); ++i) {
    const KnowledgeStore& store = game.Store(i);
    EXPECT_TRUE(store.status().ok());
    for (Card card : BuildDeck()) {
      const int holder = store.HolderOf(card);
      if (holder != kNoPlayer) {
        EXPECT_EQ(holder, deal.HolderOf(card)) << CardName(card);
      }
      EXPECT_TRUE(store.CanHold(card, deal.HolderOf(card))) << CardName(card);
    }
  }
}

TEST(Game, DeterministicForSeeds) {
  const Deal deal = MustDeal(4, 21);
  GameOptions options;
  options.seed = 21;
  Game a(deal, NamedStrategies({"random", "basic", "good", "mle"}, 5), options);
  Game b(deal, NamedStrategies({"random", "basic", "good", "mle"}, 5), options);
  const GameResult ra = a.Play();
  const GameResult rb = b.Play();
  EXPECT_EQ(ra.DebugString(), rb.DebugString());
  EXPECT_EQ(a.Log().DebugString(), b.Log().DebugString());
  EXPECT_EQ(ra.seed(), 21);
}

TEST(ReplayGameLog, RebuildsEveryStore) {
  const Deal deal = MustDeal(4, 13);
  Game game(deal, NamedStrategies({"basic", "good", "random", "good"}, 13),
            GameOptions());
  game.Play();
  for (int i = 0; i < deal.NumPlayers(); ++i) {
    const auto store = ReplayGameLog(game.Log(), PLAYER, i);
    ASSERT_TRUE(store.ok()) << store.status();
    EXPECT_EQ(store->DebugString(), game.Store(i).DebugString()) << "P" << i;
  }
  const auto omniscient = ReplayGameLog(game.Log(), OMNISCIENT, kNoPlayer);
  ASSERT_TRUE(omniscient.ok()) << omniscient.status();
  EXPECT_EQ(omniscient->DebugString(), game.OmniscientStore().DebugString());
}

TEST(ReplayGameLog, ObserverLearnsOnlyPublicFacts) {
  const Deal deal = MustDeal(3, 2);
  Game game(deal, NamedStrategies({"good", "good", "good"}, 2), GameOptions());
  game.Play();
  const auto store = ReplayGameLog(game.Log(), OBSERVER, kNoPlayer);
  ASSERT_TRUE(store.ok()) << store.status();
  EXPECT_EQ(store->GetPerspective(), OBSERVER);
  for (Card card : BuildDeck()) {
    const int holder = store->HolderOf(card);
    if (holder != kNoPlayer) {
      EXPECT_EQ(holder, deal.HolderOf(card)) << CardName(card);
    }
  }
  EXPECT_LE(store->NumPositiveFacts(),
            game.OmniscientStore().NumPositiveFacts());
}

TEST(ReplayGameLog, InvalidLogs) {
  const Deal deal = MustDeal(3, 2);
  Game game(deal, NamedStrategies({"good", "good", "good"}, 2), GameOptions());
  game.Play();
  EXPECT_EQ(ReplayGameLog(game.Log(), PLAYER, 3).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ReplayGameLog(game.Log(), PERSPECTIVE_UNSPECIFIED, 0)
                .status().code(),
            absl::StatusCode::kInvalidArgument);

  GameLog after_win = game.Log();
  *after_win.add_events() = game.Log().events(0);
  EXPECT_EQ(ReplayGameLog(after_win, OBSERVER, kNoPlayer).status().code(),
            absl::StatusCode::kInvalidArgument);

  GameLog bad_guess = game.Log();
  bad_guess.mutable_events(0)->mutable_guess()->mutable_guess()->set_person(
      ROPE);
  EXPECT_EQ(ReplayGameLog(bad_guess, OBSERVER, kNoPlayer).status().code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace clue

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
