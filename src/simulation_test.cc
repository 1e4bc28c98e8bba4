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

#include "src/simulation.h"

#include "google/protobuf/text_format.h"
#include "ortools/base/logging.h"
#include "src/game.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace clue {
namespace {

using testing::ElementsAre;

SimulationConfig ParseConfig(const string& text) {
  SimulationConfig config;
  CHECK(google::protobuf::TextFormat::ParseFromString(text, &config)) << text;
  return config;
}

TEST(WithDefaults, ReplicatesASingleStrategy) {
  const SimulationConfig c = WithDefaults(ParseConfig(R"pb(
    num_games: 3 num_players: 4 strategies: "good"
  )pb"));
  EXPECT_THAT(c.strategies(), ElementsAre("good", "good", "good", "good"));
  EXPECT_EQ(c.max_turns(), kDefaultMaxTurns);
  EXPECT_EQ(c.accusation_threshold(), 1);
  EXPECT_EQ(c.num_threads(), 1);
  EXPECT_GT(c.estimator().max_exact_states(), 0);
}

TEST(ValidateConfig, InvalidConfigs) {
  EXPECT_TRUE(ValidateConfig(WithDefaults(ParseConfig(R"pb(
    num_games: 1 num_players: 3 strategies: [ "good", "basic", "mle" ]
  )pb"))).ok());
  EXPECT_EQ(ValidateConfig(WithDefaults(ParseConfig(R"pb(
    num_games: 1 num_players: 7 strategies: "good"
  )pb"))).code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ValidateConfig(WithDefaults(ParseConfig(R"pb(
    num_games: 1 num_players: 3 strategies: [ "good", "basic" ]
  )pb"))).code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ValidateConfig(WithDefaults(ParseConfig(R"pb(
    num_games: 1 num_players: 3 strategies: "oracle"
  )pb"))).code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ValidateConfig(WithDefaults(ParseConfig(R"pb(
    num_games: 1 num_players: 3 strategies: "mle" accusation_threshold: 2
  )pb"))).code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(RunSimulation(ParseConfig(R"pb(
    num_games: 1 num_players: 1 strategies: "good"
  )pb")).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(SeatStrategies, Rotation) {
  SimulationConfig config = ParseConfig(R"pb(
    num_players: 3 strategies: [ "a", "b", "c" ]
  )pb");
  EXPECT_THAT(SeatStrategies(config, 1), ElementsAre("a", "b", "c"));
  config.set_rotate_seats(true);
  EXPECT_THAT(SeatStrategies(config, 0), ElementsAre("a", "b", "c"));
  EXPECT_THAT(SeatStrategies(config, 1), ElementsAre("b", "c", "a"));
  EXPECT_THAT(SeatStrategies(config, 5), ElementsAre("c", "a", "b"));
}

TEST(RunSimulation, PlaysEveryGame) {
  const SimulationConfig config = ParseConfig(R"pb(
    num_games: 6 num_players: 4 base_seed: 100 rotate_seats: true
    strategies: [ "good", "basic", "random", "good" ]
  )pb");
  GameLog log;
  const auto results = RunSimulation(config, 4, &log);
  ASSERT_TRUE(results.ok()) << results.status();
  ASSERT_EQ(results->games_size(), 6);
  EXPECT_EQ(log.setup().seed(), 104);
  EXPECT_EQ(log.setup().num_players(), 4);
  int wins = 0;
  for (int i = 0; i < 6; ++i) {
    const GameResult& game = results->games(i);
    EXPECT_EQ(game.game_index(), i);
    EXPECT_EQ(game.seed(), 100 + i);
    wins += game.end_state() == WIN;
    if (game.end_state() == WIN) {
      EXPECT_EQ(game.winner_strategy(),
                SeatStrategies(WithDefaults(config), i)[game.winner()]);
    }
  }
  EXPECT_EQ(wins + results->num_unfinished(), 6);
  int seats = 0, stat_wins = 0;
  for (const auto& stats : results->stats()) {
    seats += stats.seats();
    stat_wins += stats.wins();
    if (stats.wins() > 0) {
      EXPECT_GT(stats.mean_winning_turns(), 0);
    }
  }
  EXPECT_EQ(seats, 6 * 4);
  EXPECT_EQ(stat_wins, wins);
}

TEST(RunSimulation, ResultsDoNotDependOnThreads) {
  SimulationConfig config = ParseConfig(R"pb(
    num_games: 8 num_players: 3 base_seed: 7
    strategies: [ "good", "basic", "good" ]
  )pb");
  const auto sequential = RunSimulation(config);
  config.set_num_threads(4);
  const auto parallel = RunSimulation(config);
  ASSERT_TRUE(sequential.ok()) << sequential.status();
  ASSERT_TRUE(parallel.ok()) << parallel.status();
  EXPECT_EQ(sequential->DebugString(), parallel->DebugString());
}

TEST(PlayGame, ReproducesASimulatedGame) {
  const SimulationConfig config = WithDefaults(ParseConfig(R"pb(
    num_games: 3 num_players: 3 base_seed: 40 strategies: "good"
  )pb"));
  GameLog simulated_log;
  const auto results = RunSimulation(config, 2, &simulated_log);
  ASSERT_TRUE(results.ok()) << results.status();
  GameLog log;
  const auto game = PlayGame(config, 2, &log);
  ASSERT_TRUE(game.ok()) << game.status();
  EXPECT_EQ(game->DebugString(), results->games(2).DebugString());
  EXPECT_EQ(log.DebugString(), simulated_log.DebugString());
}

TEST(RunSimulation, InvalidLogIndex) {
  const SimulationConfig config = ParseConfig(R"pb(
    num_games: 3 num_players: 3 strategies: "good"
  )pb");
  GameLog log;
  EXPECT_EQ(RunSimulation(config, 3, &log).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(RunSimulation(config, -1, &log).status().code(),
            absl::StatusCode::kInvalidArgument);
  // Without a log the index is not used.
  EXPECT_TRUE(RunSimulation(config, 7, nullptr).ok());
}

TEST(AggregateStats, CountsWinsPerStrategy) {
  const SimulationConfig config = WithDefaults(ParseConfig(R"pb(
    num_games: 3 num_players: 2 strategies: [ "good", "mle" ]
  )pb"));
  SimulationResults results;
  GameResult* game = results.add_games();
  game->set_game_index(0);
  game->set_end_state(WIN);
  game->set_winner(1);
  game->set_turn_count(10);
  game = results.add_games();
  game->set_game_index(1);
  game->set_end_state(WIN);
  game->set_winner(1);
  game->set_turn_count(20);
  game = results.add_games();
  game->set_game_index(2);
  game->set_end_state(TURN_LIMIT);
  AggregateStats(config, &results);
  ASSERT_EQ(results.stats_size(), 2);
  EXPECT_EQ(results.stats(0).strategy(), "good");
  EXPECT_EQ(results.stats(0).seats(), 3);
  EXPECT_EQ(results.stats(0).wins(), 0);
  EXPECT_EQ(results.stats(1).strategy(), "mle");
  EXPECT_EQ(results.stats(1).wins(), 2);
  EXPECT_DOUBLE_EQ(results.stats(1).mean_winning_turns(), 15);
  EXPECT_EQ(results.num_unfinished(), 1);
}

}  // namespace
}  // namespace clue

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
