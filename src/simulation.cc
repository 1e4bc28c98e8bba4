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

#include <map>
#include <memory>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "src/deck.h"
#include "src/game.h"
#include "src/posterior_estimator.h"
#include "src/strategy.h"

namespace clue {
using std::map;
using std::unique_ptr;

namespace {
const int kDefaultNumThreads = 1;
const double kDefaultAccusationThreshold = 1;
}  // namespace

SimulationConfig WithDefaults(const SimulationConfig& config) {
  SimulationConfig c = config;
  if (c.max_turns() <= 0) {
    c.set_max_turns(kDefaultMaxTurns);
  }
  if (c.accusation_threshold() <= 0) {
    c.set_accusation_threshold(kDefaultAccusationThreshold);
  }
  if (c.num_threads() <= 0) {
    c.set_num_threads(kDefaultNumThreads);
  }
  if (c.strategies_size() == 1) {
    const string name = c.strategies(0);
    for (int i = 1; i < c.num_players(); ++i) {
      c.add_strategies(name);
    }
  }
  *c.mutable_estimator() = WithDefaults(c.estimator());
  return c;
}

absl::Status ValidateConfig(const SimulationConfig& config) {
  RETURN_IF_ERROR(ValidatePlayerCount(config.num_players()));
  if (config.num_games() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid number of games: ", config.num_games()));
  }
  if (config.strategies_size() != config.num_players()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expected %d strategies, got %d", config.num_players(),
        config.strategies_size()));
  }
  for (const string& name : config.strategies()) {
    RETURN_IF_ERROR(
        NewStrategy(name, 0, config.accusation_threshold()).status());
  }
  return absl::OkStatus();
}

vector<string> SeatStrategies(const SimulationConfig& config, int game_index) {
  const int n = config.num_players();
  vector<string> seats;
  for (int i = 0; i < n; ++i) {
    const int s = config.rotate_seats() ? (i + game_index) % n : i;
    seats.push_back(config.strategies(s));
  }
  return seats;
}

absl::StatusOr<GameResult> PlayGame(const SimulationConfig& config,
                                    int game_index, GameLog* log) {
  const int64_t seed = config.base_seed() + game_index;
  ASSIGN_OR_RETURN(const Deal deal, DealCards(config.num_players(), seed));
  vector<unique_ptr<Strategy>> strategies;
  const vector<string> seats = SeatStrategies(config, game_index);
  for (int i = 0; i < seats.size(); ++i) {
    ASSIGN_OR_RETURN(auto strategy,
                     NewStrategy(seats[i], seed * kMaxPlayers + i,
                                 config.accusation_threshold()));
    strategies.push_back(std::move(strategy));
  }
  GameOptions options;
  options.max_turns = config.max_turns();
  options.seed = seed;
  options.estimator = config.estimator();
  options.estimator.set_seed(config.estimator().seed() + seed);
  Game game(deal, std::move(strategies), options);
  GameResult result = game.Play();
  result.set_game_index(game_index);
  if (log != nullptr) {
    *log = game.Log();
  }
  return result;
}

void AggregateStats(const SimulationConfig& config,
                    SimulationResults* results) {
  map<string, SimulationResults::StrategyStats> stats;
  map<string, int64_t> winning_turns;
  for (const string& name : config.strategies()) {
    stats[name].set_strategy(name);
  }
  int unfinished = 0;
  for (const GameResult& result : results->games()) {
    const vector<string> seats = SeatStrategies(config, result.game_index());
    for (const string& name : seats) {
      stats[name].set_seats(stats[name].seats() + 1);
    }
    if (result.end_state() != WIN) {
      ++unfinished;
      continue;
    }
    const string& winner = seats[result.winner()];
    stats[winner].set_wins(stats[winner].wins() + 1);
    winning_turns[winner] += result.turn_count();
  }
  results->clear_stats();
  for (auto& [name, s] : stats) {
    if (s.wins() > 0) {
      s.set_mean_winning_turns(
          static_cast<double>(winning_turns[name]) / s.wins());
    }
    *results->add_stats() = s;
  }
  results->set_num_unfinished(unfinished);
}

absl::StatusOr<SimulationResults> RunSimulation(const SimulationConfig& config,
                                                int log_index, GameLog* log) {
  const SimulationConfig c = WithDefaults(config);
  RETURN_IF_ERROR(ValidateConfig(c));
  const int num_games = c.num_games();
  if (log != nullptr && (log_index < 0 || log_index >= num_games)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "No game with index %d, there are %d games", log_index, num_games));
  }
  vector<absl::StatusOr<GameResult>> results(
      num_games, absl::UnknownError("Not played"));
  LOG(INFO) << "Playing " << num_games << " games with "
            << c.num_threads() << " threads";
#pragma omp parallel for schedule(dynamic) num_threads(c.num_threads())
  for (int i = 0; i < num_games; ++i) {
    results[i] = PlayGame(c, i, i == log_index ? log : nullptr);
  }
  SimulationResults simulation;
  for (auto& result : results) {
    RETURN_IF_ERROR(result.status());
    *simulation.add_games() = *std::move(result);
  }
  AggregateStats(c, &simulation);
  for (const auto& s : simulation.stats()) {
    LOG(INFO) << absl::StrFormat(
        "%-8s won %d of %d seat-games, mean winning turn %.1f", s.strategy(),
        s.wins(), s.seats(), s.mean_winning_turns());
  }
  LOG(INFO) << simulation.num_unfinished() << " games ended without a winner";
  return simulation;
}

}  // namespace clue
