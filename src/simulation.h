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

#ifndef SRC_SIMULATION_H_
#define SRC_SIMULATION_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "src/clue.pb.h"
#include "src/simulation.pb.h"

namespace clue {

using std::string;
using std::vector;

// Fills in the defaults of all zero-valued config fields. A single strategy
// is used for every seat.
SimulationConfig WithDefaults(const SimulationConfig& config);
absl::Status ValidateConfig(const SimulationConfig& config);

// The strategy names of the seats of one game.
vector<string> SeatStrategies(const SimulationConfig& config, int game_index);

// Plays game game_index of the simulation. The config must have defaults.
absl::StatusOr<GameResult> PlayGame(const SimulationConfig& config,
                                    int game_index, GameLog* log);

// Plays all games, in parallel when num_threads > 1. Game i only depends on
// the config and i, so results do not depend on the number of threads. When
// log is not null, it gets the log of game log_index.
absl::StatusOr<SimulationResults> RunSimulation(const SimulationConfig& config,
                                                int log_index, GameLog* log);
inline absl::StatusOr<SimulationResults> RunSimulation(
    const SimulationConfig& config) {
  return RunSimulation(config, 0, nullptr);
}

// Per strategy win counts and mean winning turn counts.
void AggregateStats(const SimulationConfig& config,
                    SimulationResults* results);

}  // namespace clue

#endif  // SRC_SIMULATION_H_
