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

#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/status.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "src/simulation.h"
#include "src/util.h"

using std::string;

// All files below are in text proto format.
ABSL_FLAG(string, config, "", "Simulation config file path.");
ABSL_FLAG(string, output_results, "", "Optional simulation results file.");
ABSL_FLAG(string, output_game_log, "", "Optional output file for the log "
          "of the game selected by --game_log_index.");
ABSL_FLAG(int, game_log_index, 0, "Index of the game to write the log of.");

namespace clue {

absl::Status Run() {
  const string config_path = absl::GetFlag(FLAGS_config);
  if (config_path.empty()) {
    return absl::InvalidArgumentError("--config should be a valid path");
  }
  SimulationConfig config;
  RETURN_IF_ERROR(ParseProtoFromFile(config_path, &config));

  const string output_game_log = absl::GetFlag(FLAGS_output_game_log);
  GameLog log;
  ASSIGN_OR_RETURN(
      const SimulationResults results,
      RunSimulation(config, absl::GetFlag(FLAGS_game_log_index),
                    output_game_log.empty() ? nullptr : &log));

  const string output_results = absl::GetFlag(FLAGS_output_results);
  if (!output_results.empty()) {
    WriteProtoToFile(results, output_results);
  }
  if (!output_game_log.empty()) {
    WriteProtoToFile(log, output_game_log);
  }
  return absl::OkStatus();
}
}  // namespace clue

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  const absl::Status st = clue::Run();
  if (!st.ok()) {
    LOG(ERROR) << st;
    return 1;
  }
  return 0;
}
