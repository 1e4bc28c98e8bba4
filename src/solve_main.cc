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
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "src/game.h"
#include "src/posterior_estimator.h"
#include "src/util.h"
#include "src/world_solver.h"

using std::string;

// All files below are in text proto format.
ABSL_FLAG(string, game_log, "", "Game log file path.");
ABSL_FLAG(string, perspective, "PLAYER",
          "Whose knowledge to rebuild: PLAYER, OBSERVER or OMNISCIENT.");
ABSL_FLAG(int, player, 0, "The player, in the PLAYER perspective.");
ABSL_FLAG(string, estimator_parameters, "",
          "Estimator request file path.");
ABSL_FLAG(string, output_response, "", "Optional estimator response file.");
ABSL_FLAG(string, output_model, "", "Optional SAT model output file.");
ABSL_FLAG(string, output_model_vars, "",
    "Optional SAT model variables output file.");

namespace clue {

absl::Status Run() {
  const string game_log = absl::GetFlag(FLAGS_game_log);
  if (game_log.empty()) {
    return absl::InvalidArgumentError("--game_log should be a valid path");
  }
  GameLog log;
  RETURN_IF_ERROR(ParseProtoFromFile(game_log, &log));
  Perspective perspective;
  if (!Perspective_Parse(absl::GetFlag(FLAGS_perspective), &perspective)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid --perspective ", absl::GetFlag(FLAGS_perspective)));
  }
  ASSIGN_OR_RETURN(
      const KnowledgeStore store,
      ReplayGameLog(log, perspective, absl::GetFlag(FLAGS_player)));
  LOG(INFO) << "Knowledge:\n" << store.DebugString();

  EstimatorRequest request;  // If file present, read from file.
  const string estimator_parameters = absl::GetFlag(FLAGS_estimator_parameters);
  if (!estimator_parameters.empty()) {
    RETURN_IF_ERROR(ParseProtoFromFile(estimator_parameters, &request));
  }
  const string output_model = absl::GetFlag(FLAGS_output_model);
  const string output_model_vars = absl::GetFlag(FLAGS_output_model_vars);
  if (!output_model.empty() || !output_model_vars.empty()) {
    WorldSolver solver(store);
    if (!output_model.empty()) {
      solver.WriteModelToFile(output_model);
    }
    if (!output_model_vars.empty()) {
      solver.WriteModelVariablesToFile(output_model_vars);
    }
  }

  ASSIGN_OR_RETURN(const EstimatorResponse response,
                   Estimate(store, request));
  for (Category category : kCategories) {
    for (Card card : CardsInCategory(category)) {
      LOG(INFO) << absl::StrFormat("%-16s %6.2f%%", CardName(card),
                                   100 * EnvelopeProbability(response, card));
    }
  }
  LOG(INFO) << "Most likely solution: "
            << GuessString(MostLikelySolution(response)) << " ("
            << response.num_worlds() << " worlds, "
            << EstimatorRequest::Method_Name(response.method()) << ")";
  const string output_response = absl::GetFlag(FLAGS_output_response);
  if (!output_response.empty()) {
    WriteProtoToFile(response, output_response);
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
