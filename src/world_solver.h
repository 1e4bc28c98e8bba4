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

#ifndef SRC_WORLD_SOLVER_H_
#define SRC_WORLD_SOLVER_H_

#include <filesystem>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "ortools/sat/cp_model.h"
#include "src/clue.pb.h"
#include "src/deck.h"
#include "src/knowledge_store.h"
#include "src/model_wrapper.h"
#include "src/solver.pb.h"

namespace clue {

using operations_research::sat::BoolVar;
using operations_research::sat::CpSolverResponse;
using std::filesystem::path;
using std::string;
using std::vector;

// Compiles a KnowledgeStore into a SAT model over "card is held by holder"
// variables, and enumerates the card distributions consistent with it.
class WorldSolver {
 public:
  explicit WorldSolver(const KnowledgeStore& store) : store_(store) {
    CompileSatModel();
  }
  // Returns all consistent worlds.
  SolverResponse Solve() { return Solve(SolverRequest()); }
  // Solves using options from the request.
  SolverResponse Solve(const SolverRequest& request);
  // Returns whether a consistent world exists.
  bool IsValidWorld() {
    SolverRequest r;
    r.set_stop_after_first_solution(true);
    return Solve(r).num_worlds() > 0;
  }
  void WriteModelToFile(const path& filename) const {
    model_.WriteToFile(filename);
  }
  void WriteModelVariablesToFile(const path& filename) const {
    model_.WriteVariablesToFile(filename);
  }

 private:
  void CompileSatModel();
  void AddDealConstraints();
  void AddFactConstraints();
  void AddSetConstraints();
  void AddExcludedSolutionConstraints();
  void FillWorldFromSolverResponse(const CpSolverResponse& response,
                                   SolverResponse::World* world) const;

  int NumSlots() const { return store_.NumPlayers() + 1; }
  int Slot(int holder) const {
    return holder == kEnvelope ? store_.NumPlayers() : holder;
  }
  int HolderAt(int slot) const {
    return slot == store_.NumPlayers() ? kEnvelope : slot;
  }
  string HasVarName(Card card, int holder) const {
    return absl::StrFormat("has_%s_%s", Card_Name(card),
                           store_.HolderName(holder));
  }
  BoolVar HasVar(Card card, int holder) {
    return model_.NewVar(HasVarName(card, holder));
  }

  const KnowledgeStore& store_;
  ModelWrapper model_;
  vector<vector<BoolVar>> has_vars_;  // x card index x slot.
};

// Returns all consistent worlds of the store.
SolverResponse Solve(const KnowledgeStore& store);
SolverResponse Solve(const KnowledgeStore& store,
                     const SolverRequest& request);
// Returns whether a consistent world exists.
bool IsValidWorld(const KnowledgeStore& store);

}  // namespace clue

#endif  // SRC_WORLD_SOLVER_H_
