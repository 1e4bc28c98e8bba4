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

// The model has one Boolean per (card, holder) pair:
// * every card has exactly one holder;
// * every player holds exactly its hand size;
// * the envelope holds exactly one card per category;
// * known positive and negative facts fix variables;
// * every open set constraint is a clause over its candidates;
// * every failed accusation forbids its triple in the envelope.
#include "src/world_solver.h"

#include <vector>

#include "ortools/base/logging.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace clue {

using operations_research::sat::CpModelBuilder;
using operations_research::sat::CpSolverStatus;
using operations_research::sat::NewFeasibleSolutionObserver;
using operations_research::sat::NewSatParameters;
using operations_research::sat::SatParameters;
using operations_research::sat::SolutionBooleanValue;

void WorldSolver::CompileSatModel() {
  if (!store_.status().ok()) {
    model_.AddContradiction(string(store_.status().message()));
    return;
  }
  has_vars_.resize(kNumCards);
  for (int c = 0; c < kNumCards; ++c) {
    for (int s = 0; s < NumSlots(); ++s) {
      has_vars_[c].push_back(HasVar(CardAt(c), HolderAt(s)));
    }
  }
  AddDealConstraints();
  AddFactConstraints();
  AddSetConstraints();
  AddExcludedSolutionConstraints();
}

void WorldSolver::AddDealConstraints() {
  for (int c = 0; c < kNumCards; ++c) {
    model_.AddExactlyOne(has_vars_[c]);
  }
  for (int i = 0; i < store_.NumPlayers(); ++i) {
    vector<BoolVar> hand;
    for (int c = 0; c < kNumCards; ++c) {
      hand.push_back(has_vars_[c][i]);
    }
    model_.AddEqualitySum(hand, store_.Capacity(i));
  }
  for (Category category : kCategories) {
    vector<BoolVar> envelope;
    for (Card card : CardsInCategory(category)) {
      envelope.push_back(has_vars_[CardIndex(card)][Slot(kEnvelope)]);
    }
    model_.AddExactlyOne(envelope);
  }
}

void WorldSolver::AddFactConstraints() {
  for (Card card : BuildDeck()) {
    for (int holder : store_.Holders()) {
      const BoolVar& var = has_vars_[CardIndex(card)][Slot(holder)];
      if (store_.IsPositive(card, holder)) {
        model_.FixVariable(var, true);
      } else if (store_.IsNegative(card, holder)) {
        model_.FixVariable(var, false);
      }
    }
  }
}

void WorldSolver::AddSetConstraints() {
  for (const auto& constraint : store_.SetConstraints()) {
    vector<BoolVar> literals;
    for (Card card : constraint.cards) {
      literals.push_back(has_vars_[CardIndex(card)][Slot(constraint.holder)]);
    }
    model_.AddOr(literals);
  }
}

void WorldSolver::AddExcludedSolutionConstraints() {
  for (const Guess& guess : store_.ExcludedSolutions()) {
    vector<BoolVar> literals;
    for (Card card : GuessCards(guess)) {
      literals.push_back(has_vars_[CardIndex(card)][Slot(kEnvelope)]);
    }
    model_.AddOr(Not(literals));
  }
}

void WorldSolver::FillWorldFromSolverResponse(
    const CpSolverResponse& response, SolverResponse::World* world) const {
  for (int c = 0; c < kNumCards; ++c) {
    int holder = kNoPlayer;
    for (int s = 0; s < NumSlots(); ++s) {
      if (SolutionBooleanValue(response, has_vars_[c][s])) {
        holder = HolderAt(s);
        break;
      }
    }
    CHECK_NE(holder, kNoPlayer) << CardName(CardAt(c)) << " has no holder";
    world->add_holders(holder);
  }
}

SolverResponse WorldSolver::Solve(const SolverRequest& request) {
  SolverResponse result;
  const int num_players = store_.NumPlayers();
  result.mutable_envelope_counts()->Resize(kNumCards, 0);
  result.mutable_player_counts()->Resize(kNumCards * num_players, 0);
  CpModelBuilder cp_model(model_.Model());
  operations_research::sat::Model model;
  SatParameters parameters;
  parameters.set_enumerate_all_solutions(!request.stop_after_first_solution());
  if (request.time_limit_seconds() > 0) {
    parameters.set_max_time_in_seconds(request.time_limit_seconds());
  }
  model.Add(NewSatParameters(parameters));
  bool stopped = false;
  model.Add(NewFeasibleSolutionObserver([&](const CpSolverResponse& r) {
    if (stopped) {
      return;
    }
    SolverResponse::World world;
    FillWorldFromSolverResponse(r, &world);
    for (int c = 0; c < kNumCards; ++c) {
      const int holder = world.holders(c);
      if (holder == kEnvelope) {
        result.set_envelope_counts(c, result.envelope_counts(c) + 1);
      } else {
        const int i = c * num_players + holder;
        result.set_player_counts(i, result.player_counts(i) + 1);
      }
    }
    if (request.keep_worlds()) {
      *result.add_worlds() = world;
    }
    result.set_num_worlds(result.num_worlds() + 1);
    if (result.num_worlds() % 10000 == 0) {
      VLOG(1) << "Found " << result.num_worlds() << " worlds";
    }
    if (request.max_worlds() > 0 &&
        result.num_worlds() >= request.max_worlds()) {
      stopped = true;
      operations_research::sat::StopSearch(&model);
    }
  }));
  const CpSolverResponse response = SolveCpModel(cp_model.Build(), &model);
  const CpSolverStatus status = response.status();
  result.set_complete(!stopped && !request.stop_after_first_solution() &&
                      (status == CpSolverStatus::OPTIMAL ||
                       status == CpSolverStatus::INFEASIBLE));
  VLOG(1) << "Found " << result.num_worlds() << " worlds, status "
          << CpSolverStatus_Name(status);
  return result;
}

SolverResponse Solve(const KnowledgeStore& store) {
  return WorldSolver(store).Solve();
}

SolverResponse Solve(const KnowledgeStore& store,
                     const SolverRequest& request) {
  return WorldSolver(store).Solve(request);
}

bool IsValidWorld(const KnowledgeStore& store) {
  return WorldSolver(store).IsValidWorld();
}

}  // namespace clue
