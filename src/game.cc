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

// Turn phases:
// TURN_START -> GUESS -> RESOLVE -> MAYBE_ACCUSE -> TURN_END -> TURN_START
//                                        |  \
//                                       WIN  ELIMINATED -> TURN_END
// TURN_START ends the game with ALL_ELIMINATED or TURN_LIMIT.
//
// When nobody disproves a guess, the other observers only learn that the
// guesser holds one of the guessed cards at TURN_END: a guesser holding none
// of them would have known the envelope and accused.
#include "src/game.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "src/posterior_estimator.h"

namespace clue {

string PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kTurnStart:
      return "TURN_START";
    case Phase::kGuess:
      return "GUESS";
    case Phase::kResolve:
      return "RESOLVE";
    case Phase::kMaybeAccuse:
      return "MAYBE_ACCUSE";
    case Phase::kEliminated:
      return "ELIMINATED";
    case Phase::kTurnEnd:
      return "TURN_END";
    case Phase::kWin:
      return "WIN";
    case Phase::kAllEliminated:
      return "ALL_ELIMINATED";
    case Phase::kTurnLimit:
      return "TURN_LIMIT";
  }
  return "UNKNOWN";
}

Game::Game(const Deal& deal, vector<unique_ptr<Strategy>> strategies,
           const GameOptions& options)
    : deal_(deal), strategies_(std::move(strategies)), options_(options),
      omniscient_(KnowledgeStore::Omniscient(deal)) {
  CHECK_EQ(strategies_.size(), deal_.NumPlayers())
      << "Need one strategy per player";
  CHECK_GT(options_.max_turns, 0);
  for (int i = 0; i < NumPlayers(); ++i) {
    CHECK(strategies_[i] != nullptr);
    stores_.push_back(KnowledgeStore::ForPlayer(deal_, i));
    *log_.add_strategies() = strategies_[i]->Name();
  }
  context_.eliminated.assign(NumPlayers(), false);
  *log_.mutable_setup() = deal_.ToProto();
  log_.mutable_setup()->set_seed(options_.seed);
}

bool Game::IsOver() const {
  return context_.phase == Phase::kWin ||
         context_.phase == Phase::kAllEliminated ||
         context_.phase == Phase::kTurnLimit;
}

GameResult Game::Play() {
  while (Step()) {
  }
  return Result();
}

bool Game::Step() {
  VLOG(2) << "Turn " << context_.turn << ", P" << context_.active_player
          << ": " << PhaseName(context_.phase);
  switch (context_.phase) {
    case Phase::kTurnStart:
      StartTurn();
      break;
    case Phase::kGuess:
      MakeGuess();
      break;
    case Phase::kResolve:
      ResolveGuess();
      break;
    case Phase::kMaybeAccuse:
      MaybeAccuse();
      break;
    case Phase::kEliminated:
      EliminateActivePlayer();
      break;
    case Phase::kTurnEnd:
      EndTurn();
      break;
    default:
      break;
  }
  return !IsOver();
}

template <typename F>
void Game::ForEachStore(F fold) {
  for (auto& store : stores_) {
    const absl::Status st = fold(&store);
    CHECK(st.ok()) << st << "\n" << store.DebugString();
  }
  const absl::Status st = fold(&omniscient_);
  CHECK(st.ok()) << st << "\n" << omniscient_.DebugString();
}

EstimatorResponse Game::Posterior(int player) const {
  EstimatorRequest request = options_.estimator;
  request.set_seed(request.seed() + context_.turn);
  const auto posterior = Estimate(stores_[player], request);
  CHECK(posterior.ok()) << posterior.status() << "\n"
                        << stores_[player].DebugString();
  return *posterior;
}

void Game::StartTurn() {
  int alive = 0;
  for (bool eliminated : context_.eliminated) {
    alive += !eliminated;
  }
  if (alive == 0) {
    context_.phase = Phase::kAllEliminated;
    LOG(INFO) << "All players were eliminated after " << context_.turn
              << " turns";
    return;
  }
  if (context_.turn >= options_.max_turns) {
    context_.phase = Phase::kTurnLimit;
    LOG(INFO) << "Reached the limit of " << options_.max_turns << " turns";
    return;
  }
  while (context_.eliminated[context_.active_player]) {
    context_.active_player = (context_.active_player + 1) % NumPlayers();
  }
  ++context_.turn;
  outcome_.reset();
  context_.phase = Phase::kGuess;
}

void Game::MakeGuess() {
  const int player = context_.active_player;
  Strategy& strategy = *strategies_[player];
  const EstimatorResponse posterior =
      strategy.NeedsPosterior() ? Posterior(player) : EstimatorResponse();
  guess_ = strategy.ChooseGuess(stores_[player], posterior);
  const absl::Status st = ValidateGuess(guess_);
  CHECK(st.ok()) << strategy.Name() << ": " << st;
  context_.phase = Phase::kResolve;
}

void Game::ResolveGuess() {
  const auto outcome = Resolve(guess_, context_.active_player, deal_);
  CHECK(outcome.ok()) << outcome.status();
  outcome_ = *outcome;
  auto* event = log_.add_events();
  event->set_turn(context_.turn);
  *event->mutable_guess() = outcome_->ToProto();
  ForEachStore([this](KnowledgeStore* store) {
    return FoldOutcome(*outcome_, store);
  });
  context_.phase = Phase::kMaybeAccuse;
}

void Game::MaybeAccuse() {
  const int player = context_.active_player;
  Strategy& strategy = *strategies_[player];
  const EstimatorResponse posterior =
      strategy.NeedsPosterior() ? Posterior(player) : EstimatorResponse();
  const optional<Guess> accusation =
      strategy.ChooseAccusation(stores_[player], posterior);
  if (!accusation.has_value()) {
    context_.phase = Phase::kTurnEnd;
    return;
  }
  const absl::Status st = ValidateGuess(*accusation);
  CHECK(st.ok()) << strategy.Name() << ": " << st;
  const bool correct = *accusation == deal_.Envelope();
  auto* event = log_.add_events();
  event->set_turn(context_.turn);
  auto* details = event->mutable_accusation();
  details->set_accuser(player);
  *details->mutable_accusation() = *accusation;
  details->set_correct(correct);
  guess_ = *accusation;
  if (correct) {
    context_.winner = player;
    context_.phase = Phase::kWin;
    LOG(INFO) << "P" << player << " (" << strategy.Name() << ") wins on turn "
              << context_.turn << " with " << GuessString(*accusation);
    return;
  }
  LOG(INFO) << "P" << player << " (" << strategy.Name()
            << ") is eliminated on turn " << context_.turn << " for accusing "
            << GuessString(*accusation);
  context_.phase = Phase::kEliminated;
}

void Game::EliminateActivePlayer() {
  context_.eliminated[context_.active_player] = true;
  ForEachStore([this](KnowledgeStore* store) {
    return store->AssertNotSolution(guess_);
  });
  context_.phase = Phase::kTurnEnd;
}

void Game::EndTurn() {
  if (outcome_.has_value() && !outcome_->disproved) {
    ForEachStore([this](KnowledgeStore* store) {
      return FoldUndisprovedGuess(*outcome_, store);
    });
  }
  context_.active_player = (context_.active_player + 1) % NumPlayers();
  context_.phase = Phase::kTurnStart;
}

double Game::FinalPosteriorAccuracy() const {
  double total = 0;
  for (int i = 0; i < NumPlayers(); ++i) {
    total += SolutionMass(Posterior(i), deal_.Envelope());
  }
  return total / NumPlayers();
}

GameResult Game::Result() const {
  CHECK(IsOver()) << "The game is still in " << PhaseName(context_.phase);
  GameResult result;
  result.set_seed(log_.setup().seed());
  result.set_turn_count(context_.turn);
  result.set_winner(kNoPlayer);
  switch (context_.phase) {
    case Phase::kWin:
      result.set_end_state(WIN);
      result.set_winner(context_.winner);
      result.set_winner_strategy(strategies_[context_.winner]->Name());
      break;
    case Phase::kAllEliminated:
      result.set_end_state(ALL_ELIMINATED);
      break;
    default:
      result.set_end_state(TURN_LIMIT);
      break;
  }
  for (int i = 0; i < NumPlayers(); ++i) {
    if (context_.eliminated[i]) {
      result.add_eliminated(i);
    }
  }
  result.set_final_posterior_accuracy(FinalPosteriorAccuracy());
  return result;
}

absl::StatusOr<KnowledgeStore> ReplayGameLog(const GameLog& log,
                                             Perspective perspective,
                                             int player) {
  ASSIGN_OR_RETURN(const Deal deal, Deal::FromProto(log.setup()));
  optional<KnowledgeStore> store;
  switch (perspective) {
    case PLAYER:
      if (player < 0 || player >= deal.NumPlayers()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid player ", player, " in a ", deal.NumPlayers(),
            " player game"));
      }
      store = KnowledgeStore::ForPlayer(deal, player);
      break;
    case OBSERVER:
      store = KnowledgeStore::ForObserver(deal);
      break;
    case OMNISCIENT:
      store = KnowledgeStore::Omniscient(deal);
      break;
    default:
      return absl::InvalidArgumentError("Need to specify perspective");
  }
  optional<Outcome> undisproved;
  bool won = false;
  for (const auto& event : log.events()) {
    if (won) {
      return absl::InvalidArgumentError("Events after a correct accusation");
    }
    if (event.has_guess()) {
      if (undisproved.has_value()) {
        RETURN_IF_ERROR(FoldUndisprovedGuess(*undisproved, &*store));
        undisproved.reset();
      }
      ASSIGN_OR_RETURN(const Outcome outcome,
                       Outcome::FromProto(event.guess(), deal.NumPlayers()));
      RETURN_IF_ERROR(FoldOutcome(outcome, &*store));
      if (!outcome.disproved) {
        undisproved = outcome;
      }
    } else if (event.has_accusation()) {
      const auto& accusation = event.accusation();
      RETURN_IF_ERROR(ValidateGuess(accusation.accusation()));
      if (accusation.correct()) {
        won = true;
      } else {
        RETURN_IF_ERROR(store->AssertNotSolution(accusation.accusation()));
      }
    }
  }
  if (undisproved.has_value() && !won) {
    RETURN_IF_ERROR(FoldUndisprovedGuess(*undisproved, &*store));
  }
  return *std::move(store);
}

}  // namespace clue
