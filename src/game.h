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

#ifndef SRC_GAME_H_
#define SRC_GAME_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "src/clue.pb.h"
#include "src/deck.h"
#include "src/estimator.pb.h"
#include "src/knowledge_store.h"
#include "src/resolver.h"
#include "src/strategy.h"

namespace clue {

using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;

const int kDefaultMaxTurns = 500;

enum class Phase {
  kTurnStart,
  kGuess,
  kResolve,
  kMaybeAccuse,
  kEliminated,
  kTurnEnd,
  kWin,  // Terminal.
  kAllEliminated,  // Terminal.
  kTurnLimit,  // Terminal.
};

string PhaseName(Phase phase);

// The mutable state of the turn loop.
struct GameContext {
  int active_player = 0;
  int turn = 0;  // Number of turns started so far.
  vector<bool> eliminated;  // x player.
  Phase phase = Phase::kTurnStart;
  int winner = kNoPlayer;
};

struct GameOptions {
  int max_turns = kDefaultMaxTurns;
  int64_t seed = 0;  // Recorded in the log: the seed of the deal.
  // Used for the posterior of strategies that need one, and for the final
  // accuracy. Its seed is offset by the turn number.
  EstimatorRequest estimator;
};

// One game: a deal, a strategy per seat, a store per seat plus an
// omniscient store. The game owns all of them.
class Game {
 public:
  Game(const Deal& deal, vector<unique_ptr<Strategy>> strategies,
       const GameOptions& options);

  // Plays until a terminal phase and returns the result.
  GameResult Play();
  // Advances the state machine by one phase. Returns false once the game is
  // over.
  bool Step();

  bool IsOver() const;
  const GameContext& Context() const { return context_; }
  const Deal& GetDeal() const { return deal_; }
  int NumPlayers() const { return deal_.NumPlayers(); }
  const KnowledgeStore& Store(int player) const { return stores_[player]; }
  const KnowledgeStore& OmniscientStore() const { return omniscient_; }
  const GameLog& Log() const { return log_; }
  // Only meaningful once the game is over.
  GameResult Result() const;

 private:
  void StartTurn();
  void MakeGuess();
  void ResolveGuess();
  void MaybeAccuse();
  void EliminateActivePlayer();
  void EndTurn();
  // Folds a fact into every store. A contradiction is a bug: it is fatal.
  template <typename F>
  void ForEachStore(F fold);
  EstimatorResponse Posterior(int player) const;
  double FinalPosteriorAccuracy() const;

  Deal deal_;
  vector<unique_ptr<Strategy>> strategies_;
  GameOptions options_;
  vector<KnowledgeStore> stores_;  // x player.
  KnowledgeStore omniscient_;
  GameContext context_;
  Guess guess_;  // Of the current turn.
  optional<Outcome> outcome_;  // Of the current turn.
  GameLog log_;
};

// Rebuilds the knowledge of one observer from a game log. The player is only
// used in the PLAYER perspective.
absl::StatusOr<KnowledgeStore> ReplayGameLog(const GameLog& log,
                                             Perspective perspective,
                                             int player);

}  // namespace clue

#endif  // SRC_GAME_H_
