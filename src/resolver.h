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

#ifndef SRC_RESOLVER_H_
#define SRC_RESOLVER_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/clue.pb.h"
#include "src/deck.h"
#include "src/knowledge_store.h"

namespace clue {

using std::string;
using std::vector;

// The public result of a guess, plus the revealed card, which only the
// guesser sees.
struct Outcome {
  int guesser = kNoPlayer;
  Guess guess;
  vector<int> passed;  // Players who could not disprove, in turn order.
  bool disproved = false;
  int disprover = kNoPlayer;
  Card revealed = CARD_UNSPECIFIED;

  GuessEvent ToProto() const;
  static absl::StatusOr<Outcome> FromProto(const GuessEvent& event,
                                           int num_players);
  string DebugString() const;
};

// The card a player shows to disprove a guess: the person if held, then the
// weapon, then the room. CARD_UNSPECIFIED if the hand holds none of them.
Card ChooseCardToReveal(absl::Span<const Card> hand, const Guess& guess);

// Asks the players after the guesser, in turn order, to disprove the guess.
// The first one who can reveals a card. Eliminated players still disprove.
absl::StatusOr<Outcome> Resolve(const Guess& guess, int guesser,
                                const Deal& deal);

// Records what the owner of the store learns from the outcome. When nobody
// disproved, the guesser's own set constraint is deferred, see
// FoldUndisprovedGuess.
absl::Status FoldOutcome(const Outcome& outcome, KnowledgeStore* store);
// Applied once the guesser had the chance to accuse: the guesser holds one of
// the guessed cards. No-op for the guesser's own store.
absl::Status FoldUndisprovedGuess(const Outcome& outcome,
                                  KnowledgeStore* store);

}  // namespace clue

#endif  // SRC_RESOLVER_H_
