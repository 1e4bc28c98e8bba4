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

#ifndef SRC_KNOWLEDGE_STORE_H_
#define SRC_KNOWLEDGE_STORE_H_

#include <deque>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "src/clue.pb.h"
#include "src/deck.h"

namespace clue {

using std::deque;
using std::string;
using std::vector;

// Returns a FailedPrecondition status marking an inconsistent set of facts.
absl::Status ContradictionError(const string& reason);
bool IsContradiction(const absl::Status& status);

// The holder has at least one of the cards.
struct SetConstraint {
  int holder = kNoPlayer;  // A player index, or kEnvelope.
  vector<Card> cards;  // Remaining candidates, in deck order.
};

// What one observer knows about where the cards are. Facts only accumulate:
// every Assert* call records its fact and then runs propagation to a fixpoint.
// A Contradiction poisons the store: it is returned by every later mutation.
class KnowledgeStore {
 public:
  // An empty store for a game with the given hand sizes. The player is only
  // set in the PLAYER perspective.
  KnowledgeStore(Perspective perspective, absl::Span<const int> hand_sizes,
                 int player);
  KnowledgeStore(Perspective perspective, absl::Span<const int> hand_sizes)
      : KnowledgeStore(perspective, hand_sizes, kNoPlayer) {}

  // Seeded with the player's own hand.
  static KnowledgeStore ForPlayer(const Deal& deal, int player);
  // Knows only the hand sizes.
  static KnowledgeStore ForObserver(const Deal& deal);
  // Seeded with every hand and the envelope.
  static KnowledgeStore Omniscient(const Deal& deal);

  // Facts.
  absl::Status AssertPositive(Card card, int holder);
  absl::Status AssertNegative(Card card, int holder);
  absl::Status AssertSetConstraint(int holder, absl::Span<const Card> cards);
  // Every player other than the guesser lacks the guessed cards, and the
  // guesser holds at least one of them.
  absl::Status NoOneDisproved(int guesser, const Guess& guess);
  // A failed accusation: the envelope is not exactly this triple.
  absl::Status AssertNotSolution(const Guess& guess);
  // The player holds exactly these cards.
  absl::Status SeedHand(int player, absl::Span<const Card> cards);
  // Re-examines every fact and runs all rules to a fixpoint.
  absl::Status Propagate();

  // Accessors.
  Perspective GetPerspective() const { return perspective_; }
  int Player() const { return player_; }
  int NumPlayers() const { return num_players_; }
  const absl::Status& status() const { return status_; }
  // A player index, kEnvelope, or kNoPlayer when unknown.
  int HolderOf(Card card) const;
  bool IsPositive(Card card, int holder) const {
    return HolderOf(card) == holder;
  }
  bool IsNegative(Card card, int holder) const {
    return At(CardIndex(card), Slot(holder)) == Fact::kHasNot;
  }
  bool CanHold(Card card, int holder) const {
    return !IsNegative(card, holder);
  }
  int Capacity(int holder) const { return capacity_[Slot(holder)]; }
  int PositiveCount(int holder) const { return positive_count_[Slot(holder)]; }
  int RemainingCapacity(int holder) const {
    return Capacity(holder) - PositiveCount(holder);
  }
  // CARD_UNSPECIFIED while unknown.
  Card EnvelopeCard(Category category) const {
    return envelope_cards_[CategoryIndex(category)];
  }
  bool EnvelopeKnown() const;
  Guess KnownEnvelope() const;
  const vector<SetConstraint>& SetConstraints() const { return constraints_; }
  const vector<Guess>& ExcludedSolutions() const { return excluded_; }
  int NumPositiveFacts() const { return num_positive_; }
  int NumNegativeFacts() const { return num_negative_; }
  // All holders, players first, then kEnvelope.
  vector<int> Holders() const;
  string HolderName(int holder) const;
  string DebugString() const;

 private:
  enum class Fact : char { kUnknown, kHas, kHasNot };

  int NumSlots() const { return num_players_ + 1; }
  int EnvelopeSlot() const { return num_players_; }
  int Slot(int holder) const {
    return holder == kEnvelope ? EnvelopeSlot() : holder;
  }
  int HolderAt(int slot) const {
    return slot == EnvelopeSlot() ? kEnvelope : slot;
  }
  Fact At(int card, int slot) const { return facts_[card * NumSlots() + slot]; }
  Fact& At(int card, int slot) { return facts_[card * NumSlots() + slot]; }
  absl::Status ValidateHolder(int holder) const;
  absl::Status Contradiction(const string& reason);

  // Recording single facts, without running propagation.
  absl::Status SetPositive(int card, int slot);
  absl::Status SetNegative(int card, int slot);
  void Touch(int card, int slot);
  absl::Status RunWorklist();

  // Propagation rules.
  absl::Status ReduceSetConstraints(int slot);
  absl::Status InferHolder(int card);
  absl::Status SaturateCapacity(int slot);
  absl::Status CompleteCapacity(int slot);
  absl::Status ReduceExcludedSolutions();

  Perspective perspective_;
  int player_;
  int num_players_;
  vector<int> capacity_;  // x slot.
  vector<int> positive_count_;  // x slot.
  vector<Fact> facts_;  // x card x slot.
  vector<int> holder_slot_;  // x card, -1 while unknown.
  vector<Card> envelope_cards_;  // x category.
  vector<SetConstraint> constraints_;  // Open constraints only.
  vector<Guess> excluded_;
  int num_positive_ = 0, num_negative_ = 0;
  // Propagation worklist.
  deque<int> dirty_cards_, dirty_slots_;
  vector<bool> card_queued_, slot_queued_;
  absl::Status status_;
};

}  // namespace clue

#endif  // SRC_KNOWLEDGE_STORE_H_
