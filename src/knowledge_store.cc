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

// Propagation rules, applied from a worklist until none fires:
// (a) Set reduction: candidates known negative for the holder are dropped; a
//     constraint with a positive candidate is satisfied and dropped; a single
//     remaining candidate becomes positive; no candidates is a contradiction.
// (b) Holder inference: a card that only one holder may still hold is held
//     by that holder (in particular, a card no player holds is in the
//     envelope).
// (c) Capacity saturation: a full hand lacks every other card; an envelope
//     category with a known card lacks the rest of that category.
// (d) Capacity completion: a holder whose remaining candidates exactly fill
//     its remaining capacity holds all of them.
// (e) Excluded solutions: if two cards of a failed accusation are in the
//     envelope, the third is not.
#include "src/knowledge_store.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"

namespace clue {

absl::Status ContradictionError(const string& reason) {
  return absl::FailedPreconditionError(absl::StrCat("Contradiction: ", reason));
}

bool IsContradiction(const absl::Status& status) {
  return status.code() == absl::StatusCode::kFailedPrecondition &&
         absl::StartsWith(status.message(), "Contradiction: ");
}

KnowledgeStore::KnowledgeStore(Perspective perspective,
                               absl::Span<const int> hand_sizes, int player)
    : perspective_(perspective), player_(player),
      num_players_(hand_sizes.size()),
      facts_(kNumCards * (hand_sizes.size() + 1), Fact::kUnknown),
      holder_slot_(kNumCards, -1),
      envelope_cards_(kNumCategories, CARD_UNSPECIFIED),
      card_queued_(kNumCards), slot_queued_(hand_sizes.size() + 1) {
  CHECK_NE(perspective_, PERSPECTIVE_UNSPECIFIED)
      << "Need to specify perspective";
  CHECK(ValidatePlayerCount(num_players_).ok()) << num_players_;
  CHECK_EQ(perspective_ == PLAYER, player_ != kNoPlayer)
      << "A player is required in, and only in, the PLAYER perspective";
  if (perspective_ == PLAYER) {
    CHECK_GE(player_, 0);
    CHECK_LT(player_, num_players_);
  }
  int dealt = 0;
  for (int size : hand_sizes) {
    CHECK_GT(size, 0);
    capacity_.push_back(size);
    dealt += size;
  }
  CHECK_EQ(dealt, kNumDealtCards) << "Hand sizes must add up to 18 cards";
  capacity_.push_back(kNumCategories);  // The envelope.
  positive_count_.assign(NumSlots(), 0);
}

KnowledgeStore KnowledgeStore::ForPlayer(const Deal& deal, int player) {
  KnowledgeStore store(PLAYER, deal.HandSizes(), player);
  const absl::Status st = store.SeedHand(player, deal.Hand(player));
  CHECK(st.ok()) << st;
  return store;
}

KnowledgeStore KnowledgeStore::ForObserver(const Deal& deal) {
  return KnowledgeStore(OBSERVER, deal.HandSizes());
}

KnowledgeStore KnowledgeStore::Omniscient(const Deal& deal) {
  KnowledgeStore store(OMNISCIENT, deal.HandSizes());
  for (int i = 0; i < deal.NumPlayers(); ++i) {
    const absl::Status st = store.SeedHand(i, deal.Hand(i));
    CHECK(st.ok()) << st;
  }
  for (Card card : GuessCards(deal.Envelope())) {
    const absl::Status st = store.AssertPositive(card, kEnvelope);
    CHECK(st.ok()) << st;
  }
  return store;
}

absl::Status KnowledgeStore::ValidateHolder(int holder) const {
  if (holder == kEnvelope || (holder >= 0 && holder < num_players_)) {
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError(
      absl::StrFormat("Invalid holder %d in a %d player game", holder,
                      num_players_));
}

absl::Status KnowledgeStore::Contradiction(const string& reason) {
  status_ = ContradictionError(reason);
  LOG(ERROR) << status_ << "\n" << DebugString();
  return status_;
}

absl::Status KnowledgeStore::AssertPositive(Card card, int holder) {
  RETURN_IF_ERROR(status_);
  if (!IsValidCard(card)) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid card ", card));
  }
  RETURN_IF_ERROR(ValidateHolder(holder));
  RETURN_IF_ERROR(SetPositive(CardIndex(card), Slot(holder)));
  return RunWorklist();
}

absl::Status KnowledgeStore::AssertNegative(Card card, int holder) {
  RETURN_IF_ERROR(status_);
  if (!IsValidCard(card)) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid card ", card));
  }
  RETURN_IF_ERROR(ValidateHolder(holder));
  RETURN_IF_ERROR(SetNegative(CardIndex(card), Slot(holder)));
  return RunWorklist();
}

absl::Status KnowledgeStore::AssertSetConstraint(int holder,
                                                 absl::Span<const Card> cards) {
  RETURN_IF_ERROR(status_);
  RETURN_IF_ERROR(ValidateHolder(holder));
  if (cards.empty()) {
    return absl::InvalidArgumentError("Empty set constraint");
  }
  SetConstraint constraint{.holder = holder};
  for (Card card : cards) {
    if (!IsValidCard(card)) {
      return absl::InvalidArgumentError(absl::StrCat("Invalid card ", card));
    }
    constraint.cards.push_back(card);
  }
  std::sort(constraint.cards.begin(), constraint.cards.end());
  constraint.cards.erase(
      std::unique(constraint.cards.begin(), constraint.cards.end()),
      constraint.cards.end());
  for (const auto& c : constraints_) {
    if (c.holder == holder && c.cards == constraint.cards) {
      return absl::OkStatus();  // Already known.
    }
  }
  constraints_.push_back(constraint);
  Touch(-1, Slot(holder));
  return RunWorklist();
}

absl::Status KnowledgeStore::NoOneDisproved(int guesser, const Guess& guess) {
  RETURN_IF_ERROR(status_);
  RETURN_IF_ERROR(ValidateGuess(guess));
  if (guesser < 0 || guesser >= num_players_) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid guesser ", guesser));
  }
  const vector<Card> cards = GuessCards(guess);
  for (int p = 0; p < num_players_; ++p) {
    if (p == guesser) {
      continue;
    }
    for (Card card : cards) {
      RETURN_IF_ERROR(SetNegative(CardIndex(card), p));
    }
  }
  RETURN_IF_ERROR(RunWorklist());
  return AssertSetConstraint(guesser, cards);
}

absl::Status KnowledgeStore::AssertNotSolution(const Guess& guess) {
  RETURN_IF_ERROR(status_);
  RETURN_IF_ERROR(ValidateGuess(guess));
  for (const Guess& g : excluded_) {
    if (g == guess) {
      return absl::OkStatus();
    }
  }
  excluded_.push_back(guess);
  Touch(-1, EnvelopeSlot());
  return RunWorklist();
}

absl::Status KnowledgeStore::SeedHand(int player, absl::Span<const Card> cards) {
  RETURN_IF_ERROR(status_);
  if (player < 0 || player >= num_players_) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid player ", player));
  }
  if (cards.size() != capacity_[player]) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Player %d holds %d cards, got %d", player, capacity_[player],
        cards.size()));
  }
  for (Card card : cards) {
    if (!IsValidCard(card)) {
      return absl::InvalidArgumentError(absl::StrCat("Invalid card ", card));
    }
    RETURN_IF_ERROR(SetPositive(CardIndex(card), player));
  }
  return RunWorklist();
}

absl::Status KnowledgeStore::Propagate() {
  RETURN_IF_ERROR(status_);
  for (int c = 0; c < kNumCards; ++c) {
    Touch(c, -1);
  }
  for (int s = 0; s < NumSlots(); ++s) {
    Touch(-1, s);
  }
  return RunWorklist();
}

absl::Status KnowledgeStore::SetPositive(int card, int slot) {
  Fact& fact = At(card, slot);
  if (fact == Fact::kHas) {
    return absl::OkStatus();
  }
  const Card c = CardAt(card);
  const int holder = HolderAt(slot);
  if (fact == Fact::kHasNot) {
    return Contradiction(absl::StrFormat("%s is known not to hold %s",
                                         HolderName(holder), CardName(c)));
  }
  if (holder_slot_[card] != -1) {
    return Contradiction(absl::StrFormat(
        "%s is held by %s, cannot also be held by %s", CardName(c),
        HolderName(HolderAt(holder_slot_[card])), HolderName(holder)));
  }
  if (slot == EnvelopeSlot()) {
    const int category = CategoryIndex(CardCategory(c));
    if (envelope_cards_[category] != CARD_UNSPECIFIED) {
      return Contradiction(absl::StrFormat(
          "The envelope already holds %s, cannot also hold %s",
          CardName(envelope_cards_[category]), CardName(c)));
    }
    envelope_cards_[category] = c;
  } else if (positive_count_[slot] >= capacity_[slot]) {
    return Contradiction(absl::StrFormat(
        "%s already holds %d cards, cannot also hold %s", HolderName(holder),
        capacity_[slot], CardName(c)));
  }
  VLOG(2) << HolderName(holder) << " holds " << CardName(c);
  fact = Fact::kHas;
  holder_slot_[card] = slot;
  ++positive_count_[slot];
  ++num_positive_;
  Touch(card, slot);
  for (int s = 0; s < NumSlots(); ++s) {
    if (s != slot) {
      RETURN_IF_ERROR(SetNegative(card, s));
    }
  }
  return absl::OkStatus();
}

absl::Status KnowledgeStore::SetNegative(int card, int slot) {
  Fact& fact = At(card, slot);
  if (fact == Fact::kHasNot) {
    return absl::OkStatus();
  }
  if (fact == Fact::kHas) {
    return Contradiction(absl::StrFormat("%s is known to hold %s",
                                         HolderName(HolderAt(slot)),
                                         CardName(CardAt(card))));
  }
  VLOG(3) << HolderName(HolderAt(slot)) << " lacks " << CardName(CardAt(card));
  fact = Fact::kHasNot;
  ++num_negative_;
  Touch(card, slot);
  return absl::OkStatus();
}

void KnowledgeStore::Touch(int card, int slot) {
  if (card >= 0 && !card_queued_[card]) {
    card_queued_[card] = true;
    dirty_cards_.push_back(card);
  }
  if (slot >= 0 && !slot_queued_[slot]) {
    slot_queued_[slot] = true;
    dirty_slots_.push_back(slot);
  }
}

absl::Status KnowledgeStore::RunWorklist() {
  while (!dirty_cards_.empty() || !dirty_slots_.empty()) {
    if (!dirty_cards_.empty()) {
      const int card = dirty_cards_.front();
      dirty_cards_.pop_front();
      card_queued_[card] = false;
      RETURN_IF_ERROR(InferHolder(card));
      continue;
    }
    const int slot = dirty_slots_.front();
    dirty_slots_.pop_front();
    slot_queued_[slot] = false;
    RETURN_IF_ERROR(ReduceSetConstraints(slot));
    RETURN_IF_ERROR(SaturateCapacity(slot));
    RETURN_IF_ERROR(CompleteCapacity(slot));
    if (slot == EnvelopeSlot()) {
      RETURN_IF_ERROR(ReduceExcludedSolutions());
    }
  }
  return absl::OkStatus();
}

absl::Status KnowledgeStore::ReduceSetConstraints(int slot) {
  const int holder = HolderAt(slot);
  vector<SetConstraint> open;
  vector<int> forced;  // Card indices.
  for (SetConstraint& constraint : constraints_) {
    if (constraint.holder != holder) {
      open.push_back(constraint);
      continue;
    }
    bool satisfied = false;
    vector<Card> candidates;
    for (Card card : constraint.cards) {
      const Fact fact = At(CardIndex(card), slot);
      if (fact == Fact::kHas) {
        satisfied = true;
        break;
      }
      if (fact == Fact::kUnknown) {
        candidates.push_back(card);
      }
    }
    if (satisfied) {
      continue;
    }
    if (candidates.empty()) {
      vector<string> names;
      for (Card card : constraint.cards) {
        names.push_back(CardName(card));
      }
      return Contradiction(absl::StrFormat(
          "%s must hold one of {%s}, but holds none of them",
          HolderName(holder), absl::StrJoin(names, ", ")));
    }
    if (candidates.size() == 1) {
      VLOG(1) << "Set constraint for " << HolderName(holder)
              << " reduced to " << CardName(candidates[0]);
      forced.push_back(CardIndex(candidates[0]));
      continue;
    }
    constraint.cards = candidates;
    open.push_back(constraint);
  }
  constraints_ = open;
  for (int card : forced) {
    RETURN_IF_ERROR(SetPositive(card, slot));
  }
  return absl::OkStatus();
}

absl::Status KnowledgeStore::InferHolder(int card) {
  if (holder_slot_[card] != -1) {
    return absl::OkStatus();
  }
  int possible = -1, num_possible = 0;
  for (int s = 0; s < NumSlots(); ++s) {
    if (At(card, s) != Fact::kHasNot) {
      possible = s;
      ++num_possible;
    }
  }
  if (num_possible == 0) {
    return Contradiction(absl::StrFormat("Nobody can hold %s",
                                         CardName(CardAt(card))));
  }
  if (num_possible == 1) {
    VLOG(1) << "Only " << HolderName(HolderAt(possible)) << " can hold "
            << CardName(CardAt(card));
    return SetPositive(card, possible);
  }
  return absl::OkStatus();
}

absl::Status KnowledgeStore::SaturateCapacity(int slot) {
  if (slot == EnvelopeSlot()) {
    for (Category category : kCategories) {
      const Card known = envelope_cards_[CategoryIndex(category)];
      if (known == CARD_UNSPECIFIED) {
        continue;
      }
      for (Card card : CardsInCategory(category)) {
        if (card != known) {
          RETURN_IF_ERROR(SetNegative(CardIndex(card), slot));
        }
      }
    }
    return absl::OkStatus();
  }
  if (positive_count_[slot] < capacity_[slot]) {
    return absl::OkStatus();
  }
  for (int card = 0; card < kNumCards; ++card) {
    if (At(card, slot) == Fact::kUnknown) {
      RETURN_IF_ERROR(SetNegative(card, slot));
    }
  }
  return absl::OkStatus();
}

absl::Status KnowledgeStore::CompleteCapacity(int slot) {
  const int holder = HolderAt(slot);
  if (slot == EnvelopeSlot()) {
    for (Category category : kCategories) {
      if (envelope_cards_[CategoryIndex(category)] != CARD_UNSPECIFIED) {
        continue;
      }
      vector<int> candidates;
      for (Card card : CardsInCategory(category)) {
        if (At(CardIndex(card), slot) == Fact::kUnknown) {
          candidates.push_back(CardIndex(card));
        }
      }
      if (candidates.empty()) {
        return Contradiction(absl::StrFormat(
            "The envelope cannot hold any %s", Category_Name(category)));
      }
      if (candidates.size() == 1) {
        RETURN_IF_ERROR(SetPositive(candidates[0], slot));
      }
    }
    return absl::OkStatus();
  }
  const int remaining = capacity_[slot] - positive_count_[slot];
  if (remaining == 0) {
    return absl::OkStatus();
  }
  vector<int> candidates;
  for (int card = 0; card < kNumCards; ++card) {
    if (At(card, slot) == Fact::kUnknown) {
      candidates.push_back(card);
    }
  }
  if (candidates.size() < remaining) {
    return Contradiction(absl::StrFormat(
        "%s needs %d more cards but only %d are possible", HolderName(holder),
        remaining, candidates.size()));
  }
  if (candidates.size() == remaining) {
    VLOG(1) << HolderName(holder) << " holds all remaining candidates";
    for (int card : candidates) {
      RETURN_IF_ERROR(SetPositive(card, slot));
    }
  }
  return absl::OkStatus();
}

absl::Status KnowledgeStore::ReduceExcludedSolutions() {
  const int slot = EnvelopeSlot();
  for (const Guess& guess : excluded_) {
    int in_envelope = 0, other = -1;
    for (Card card : GuessCards(guess)) {
      if (At(CardIndex(card), slot) == Fact::kHas) {
        ++in_envelope;
      } else {
        other = CardIndex(card);
      }
    }
    if (in_envelope == kNumCategories) {
      return Contradiction(absl::StrFormat(
          "The envelope holds %s, which was a failed accusation",
          GuessString(guess)));
    }
    if (in_envelope == kNumCategories - 1) {
      RETURN_IF_ERROR(SetNegative(other, slot));
    }
  }
  return absl::OkStatus();
}

int KnowledgeStore::HolderOf(Card card) const {
  const int slot = holder_slot_[CardIndex(card)];
  return slot == -1 ? kNoPlayer : HolderAt(slot);
}

bool KnowledgeStore::EnvelopeKnown() const {
  for (Card card : envelope_cards_) {
    if (card == CARD_UNSPECIFIED) {
      return false;
    }
  }
  return true;
}

Guess KnowledgeStore::KnownEnvelope() const {
  return NewGuess(EnvelopeCard(PERSON), EnvelopeCard(WEAPON),
                  EnvelopeCard(ROOM));
}

vector<int> KnowledgeStore::Holders() const {
  vector<int> holders;
  for (int s = 0; s < NumSlots(); ++s) {
    holders.push_back(HolderAt(s));
  }
  return holders;
}

string KnowledgeStore::HolderName(int holder) const {
  if (holder == kEnvelope) {
    return "Envelope";
  }
  if (holder == kNoPlayer) {
    return "<nobody>";
  }
  return absl::StrFormat("P%d", holder);
}

string KnowledgeStore::DebugString() const {
  string result = absl::StrFormat("%-16s", "");
  for (int s = 0; s < NumSlots(); ++s) {
    absl::StrAppend(&result, absl::StrFormat("%-9s", HolderName(HolderAt(s))));
  }
  absl::StrAppend(&result, "\n");
  for (int c = 0; c < kNumCards; ++c) {
    absl::StrAppend(&result, absl::StrFormat("%-16s", CardName(CardAt(c))));
    for (int s = 0; s < NumSlots(); ++s) {
      const Fact fact = At(c, s);
      absl::StrAppend(&result, absl::StrFormat(
          "%-9s", fact == Fact::kHas ? "X" :
                  fact == Fact::kHasNot ? "-" : "?"));
    }
    absl::StrAppend(&result, "\n");
  }
  for (const auto& constraint : constraints_) {
    vector<string> names;
    for (Card card : constraint.cards) {
      names.push_back(CardName(card));
    }
    absl::StrAppend(&result, HolderName(constraint.holder), " has one of {",
                    absl::StrJoin(names, ", "), "}\n");
  }
  for (const auto& guess : excluded_) {
    absl::StrAppend(&result, "Not the solution: ", GuessString(guess), "\n");
  }
  return result;
}

}  // namespace clue
