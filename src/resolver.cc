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

#include "src/resolver.h"

#include <algorithm>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"

namespace clue {

GuessEvent Outcome::ToProto() const {
  GuessEvent event;
  event.set_guesser(guesser);
  *event.mutable_guess() = guess;
  for (int player : passed) {
    event.add_passed(player);
  }
  event.set_disproved(disproved);
  if (disproved) {
    event.set_disprover(disprover);
    event.set_revealed(revealed);
  }
  return event;
}

absl::StatusOr<Outcome> Outcome::FromProto(const GuessEvent& event,
                                           int num_players) {
  auto valid_player = [num_players](int p) {
    return p >= 0 && p < num_players;
  };
  if (!valid_player(event.guesser())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid guesser ", event.guesser()));
  }
  RETURN_IF_ERROR(ValidateGuess(event.guess()));
  Outcome outcome{.guesser = event.guesser(), .guess = event.guess(),
                  .disproved = event.disproved()};
  for (int player : event.passed()) {
    if (!valid_player(player) || player == event.guesser()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid passing player ", player));
    }
    outcome.passed.push_back(player);
  }
  if (outcome.disproved) {
    if (!valid_player(event.disprover()) ||
        event.disprover() == event.guesser()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid disprover ", event.disprover()));
    }
    outcome.disprover = event.disprover();
    // The revealed card is private: it may be missing from a player's log.
    if (event.revealed() != CARD_UNSPECIFIED) {
      if (!GuessContains(event.guess(), event.revealed())) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Revealed %s, which is not in the guess %s",
            CardName(event.revealed()), GuessString(event.guess())));
      }
      outcome.revealed = event.revealed();
    }
  }
  return outcome;
}

string Outcome::DebugString() const {
  string result = absl::StrFormat("P%d guesses %s", guesser,
                                  GuessString(guess));
  if (!passed.empty()) {
    absl::StrAppend(&result, ", passed: ", absl::StrJoin(passed, ", "));
  }
  if (disproved) {
    absl::StrAppend(&result, absl::StrFormat(", P%d shows %s", disprover,
                                             CardName(revealed)));
  } else {
    absl::StrAppend(&result, ", nobody disproves");
  }
  return result;
}

Card ChooseCardToReveal(absl::Span<const Card> hand, const Guess& guess) {
  for (Category category : kCategories) {
    const Card card = GuessCard(guess, category);
    if (std::find(hand.begin(), hand.end(), card) != hand.end()) {
      return card;
    }
  }
  return CARD_UNSPECIFIED;
}

absl::StatusOr<Outcome> Resolve(const Guess& guess, int guesser,
                                const Deal& deal) {
  RETURN_IF_ERROR(ValidateGuess(guess));
  const int num_players = deal.NumPlayers();
  if (guesser < 0 || guesser >= num_players) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid guesser ", guesser));
  }
  Outcome outcome{.guesser = guesser, .guess = guess};
  for (int i = 1; i < num_players; ++i) {
    const int player = (guesser + i) % num_players;
    const Card card = ChooseCardToReveal(deal.Hand(player), guess);
    if (card == CARD_UNSPECIFIED) {
      outcome.passed.push_back(player);
      continue;
    }
    outcome.disproved = true;
    outcome.disprover = player;
    outcome.revealed = card;
    break;
  }
  VLOG(1) << outcome.DebugString();
  return outcome;
}

absl::Status FoldOutcome(const Outcome& outcome, KnowledgeStore* store) {
  for (int player : outcome.passed) {
    for (Card card : GuessCards(outcome.guess)) {
      RETURN_IF_ERROR(store->AssertNegative(card, player));
    }
  }
  if (!outcome.disproved) {
    for (int player = 0; player < store->NumPlayers(); ++player) {
      if (player == outcome.guesser) {
        continue;
      }
      for (Card card : GuessCards(outcome.guess)) {
        RETURN_IF_ERROR(store->AssertNegative(card, player));
      }
    }
    return absl::OkStatus();
  }
  const bool sees_card =
      store->GetPerspective() == OMNISCIENT ||
      (store->GetPerspective() == PLAYER &&
       store->Player() == outcome.guesser);
  if (sees_card && outcome.revealed != CARD_UNSPECIFIED) {
    return store->AssertPositive(outcome.revealed, outcome.disprover);
  }
  if (store->GetPerspective() == PLAYER &&
      store->Player() == outcome.disprover) {
    return absl::OkStatus();  // Knows its own hand.
  }
  return store->AssertSetConstraint(outcome.disprover,
                                    GuessCards(outcome.guess));
}

absl::Status FoldUndisprovedGuess(const Outcome& outcome,
                                  KnowledgeStore* store) {
  if (outcome.disproved || (store->GetPerspective() == PLAYER &&
                            store->Player() == outcome.guesser)) {
    return absl::OkStatus();
  }
  return store->NoOneDisproved(outcome.guesser, outcome.guess);
}

}  // namespace clue
