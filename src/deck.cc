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

#include "src/deck.h"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

namespace clue {
using std::mt19937;
using std::uniform_int_distribution;

bool IsValidCard(Card card) {
  return card > CARD_UNSPECIFIED && card <= BALLROOM;
}

Category CardCategory(Card card) {
  CHECK(IsValidCard(card)) << "Invalid card: " << static_cast<int>(card);
  return kCardMetadata[card].category;
}

string CardName(Card card) {
  return IsValidCard(card) ? kCardMetadata[card].name : "<none>";
}

const absl::Span<const Card> CardsInCategory(Category category) {
  switch (category) {
    case PERSON:
      return kPersons;
    case WEAPON:
      return kWeapons;
    case ROOM:
      return kRooms;
    default:
      CHECK(false) << "Invalid category: " << Category_Name(category);
  }
  return {};
}

int CategoryIndex(Category category) {
  CHECK_NE(category, CATEGORY_UNSPECIFIED);
  return static_cast<int>(category) - 1;
}

vector<Card> BuildDeck() {
  vector<Card> deck;
  for (Category category : kCategories) {
    for (Card card : CardsInCategory(category)) {
      deck.push_back(card);
    }
  }
  return deck;
}

vector<Card> GuessCards(const Guess& guess) {
  return {guess.person(), guess.weapon(), guess.room()};
}

Guess NewGuess(Card person, Card weapon, Card room) {
  Guess guess;
  guess.set_person(person);
  guess.set_weapon(weapon);
  guess.set_room(room);
  return guess;
}

Card GuessCard(const Guess& guess, Category category) {
  switch (category) {
    case PERSON:
      return guess.person();
    case WEAPON:
      return guess.weapon();
    case ROOM:
      return guess.room();
    default:
      CHECK(false) << "Invalid category: " << Category_Name(category);
  }
  return CARD_UNSPECIFIED;
}

bool IsValidGuess(const Guess& guess) {
  return ValidateGuess(guess).ok();
}

absl::Status ValidateGuess(const Guess& guess) {
  for (Category category : kCategories) {
    const Card card = GuessCard(guess, category);
    if (!IsValidCard(card) || CardCategory(card) != category) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Malformed guess %s: expected a %s card, got %s",
          guess.ShortDebugString(), Category_Name(category),
          Card_Name(card)));
    }
  }
  return absl::OkStatus();
}

bool GuessContains(const Guess& guess, Card card) {
  return guess.person() == card || guess.weapon() == card ||
         guess.room() == card;
}

string GuessString(const Guess& guess) {
  return absl::StrFormat("(%s, %s, %s)", CardName(guess.person()),
                         CardName(guess.weapon()), CardName(guess.room()));
}

bool operator==(const Guess& l, const Guess& r) {
  return l.person() == r.person() && l.weapon() == r.weapon() &&
         l.room() == r.room();
}

absl::Status ValidatePlayerCount(int num_players) {
  if (num_players < kMinPlayers || num_players > kMaxPlayers) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "InvalidPlayerCount: %d, expected between %d and %d", num_players,
        kMinPlayers, kMaxPlayers));
  }
  return absl::OkStatus();
}

vector<int> HandSizes(int num_players) {
  CHECK_GE(num_players, kMinPlayers);
  CHECK_LE(num_players, kMaxPlayers);
  vector<int> sizes(num_players, kNumDealtCards / num_players);
  for (int i = 0; i < kNumDealtCards % num_players; ++i) {
    ++sizes[i];
  }
  return sizes;
}

Deal::Deal(const Guess& envelope, const vector<vector<Card>>& hands)
    : envelope_(envelope), hands_(hands), holder_(kNumCards, kNoPlayer) {
  CHECK(IsValidGuess(envelope_)) << GuessString(envelope_);
  for (Card card : GuessCards(envelope_)) {
    holder_[CardIndex(card)] = kEnvelope;
  }
  for (int i = 0; i < hands_.size(); ++i) {
    for (Card card : hands_[i]) {
      CHECK(IsValidCard(card));
      CHECK_EQ(holder_[CardIndex(card)], kNoPlayer)
          << CardName(card) << " dealt twice";
      holder_[CardIndex(card)] = i;
    }
  }
  for (Card card : BuildDeck()) {
    CHECK_NE(HolderOf(card), kNoPlayer) << CardName(card) << " not dealt";
  }
}

vector<int> Deal::HandSizes() const {
  vector<int> sizes;
  for (const auto& hand : hands_) {
    sizes.push_back(hand.size());
  }
  return sizes;
}

absl::StatusOr<Deal> Deal::FromProto(const GameSetup& setup) {
  const absl::Status players_status = ValidatePlayerCount(setup.num_players());
  if (!players_status.ok()) {
    return players_status;
  }
  if (setup.hands_size() != setup.num_players()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expected %d hands, got %d", setup.num_players(), setup.hands_size()));
  }
  const absl::Status envelope_status = ValidateGuess(setup.envelope());
  if (!envelope_status.ok()) {
    return envelope_status;
  }
  const vector<int> sizes = clue::HandSizes(setup.num_players());
  vector<bool> seen(kNumCards);
  for (Card card : GuessCards(setup.envelope())) {
    seen[CardIndex(card)] = true;
  }
  vector<vector<Card>> hands;
  for (int i = 0; i < setup.hands_size(); ++i) {
    const auto& hand = setup.hands(i);
    if (hand.cards_size() != sizes[i]) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Player %d should hold %d cards, got %d", i, sizes[i],
          hand.cards_size()));
    }
    vector<Card> cards;
    for (int c : hand.cards()) {
      const Card card = Card(c);
      if (!IsValidCard(card) || seen[CardIndex(card)]) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Invalid or repeated card %d in the hand of player %d", c, i));
      }
      seen[CardIndex(card)] = true;
      cards.push_back(card);
    }
    hands.push_back(cards);
  }
  return Deal(setup.envelope(), hands);
}

GameSetup Deal::ToProto() const {
  GameSetup setup;
  setup.set_num_players(NumPlayers());
  *setup.mutable_envelope() = envelope_;
  for (const auto& hand : hands_) {
    auto* hand_pb = setup.add_hands();
    for (Card card : hand) {
      hand_pb->add_cards(card);
    }
  }
  return setup;
}

absl::StatusOr<Deal> DealCards(int num_players, uint64_t rng_seed) {
  const absl::Status status = ValidatePlayerCount(num_players);
  if (!status.ok()) {
    return status;
  }
  mt19937 rng(rng_seed);
  auto pick = [&rng](Category category) {
    const auto cards = CardsInCategory(category);
    uniform_int_distribution<int> dist(0, cards.size() - 1);
    return cards[dist(rng)];
  };
  // Drawn in category order.
  const Card person = pick(PERSON);
  const Card weapon = pick(WEAPON);
  const Card room = pick(ROOM);
  const Guess envelope = NewGuess(person, weapon, room);
  vector<Card> deck;
  for (Card card : BuildDeck()) {
    if (!GuessContains(envelope, card)) {
      deck.push_back(card);
    }
  }
  std::shuffle(deck.begin(), deck.end(), rng);
  vector<vector<Card>> hands(num_players);
  for (int i = 0; i < deck.size(); ++i) {
    hands[i % num_players].push_back(deck[i]);
  }
  for (auto& hand : hands) {
    std::sort(hand.begin(), hand.end());
  }
  return Deal(envelope, hands);
}

}  // namespace clue
