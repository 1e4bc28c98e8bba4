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

#ifndef SRC_DECK_H_
#define SRC_DECK_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/clue.pb.h"

namespace clue {

using std::string;
using std::vector;

const int kNoPlayer = -1;  // Used in place of player index.
const int kEnvelope = -2;  // The holder of the solution cards.

const int kNumCards = 21;
const int kNumCategories = 3;
const int kNumDealtCards = kNumCards - kNumCategories;
const int kMinPlayers = 2;
const int kMaxPlayers = 6;

const Category kCategories[] = {PERSON, WEAPON, ROOM};

const Card kPersons[] = {
    COLONEL_MUSTARD, MISS_SCARLET, PROFESSOR_PLUM, MR_GREEN, MRS_WHITE,
    MRS_PEACOCK
};
const Card kWeapons[] = {
    ROPE, LEAD_PIPE, KNIFE, WRENCH, CANDLESTICK, REVOLVER
};
const Card kRooms[] = {
    KITCHEN, STUDY, CONSERVATORY, HALL, DINING_ROOM, BILLIARD_ROOM, LOUNGE,
    LIBRARY, BALLROOM
};

// Describes a card of the deck.
struct CardMetadata {
  Category category = CATEGORY_UNSPECIFIED;
  const char* name = "";  // As printed on the card.
};

const CardMetadata kCardMetadata[] = {
  {},  // CARD_UNSPECIFIED
  {.category = PERSON, .name = "Colonel Mustard"},
  {.category = PERSON, .name = "Miss Scarlet"},
  {.category = PERSON, .name = "Professor Plum"},
  {.category = PERSON, .name = "Mr. Green"},
  {.category = PERSON, .name = "Mrs. White"},
  {.category = PERSON, .name = "Mrs. Peacock"},
  {.category = WEAPON, .name = "Rope"},
  {.category = WEAPON, .name = "Lead Pipe"},
  {.category = WEAPON, .name = "Knife"},
  {.category = WEAPON, .name = "Wrench"},
  {.category = WEAPON, .name = "Candlestick"},
  {.category = WEAPON, .name = "Revolver"},
  {.category = ROOM, .name = "Kitchen"},
  {.category = ROOM, .name = "Study"},
  {.category = ROOM, .name = "Conservatory"},
  {.category = ROOM, .name = "Hall"},
  {.category = ROOM, .name = "Dining Room"},
  {.category = ROOM, .name = "Billiard Room"},
  {.category = ROOM, .name = "Lounge"},
  {.category = ROOM, .name = "Library"},
  {.category = ROOM, .name = "Ballroom"},
};

bool IsValidCard(Card card);
Category CardCategory(Card card);
string CardName(Card card);
// Dense index in [0, kNumCards), following the canonical deck order.
inline int CardIndex(Card card) { return static_cast<int>(card) - 1; }
inline Card CardAt(int index) { return Card(index + 1); }
const absl::Span<const Card> CardsInCategory(Category category);
int CategoryIndex(Category category);

// The 21 cards in canonical order: persons, weapons, rooms.
vector<Card> BuildDeck();

// Guesses and accusations are triples with one card per category.
vector<Card> GuessCards(const Guess& guess);
Guess NewGuess(Card person, Card weapon, Card room);
Card GuessCard(const Guess& guess, Category category);
bool IsValidGuess(const Guess& guess);
absl::Status ValidateGuess(const Guess& guess);
bool GuessContains(const Guess& guess, Card card);
string GuessString(const Guess& guess);
bool operator==(const Guess& l, const Guess& r);

// Hand size per player: the 18 dealt cards go round-robin from player 0, so
// the first 18 % num_players players get one extra card.
vector<int> HandSizes(int num_players);
absl::Status ValidatePlayerCount(int num_players);

// The true card distribution of one game.
class Deal {
 public:
  Deal(const Guess& envelope, const vector<vector<Card>>& hands);

  static absl::StatusOr<Deal> FromProto(const GameSetup& setup);
  GameSetup ToProto() const;

  int NumPlayers() const { return hands_.size(); }
  const Guess& Envelope() const { return envelope_; }
  const vector<Card>& Hand(int player) const { return hands_[player]; }
  const vector<vector<Card>>& Hands() const { return hands_; }
  vector<int> HandSizes() const;
  // A player index, or kEnvelope.
  int HolderOf(Card card) const { return holder_[CardIndex(card)]; }
  bool PlayerHolds(int player, Card card) const {
    return HolderOf(card) == player;
  }

 private:
  Guess envelope_;
  vector<vector<Card>> hands_;  // x player.
  vector<int> holder_;  // x card index.
};

// Picks the envelope uniformly per category, shuffles the remaining cards
// and deals them round-robin. Deterministic for a given seed.
absl::StatusOr<Deal> DealCards(int num_players, uint64_t rng_seed);

}  // namespace clue

#endif  // SRC_DECK_H_
