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

#include "src/strategy.h"

#include <algorithm>
#include <cmath>
#include <memory>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/posterior_estimator.h"
#include "src/world_solver.h"

namespace clue {
using std::make_unique;
using std::uniform_int_distribution;

namespace {
// Tolerance when comparing probabilities to the accusation threshold.
const double kEpsilon = 1e-9;

bool IsOwnCard(const KnowledgeStore& store, Card card) {
  return store.GetPerspective() == PLAYER &&
         store.IsPositive(card, store.Player());
}

// Entropy of a category's envelope distribution once the card is known not
// to be in the envelope.
double EntropyWithout(const EstimatorResponse& posterior, Card removed) {
  const double p_removed = EnvelopeProbability(posterior, removed);
  if (p_removed >= 1) {
    return 0;
  }
  double entropy = 0;
  for (Card card : CardsInCategory(CardCategory(removed))) {
    if (card == removed) {
      continue;
    }
    const double p = EnvelopeProbability(posterior, card) / (1 - p_removed);
    if (p > 0) {
      entropy -= p * std::log2(p);
    }
  }
  return entropy;
}
}  // namespace

bool IsOnlySolution(const KnowledgeStore& store, const Guess& solution) {
  KnowledgeStore others = store;
  const absl::Status st = others.AssertNotSolution(solution);
  if (IsContradiction(st)) {
    return true;
  }
  CHECK(st.ok()) << st;
  return !IsValidWorld(others);
}

vector<Card> KnownHand(const KnowledgeStore& store, int player) {
  vector<Card> hand;
  for (Card card : BuildDeck()) {
    if (store.IsPositive(card, player)) {
      hand.push_back(card);
    }
  }
  return hand;
}

Card HeuristicStrategy::PickUniformly(absl::Span<const Card> cards) {
  CHECK(!cards.empty());
  uniform_int_distribution<int> dist(0, cards.size() - 1);
  return cards[dist(rng_)];
}

optional<Guess> HeuristicStrategy::ChooseAccusation(
    const KnowledgeStore& store, const EstimatorResponse& posterior) {
  if (!store.EnvelopeKnown()) {
    return std::nullopt;
  }
  return store.KnownEnvelope();
}

Guess RandomStrategy::ChooseGuess(const KnowledgeStore& store,
                                  const EstimatorResponse& posterior) {
  vector<Card> picks;
  for (Category category : kCategories) {
    vector<Card> options;
    for (Card card : CardsInCategory(category)) {
      if (!IsOwnCard(store, card)) {
        options.push_back(card);
      }
    }
    picks.push_back(PickUniformly(options));
  }
  return NewGuess(picks[0], picks[1], picks[2]);
}

Guess BasicStrategy::ChooseGuess(const KnowledgeStore& store,
                                 const EstimatorResponse& posterior) {
  vector<Card> picks;
  for (Category category : kCategories) {
    vector<Card> options;
    for (Card card : CardsInCategory(category)) {
      const int holder = store.HolderOf(card);
      if (holder == kNoPlayer || holder == kEnvelope) {
        options.push_back(card);
      }
    }
    picks.push_back(PickUniformly(options));
  }
  return NewGuess(picks[0], picks[1], picks[2]);
}

Guess GoodStrategy::ChooseGuess(const KnowledgeStore& store,
                                const EstimatorResponse& posterior) {
  Category open = CATEGORY_UNSPECIFIED;
  for (Category category : kCategories) {
    if (store.EnvelopeCard(category) == CARD_UNSPECIFIED) {
      open = category;
      break;
    }
  }
  if (open == CATEGORY_UNSPECIFIED) {
    return store.KnownEnvelope();
  }
  vector<Card> picks;
  for (Category category : kCategories) {
    vector<Card> unknown, silent;
    for (Card card : CardsInCategory(category)) {
      const int holder = store.HolderOf(card);
      if (holder == kNoPlayer) {
        unknown.push_back(card);
      } else if (holder == kEnvelope || IsOwnCard(store, card)) {
        silent.push_back(card);
      }
    }
    if (category != open && !silent.empty()) {
      picks.push_back(PickUniformly(silent));
    } else if (!unknown.empty()) {
      picks.push_back(PickUniformly(unknown));
    } else {
      // Only in solved categories without own cards.
      picks.push_back(store.EnvelopeCard(category));
    }
  }
  return NewGuess(picks[0], picks[1], picks[2]);
}

double RecordMissesStrategy::EnvelopeLikelihood(const KnowledgeStore& store,
                                                Card card) {
  const int holder = store.HolderOf(card);
  if (holder != kNoPlayer) {
    return holder == kEnvelope ? 1 : 0;
  }
  if (store.IsNegative(card, kEnvelope)) {
    return 0;
  }
  int candidates = 0;
  for (int player = 0; player < store.NumPlayers(); ++player) {
    candidates += store.CanHold(card, player);
  }
  return 1.0 / (candidates + 1);
}

Guess RecordMissesStrategy::ChooseGuess(const KnowledgeStore& store,
                                        const EstimatorResponse& posterior) {
  vector<Card> picks;
  for (Category category : kCategories) {
    Card best = CARD_UNSPECIFIED;
    double best_likelihood = 0;
    for (Card card : CardsInCategory(category)) {
      const double likelihood = EnvelopeLikelihood(store, card);
      if (likelihood > best_likelihood + kEpsilon) {
        best = card;
        best_likelihood = likelihood;
      }
    }
    CHECK_NE(best, CARD_UNSPECIFIED)
        << "No envelope candidate for " << Category_Name(category);
    picks.push_back(best);
  }
  return NewGuess(picks[0], picks[1], picks[2]);
}

double MleStrategy::ExpectedEntropy(const KnowledgeStore& store,
                                    const EstimatorResponse& posterior,
                                    const Guess& guess) {
  double entropy[kNumCategories];
  double total = 0;
  for (Category category : kCategories) {
    entropy[CategoryIndex(category)] = CategoryEntropy(posterior, category);
    total += entropy[CategoryIndex(category)];
  }
  double p_none = 1, reveal_weight = 0;
  double entropy_none = total;
  vector<Card> showable;
  for (Card card : GuessCards(guess)) {
    if (IsOwnCard(store, card)) {
      continue;
    }
    const double p = EnvelopeProbability(posterior, card);
    p_none *= p;
    reveal_weight += 1 - p;
    entropy_none -= entropy[CategoryIndex(CardCategory(card))];
    showable.push_back(card);
  }
  if (showable.empty() || reveal_weight <= 0) {
    return entropy_none * p_none + total * (1 - p_none);
  }
  double entropy_reveal = 0;
  for (Card card : showable) {
    const int c = CategoryIndex(CardCategory(card));
    const double p_show = (1 - EnvelopeProbability(posterior, card)) /
                          reveal_weight;
    entropy_reveal += p_show * (total - entropy[c] +
                                EntropyWithout(posterior, card));
  }
  return p_none * entropy_none + (1 - p_none) * entropy_reveal;
}

Guess MleStrategy::ChooseGuess(const KnowledgeStore& store,
                               const EstimatorResponse& posterior) {
  vector<vector<Card>> candidates;
  for (Category category : kCategories) {
    vector<Card> ranked;
    Card own = CARD_UNSPECIFIED;
    for (Card card : CardsInCategory(category)) {
      if (EnvelopeProbability(posterior, card) > 0) {
        ranked.push_back(card);
      } else if (own == CARD_UNSPECIFIED && IsOwnCard(store, card)) {
        own = card;
      }
    }
    std::stable_sort(ranked.begin(), ranked.end(), [&posterior](Card l, Card r) {
      return EnvelopeProbability(posterior, l) >
             EnvelopeProbability(posterior, r);
    });
    if (ranked.size() > kCandidatesPerCategory) {
      ranked.resize(kCandidatesPerCategory);
    }
    if (own != CARD_UNSPECIFIED) {
      ranked.push_back(own);
    }
    CHECK(!ranked.empty()) << "No envelope candidate for "
                           << Category_Name(category);
    candidates.push_back(ranked);
  }
  Guess best;
  double best_entropy = 0;
  bool found = false;
  for (Card person : candidates[0]) {
    for (Card weapon : candidates[1]) {
      for (Card room : candidates[2]) {
        const Guess guess = NewGuess(person, weapon, room);
        const double entropy = ExpectedEntropy(store, posterior, guess);
        if (!found || entropy < best_entropy - kEpsilon) {
          best = guess;
          best_entropy = entropy;
          found = true;
        }
      }
    }
  }
  VLOG(1) << "MLE guess " << GuessString(best) << ", expected entropy "
          << best_entropy;
  return best;
}

optional<Guess> MleStrategy::ChooseAccusation(
    const KnowledgeStore& store, const EstimatorResponse& posterior) {
  if (store.EnvelopeKnown()) {
    return store.KnownEnvelope();
  }
  const Guess best = MostLikelySolution(posterior);
  for (Card card : GuessCards(best)) {
    if (EnvelopeProbability(posterior, card) <
        accusation_threshold_ - kEpsilon) {
      return std::nullopt;
    }
  }
  // A sampled probability of 1 only means that no sample disagreed.
  if (accusation_threshold_ >= 1 - kEpsilon && !posterior.exact() &&
      !IsOnlySolution(store, best)) {
    VLOG(1) << "Not accusing " << GuessString(best)
            << ", other solutions remain";
    return std::nullopt;
  }
  return best;
}

const vector<string>& StrategyNames() {
  static const vector<string>* kNames =
      new vector<string>({"random", "basic", "good", "record_misses", "mle"});
  return *kNames;
}

absl::StatusOr<unique_ptr<Strategy>> NewStrategy(const string& name,
                                                 uint64_t seed,
                                                 double accusation_threshold) {
  if (name == "random") {
    return unique_ptr<Strategy>(make_unique<RandomStrategy>(seed));
  }
  if (name == "basic") {
    return unique_ptr<Strategy>(make_unique<BasicStrategy>(seed));
  }
  if (name == "good") {
    return unique_ptr<Strategy>(make_unique<GoodStrategy>(seed));
  }
  if (name == "record_misses") {
    return unique_ptr<Strategy>(make_unique<RecordMissesStrategy>(seed));
  }
  if (name == "mle") {
    if (accusation_threshold <= 0 || accusation_threshold > 1) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Accusation threshold must be in (0, 1], got ",
          accusation_threshold));
    }
    return unique_ptr<Strategy>(make_unique<MleStrategy>(accusation_threshold));
  }
  return absl::InvalidArgumentError(absl::StrCat(
      "Unknown strategy \"", name, "\", expected one of: ",
      absl::StrJoin(StrategyNames(), ", ")));
}

}  // namespace clue
