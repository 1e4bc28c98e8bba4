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

#ifndef SRC_STRATEGY_H_
#define SRC_STRATEGY_H_

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/clue.pb.h"
#include "src/deck.h"
#include "src/estimator.pb.h"
#include "src/knowledge_store.h"

namespace clue {

using std::mt19937;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;

// Decides the guesses and accusations of one player. Strategies only see
// the player's own store and the posterior computed from it.
class Strategy {
 public:
  virtual ~Strategy() = default;
  virtual string Name() const = 0;
  // Whether ChooseGuess and ChooseAccusation read the posterior. Otherwise
  // they may be passed an empty response.
  virtual bool NeedsPosterior() const { return false; }
  virtual Guess ChooseGuess(const KnowledgeStore& store,
                            const EstimatorResponse& posterior) = 0;
  // An accusation to make at the end of the turn, if any.
  virtual optional<Guess> ChooseAccusation(
      const KnowledgeStore& store, const EstimatorResponse& posterior) = 0;
};

// Heuristic strategies accuse once their store pins the whole envelope.
class HeuristicStrategy : public Strategy {
 public:
  explicit HeuristicStrategy(uint64_t seed) : rng_(seed) {}
  optional<Guess> ChooseAccusation(
      const KnowledgeStore& store, const EstimatorResponse& posterior) override;

 protected:
  Card PickUniformly(absl::Span<const Card> cards);
  mt19937 rng_;
};

// A random guess that avoids the player's own cards.
class RandomStrategy : public HeuristicStrategy {
 public:
  using HeuristicStrategy::HeuristicStrategy;
  string Name() const override { return "random"; }
  Guess ChooseGuess(const KnowledgeStore& store,
                    const EstimatorResponse& posterior) override;
};

// A random guess among the cards not known to be held by any player.
class BasicStrategy : public HeuristicStrategy {
 public:
  using HeuristicStrategy::HeuristicStrategy;
  string Name() const override { return "basic"; }
  Guess ChooseGuess(const KnowledgeStore& store,
                    const EstimatorResponse& posterior) override;
};

// Solves the person, then the weapon, then the room. The open category gets
// a card of unknown location; every other category is padded with a card
// nobody else can show (an own card or a known envelope card) when there is
// one, so that a reveal lands on the open category.
class GoodStrategy : public HeuristicStrategy {
 public:
  using HeuristicStrategy::HeuristicStrategy;
  string Name() const override { return "good"; }
  Guess ChooseGuess(const KnowledgeStore& store,
                    const EstimatorResponse& posterior) override;
};

// Guesses the card most likely to be in the envelope in every category,
// scoring a card by the players that may still hold it: with k candidate
// players it is in the envelope with probability 1 / (k + 1), unless the
// store rules the envelope out. Ties go to the first card in deck order.
class RecordMissesStrategy : public HeuristicStrategy {
 public:
  using HeuristicStrategy::HeuristicStrategy;
  string Name() const override { return "record_misses"; }
  Guess ChooseGuess(const KnowledgeStore& store,
                    const EstimatorResponse& posterior) override;

  static double EnvelopeLikelihood(const KnowledgeStore& store, Card card);
};

// Picks the guess minimizing the expected envelope entropy after the
// response, among the most likely cards of each category, and accuses once
// every category's most likely card reaches the threshold. At a threshold of
// 1, a sampled posterior is checked with IsOnlySolution first.
class MleStrategy : public Strategy {
 public:
  explicit MleStrategy(double accusation_threshold)
      : accusation_threshold_(accusation_threshold) {}
  string Name() const override { return "mle"; }
  bool NeedsPosterior() const override { return true; }
  Guess ChooseGuess(const KnowledgeStore& store,
                    const EstimatorResponse& posterior) override;
  optional<Guess> ChooseAccusation(
      const KnowledgeStore& store, const EstimatorResponse& posterior) override;

  // The expected total envelope entropy once the guess is answered. Treats
  // the categories as independent, and a reveal as equally likely to show
  // any guessed card outside the envelope.
  static double ExpectedEntropy(const KnowledgeStore& store,
                                const EstimatorResponse& posterior,
                                const Guess& guess);

 private:
  // Number of most likely cards per category considered for a guess.
  static const int kCandidatesPerCategory = 3;
  double accusation_threshold_;
};

// Whether the store rules out every envelope but the solution.
bool IsOnlySolution(const KnowledgeStore& store, const Guess& solution);

// The cards of the player that the store knows of.
vector<Card> KnownHand(const KnowledgeStore& store, int player);

// Creates a strategy by name: "random", "basic", "good", "record_misses" or
// "mle".
absl::StatusOr<unique_ptr<Strategy>> NewStrategy(const string& name,
                                                 uint64_t seed,
                                                 double accusation_threshold);
const vector<string>& StrategyNames();

}  // namespace clue

#endif  // SRC_STRATEGY_H_
