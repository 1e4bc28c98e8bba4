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

#ifndef SRC_POSTERIOR_ESTIMATOR_H_
#define SRC_POSTERIOR_ESTIMATOR_H_

#include <cstdint>
#include <random>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/clue.pb.h"
#include "src/deck.h"
#include "src/estimator.pb.h"
#include "src/knowledge_store.h"

namespace clue {

using std::vector;

// Fills in the defaults of all zero-valued request fields.
EstimatorRequest WithDefaults(const EstimatorRequest& request);

// Computes the probability of every card being in the envelope, and
// optionally of every card being held by every player, assuming all card
// distributions consistent with a store are equally likely.
class PosteriorEstimator {
 public:
  explicit PosteriorEstimator(const KnowledgeStore& store);

  // Runs the requested method. Fails with a Contradiction when no card
  // distribution is consistent with the store.
  absl::StatusOr<EstimatorResponse> Estimate(const EstimatorRequest& request);

  // Exact counting over all unknown cards jointly. Fails with
  // ResourceExhausted once more than max_states states are stored (0 for no
  // limit), or when there are too many open set constraints.
  absl::StatusOr<EstimatorResponse> CountExact(const EstimatorRequest& request,
                                               int64_t max_states);
  // Sequential importance sampling.
  absl::StatusOr<EstimatorResponse> Sample(const EstimatorRequest& request);
  // Enumeration of all worlds with the CP-SAT solver.
  absl::StatusOr<EstimatorResponse> Enumerate(const EstimatorRequest& request);

 private:
  struct Constraint {
    int slot;
    vector<int> positions;  // Indices into unknown_.
  };
  // A layer state of the exact counter, see the .cc file.
  struct State;

  bool EnvelopeOpen(int category) const {
    return known_envelope_[category] == CARD_UNSPECIFIED;
  }
  bool IsExcluded(const vector<Card>& envelope) const;
  // Assigns the card at the position to the slot. Returns false when that
  // makes the state infeasible.
  bool Transition(const State& state, int position, int slot,
                  State* next) const;
  bool IsTerminal(const State& state) const;
  State InitialState() const;
  // Draws one completion. Returns false if the draw was rejected.
  bool DrawSample(std::mt19937* rng, vector<int>* assignment,
                  double* weight) const;
  // Probabilities of the known cards, unknown cards left at zero.
  EstimatorResponse NewResponse(const EstimatorRequest& request) const;
  void SetUnknownCardProbabilities(int position, absl::Span<const double> mass,
                                   double total, bool holder_probabilities,
                                   EstimatorResponse* response) const;
  // Spreads the envelope mass uniformly over the possible envelope cards.
  void SetUniformProbabilities(bool holder_probabilities,
                               EstimatorResponse* response) const;

  const KnowledgeStore& store_;
  int num_players_;
  int envelope_slot_;
  vector<Card> unknown_;  // Cards with no known holder, in deck order.
  vector<vector<int>> allowed_;  // x position: slots that may hold the card.
  vector<int> category_of_;  // x position: category index.
  vector<int> last_in_category_;  // x category: last position, or -1.
  // x category: last position that may go to the envelope, or -1.
  vector<int> last_envelope_in_category_;
  vector<int> remaining_;  // x player: hand slots still to fill.
  vector<Card> known_envelope_;  // x category.
  vector<Constraint> constraints_;  // Open constraints.
  // x position x slot: the constraints satisfied by that assignment.
  vector<vector<uint64_t>> constraint_bits_;
  // x position: the constraints whose candidates all precede it.
  vector<uint64_t> required_after_;
  uint64_t all_constraints_ = 0;
  bool track_picks_ = false;  // Whether failed accusations must be checked.
  // Some constraint has no candidates, or the capacities do not add up.
  bool unsatisfiable_ = false;
};

// Runs the estimator once.
absl::StatusOr<EstimatorResponse> Estimate(const KnowledgeStore& store,
                                           const EstimatorRequest& request);

// Helpers over a response.
double EnvelopeProbability(const EstimatorResponse& response, Card card);
double HolderProbability(const EstimatorResponse& response, Card card,
                         int player);
// The most likely envelope card of the category, first in deck order on ties.
Card MostLikelyEnvelopeCard(const EstimatorResponse& response,
                            Category category);
Guess MostLikelySolution(const EstimatorResponse& response);
// Shannon entropy, in bits, of the envelope distribution of one category.
double CategoryEntropy(const EstimatorResponse& response, Category category);
// Posterior mass on the cards of the guess, divided by 3.
double SolutionMass(const EstimatorResponse& response, const Guess& guess);

}  // namespace clue

#endif  // SRC_POSTERIOR_ESTIMATOR_H_
