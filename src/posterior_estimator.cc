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

// Exact counting assigns the unknown cards one at a time, in deck order. A
// layer holds the distinct states reachable after the first k cards, with the
// number of partial assignments reaching each. A state is:
// * the remaining hand capacity of every player (4 bits each);
// * whether the envelope already got a card of the current category;
// * the envelope picks per category, only when failed accusations exist;
// * the mask of set constraints already satisfied.
// A forward pass counts the worlds; a backward pass counts the completions
// of every state, which gives the marginal of every (card, holder) pair.

#include "src/posterior_estimator.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "src/world_solver.h"

namespace clue {
using std::mt19937;
using std::uniform_int_distribution;

namespace {
const int kCapacityBits = 4;
const int kEnvelopeFlagShift = kCapacityBits * kMaxPlayers;
const int kPickShift = kEnvelopeFlagShift + 1;
const int kPickBits = 5;
const int kMaxConstraints = 64;

const int64_t kDefaultMaxExactStates = 1000000;
const int kDefaultMinSamples = 2000;
const int kDefaultMaxSamples = 20000;
const double kDefaultTimeLimitSeconds = 2;
const int64_t kDefaultMaxWorlds = 1000000;
}  // namespace

struct PosteriorEstimator::State {
  uint64_t packed = 0;
  uint64_t mask = 0;

  bool operator==(const State& other) const {
    return packed == other.packed && mask == other.mask;
  }
  template <typename H>
  friend H AbslHashValue(H h, const State& s) {
    return H::combine(std::move(h), s.packed, s.mask);
  }
};

EstimatorRequest WithDefaults(const EstimatorRequest& request) {
  EstimatorRequest r = request;
  if (r.max_exact_states() <= 0) {
    r.set_max_exact_states(kDefaultMaxExactStates);
  }
  if (r.min_samples() <= 0) {
    r.set_min_samples(kDefaultMinSamples);
  }
  if (r.max_samples() <= 0) {
    r.set_max_samples(kDefaultMaxSamples);
  }
  r.set_max_samples(std::max(r.max_samples(), r.min_samples()));
  if (r.time_limit_seconds() <= 0) {
    r.set_time_limit_seconds(kDefaultTimeLimitSeconds);
  }
  if (r.max_worlds() <= 0) {
    r.set_max_worlds(kDefaultMaxWorlds);
  }
  return r;
}

PosteriorEstimator::PosteriorEstimator(const KnowledgeStore& store)
    : store_(store), num_players_(store.NumPlayers()),
      envelope_slot_(store.NumPlayers()),
      last_in_category_(kNumCategories, -1),
      last_envelope_in_category_(kNumCategories, -1) {
  if (!store_.status().ok()) {
    return;
  }
  int to_fill = 0;
  for (int i = 0; i < num_players_; ++i) {
    remaining_.push_back(store_.RemainingCapacity(i));
    to_fill += remaining_.back();
  }
  for (Category category : kCategories) {
    known_envelope_.push_back(store_.EnvelopeCard(category));
    if (known_envelope_.back() == CARD_UNSPECIFIED) {
      ++to_fill;
    }
  }
  vector<int> position_of(kNumCards, -1);
  for (Card card : BuildDeck()) {
    if (store_.HolderOf(card) != kNoPlayer) {
      continue;
    }
    const int category = CategoryIndex(CardCategory(card));
    const int position = unknown_.size();
    vector<int> slots;
    for (int i = 0; i < num_players_; ++i) {
      if (store_.CanHold(card, i)) {
        slots.push_back(i);
      }
    }
    if (EnvelopeOpen(category) && store_.CanHold(card, kEnvelope)) {
      slots.push_back(envelope_slot_);
      last_envelope_in_category_[category] = position;
    }
    if (slots.empty()) {
      unsatisfiable_ = true;
    }
    position_of[CardIndex(card)] = position;
    last_in_category_[category] = position;
    unknown_.push_back(card);
    allowed_.push_back(slots);
    category_of_.push_back(category);
  }
  if (to_fill != unknown_.size()) {
    unsatisfiable_ = true;
  }
  for (int c = 0; c < kNumCategories; ++c) {
    if (EnvelopeOpen(c) && last_envelope_in_category_[c] == -1) {
      unsatisfiable_ = true;
    }
  }
  for (const auto& set_constraint : store_.SetConstraints()) {
    Constraint constraint{.slot = set_constraint.holder == kEnvelope ?
                              envelope_slot_ : set_constraint.holder};
    bool satisfied = false;
    for (Card card : set_constraint.cards) {
      if (store_.IsPositive(card, set_constraint.holder)) {
        satisfied = true;
        break;
      }
      const int position = position_of[CardIndex(card)];
      if (position != -1 &&
          std::count(allowed_[position].begin(), allowed_[position].end(),
                     constraint.slot) > 0) {
        constraint.positions.push_back(position);
      }
    }
    if (satisfied) {
      continue;
    }
    if (constraint.positions.empty()) {
      unsatisfiable_ = true;
    }
    constraints_.push_back(constraint);
  }
  track_picks_ = !store_.ExcludedSolutions().empty();
  if (constraints_.size() > kMaxConstraints) {
    return;  // Only sampling is supported.
  }
  constraint_bits_.assign(unknown_.size(),
                          vector<uint64_t>(num_players_ + 1, 0));
  required_after_.assign(unknown_.size(), 0);
  for (int j = 0; j < constraints_.size(); ++j) {
    const uint64_t bit = uint64_t{1} << j;
    all_constraints_ |= bit;
    int last = 0;
    for (int position : constraints_[j].positions) {
      constraint_bits_[position][constraints_[j].slot] |= bit;
      last = std::max(last, position);
    }
    for (int position = last; position < unknown_.size(); ++position) {
      required_after_[position] |= bit;
    }
  }
}

bool PosteriorEstimator::IsExcluded(const vector<Card>& envelope) const {
  for (const Guess& guess : store_.ExcludedSolutions()) {
    if (GuessCards(guess) == envelope) {
      return true;
    }
  }
  return false;
}

PosteriorEstimator::State PosteriorEstimator::InitialState() const {
  State state;
  for (int i = 0; i < num_players_; ++i) {
    state.packed |= uint64_t(remaining_[i]) << (kCapacityBits * i);
  }
  return state;
}

bool PosteriorEstimator::Transition(const State& state, int position, int slot,
                                    State* next) const {
  State n = state;
  const int category = category_of_[position];
  if (slot == envelope_slot_) {
    const uint64_t flag = uint64_t{1} << kEnvelopeFlagShift;
    if (n.packed & flag) {
      return false;
    }
    n.packed |= flag;
    if (track_picks_) {
      n.packed |= uint64_t(unknown_[position])
                  << (kPickShift + kPickBits * category);
    }
  } else {
    const int shift = kCapacityBits * slot;
    if (((n.packed >> shift) & ((1 << kCapacityBits) - 1)) == 0) {
      return false;
    }
    n.packed -= uint64_t{1} << shift;
  }
  n.mask |= constraint_bits_[position][slot];
  if (position == last_in_category_[category] && EnvelopeOpen(category)) {
    const uint64_t flag = uint64_t{1} << kEnvelopeFlagShift;
    if (!(n.packed & flag)) {
      return false;  // The category has no envelope card.
    }
    n.packed &= ~flag;
  }
  const uint64_t required = required_after_[position];
  if ((n.mask & required) != required) {
    return false;
  }
  if (position + 1 == unknown_.size() && !IsTerminal(n)) {
    return false;
  }
  *next = n;
  return true;
}

bool PosteriorEstimator::IsTerminal(const State& state) const {
  const uint64_t capacities = (uint64_t{1} << kEnvelopeFlagShift) - 1;
  if ((state.packed & capacities) != 0 ||
      state.mask != all_constraints_) {
    return false;
  }
  if (!track_picks_) {
    return true;
  }
  vector<Card> envelope;
  for (int c = 0; c < kNumCategories; ++c) {
    envelope.push_back(EnvelopeOpen(c) ?
        Card((state.packed >> (kPickShift + kPickBits * c)) &
             ((1 << kPickBits) - 1)) :
        known_envelope_[c]);
  }
  return !IsExcluded(envelope);
}

EstimatorResponse PosteriorEstimator::NewResponse(
    const EstimatorRequest& request) const {
  EstimatorResponse response;
  response.set_method(request.method());
  for (Card card : BuildDeck()) {
    auto* cp = response.add_cards();
    cp->set_card(card);
    const int holder = store_.HolderOf(card);
    cp->set_envelope(holder == kEnvelope ? 1 : 0);
    if (request.holder_probabilities()) {
      for (int i = 0; i < num_players_; ++i) {
        cp->add_players(holder == i ? 1 : 0);
      }
    }
  }
  return response;
}

void PosteriorEstimator::SetUnknownCardProbabilities(
    int position, absl::Span<const double> mass, double total,
    bool holder_probabilities, EstimatorResponse* response) const {
  auto* cp = response->mutable_cards(CardIndex(unknown_[position]));
  cp->set_envelope(mass[envelope_slot_] / total);
  if (holder_probabilities) {
    for (int i = 0; i < num_players_; ++i) {
      cp->set_players(i, mass[i] / total);
    }
  }
}

void PosteriorEstimator::SetUniformProbabilities(
    bool holder_probabilities, EstimatorResponse* response) const {
  for (int c = 0; c < kNumCategories; ++c) {
    if (!EnvelopeOpen(c)) {
      continue;
    }
    vector<int> candidates;
    for (int position = 0; position < unknown_.size(); ++position) {
      const auto& slots = allowed_[position];
      if (category_of_[position] == c &&
          std::count(slots.begin(), slots.end(), envelope_slot_) > 0) {
        candidates.push_back(position);
      }
    }
    for (int position : candidates) {
      response->mutable_cards(CardIndex(unknown_[position]))
          ->set_envelope(1.0 / candidates.size());
    }
  }
  if (!holder_probabilities) {
    return;
  }
  for (int position = 0; position < unknown_.size(); ++position) {
    auto* cp = response->mutable_cards(CardIndex(unknown_[position]));
    int players = 0;
    for (int slot : allowed_[position]) {
      players += slot != envelope_slot_;
    }
    for (int slot : allowed_[position]) {
      if (slot != envelope_slot_) {
        cp->set_players(slot, (1 - cp->envelope()) / players);
      }
    }
  }
}

absl::StatusOr<EstimatorResponse> PosteriorEstimator::CountExact(
    const EstimatorRequest& request, int64_t max_states) {
  RETURN_IF_ERROR(store_.status());
  if (constraints_.size() > kMaxConstraints) {
    return absl::ResourceExhaustedError(absl::StrCat(
        "Too many open set constraints for exact counting: ",
        constraints_.size()));
  }
  if (unsatisfiable_) {
    return ContradictionError("The known facts leave no possible deal");
  }
  EstimatorRequest r = request;
  r.set_method(EstimatorRequest::EXACT_COUNT);
  EstimatorResponse response = NewResponse(r);
  const int num_unknown = unknown_.size();
  vector<absl::flat_hash_map<State, double>> forward(num_unknown + 1);
  const State initial = InitialState();
  if (num_unknown == 0 && !IsTerminal(initial)) {
    return ContradictionError("The known facts leave no possible deal");
  }
  forward[0][initial] = 1;
  int64_t num_states = 1;
  for (int position = 0; position < num_unknown; ++position) {
    auto& layer = forward[position + 1];
    for (const auto& [state, count] : forward[position]) {
      for (int slot : allowed_[position]) {
        State next;
        if (Transition(state, position, slot, &next)) {
          layer[next] += count;
        }
      }
    }
    num_states += layer.size();
    if (max_states > 0 && num_states > max_states) {
      return absl::ResourceExhaustedError(absl::StrCat(
          "Exact counting exceeded ", max_states, " states at card ",
          position + 1, " of ", num_unknown));
    }
  }
  double total = 0;
  for (const auto& [state, count] : forward[num_unknown]) {
    total += count;
  }
  if (total == 0) {
    return ContradictionError("The known facts leave no possible deal");
  }
  // Backward pass: completions of every state, and the marginals.
  absl::flat_hash_map<State, double> completions;
  for (const auto& [state, count] : forward[num_unknown]) {
    completions[state] = 1;
  }
  vector<double> mass(num_players_ + 1);
  for (int position = num_unknown - 1; position >= 0; --position) {
    absl::flat_hash_map<State, double> previous;
    std::fill(mass.begin(), mass.end(), 0);
    for (const auto& [state, count] : forward[position]) {
      double state_completions = 0;
      for (int slot : allowed_[position]) {
        State next;
        if (!Transition(state, position, slot, &next)) {
          continue;
        }
        const auto it = completions.find(next);
        if (it == completions.end()) {
          continue;
        }
        state_completions += it->second;
        mass[slot] += count * it->second;
      }
      if (state_completions > 0) {
        previous[state] = state_completions;
      }
    }
    SetUnknownCardProbabilities(position, mass, total,
                                r.holder_probabilities(), &response);
    completions = std::move(previous);
  }
  VLOG(1) << "Counted " << total << " worlds over " << num_states
          << " states";
  response.set_exact(true);
  response.set_num_worlds(total);
  response.set_num_states(num_states);
  return response;
}

bool PosteriorEstimator::DrawSample(mt19937* rng, vector<int>* assignment,
                                    double* weight) const {
  vector<int> capacity = remaining_;
  vector<bool> filled(kNumCategories);
  vector<Card> envelope = known_envelope_;
  for (int c = 0; c < kNumCategories; ++c) {
    filled[c] = !EnvelopeOpen(c);
  }
  *weight = 1;
  vector<int> options;
  for (int position = 0; position < unknown_.size(); ++position) {
    const int category = category_of_[position];
    options.clear();
    for (int slot : allowed_[position]) {
      if (slot == envelope_slot_ ? !filled[category] : capacity[slot] > 0) {
        options.push_back(slot);
      }
    }
    if (!filled[category] &&
        position == last_envelope_in_category_[category]) {
      // The last chance to fill the envelope in this category.
      options.assign({envelope_slot_});
    }
    if (options.empty()) {
      return false;
    }
    uniform_int_distribution<int> dist(0, options.size() - 1);
    const int slot = options[dist(*rng)];
    *weight *= options.size();
    (*assignment)[position] = slot;
    if (slot == envelope_slot_) {
      filled[category] = true;
      envelope[category] = unknown_[position];
    } else {
      --capacity[slot];
    }
  }
  for (const auto& constraint : constraints_) {
    bool satisfied = false;
    for (int position : constraint.positions) {
      if ((*assignment)[position] == constraint.slot) {
        satisfied = true;
        break;
      }
    }
    if (!satisfied) {
      return false;
    }
  }
  return !IsExcluded(envelope);
}

absl::StatusOr<EstimatorResponse> PosteriorEstimator::Sample(
    const EstimatorRequest& request) {
  RETURN_IF_ERROR(store_.status());
  if (unsatisfiable_) {
    return ContradictionError("The known facts leave no possible deal");
  }
  const EstimatorRequest r = WithDefaults(request);
  EstimatorResponse response = NewResponse(r);
  response.set_method(EstimatorRequest::MONTE_CARLO);
  const int num_unknown = unknown_.size();
  mt19937 rng(r.seed());
  const absl::Time deadline = absl::Now() +
                              absl::Seconds(r.time_limit_seconds());
  vector<vector<double>> mass(num_unknown, vector<double>(num_players_ + 1));
  vector<int> assignment(num_unknown);
  double total_weight = 0;
  int64_t attempts = 0, accepted = 0;
  bool timed_out = false;
  for (; attempts < r.max_samples(); ++attempts) {
    if (attempts % 64 == 0 && absl::Now() > deadline) {
      timed_out = attempts < r.min_samples();
      break;
    }
    double weight;
    if (!DrawSample(&rng, &assignment, &weight)) {
      continue;
    }
    ++accepted;
    total_weight += weight;
    for (int position = 0; position < num_unknown; ++position) {
      mass[position][assignment[position]] += weight;
    }
  }
  if (timed_out) {
    LOG(WARNING) << "Sampling hit the time limit of "
                 << r.time_limit_seconds() << "s after " << attempts
                 << " samples";
  }
  response.set_timed_out(timed_out);
  response.set_exact(false);
  response.set_num_samples(accepted);
  if (accepted == 0) {
    LOG(WARNING) << "No valid sample in " << attempts
                 << " draws, using a uniform envelope distribution";
    SetUniformProbabilities(r.holder_probabilities(), &response);
    return response;
  }
  for (int position = 0; position < num_unknown; ++position) {
    SetUnknownCardProbabilities(position, mass[position], total_weight,
                                r.holder_probabilities(), &response);
  }
  response.set_num_worlds(total_weight / attempts);
  VLOG(1) << "Accepted " << accepted << " of " << attempts << " samples";
  return response;
}

absl::StatusOr<EstimatorResponse> PosteriorEstimator::Enumerate(
    const EstimatorRequest& request) {
  RETURN_IF_ERROR(store_.status());
  const EstimatorRequest r = WithDefaults(request);
  EstimatorResponse response = NewResponse(r);
  response.set_method(EstimatorRequest::SAT_ENUMERATION);
  SolverRequest solver_request;
  solver_request.set_max_worlds(r.max_worlds());
  solver_request.set_time_limit_seconds(r.time_limit_seconds());
  const SolverResponse solution = Solve(store_, solver_request);
  response.set_exact(solution.complete());
  response.set_timed_out(!solution.complete());
  if (!solution.complete()) {
    LOG(WARNING) << "World enumeration stopped after "
                 << solution.num_worlds() << " worlds";
  }
  if (solution.num_worlds() == 0) {
    if (solution.complete()) {
      return ContradictionError("The known facts leave no possible deal");
    }
    SetUniformProbabilities(r.holder_probabilities(), &response);
    return response;
  }
  const double total = solution.num_worlds();
  for (int position = 0; position < unknown_.size(); ++position) {
    const int c = CardIndex(unknown_[position]);
    vector<double> mass(num_players_ + 1);
    for (int i = 0; i < num_players_; ++i) {
      mass[i] = solution.player_counts(c * num_players_ + i);
    }
    mass[envelope_slot_] = solution.envelope_counts(c);
    SetUnknownCardProbabilities(position, mass, total,
                                r.holder_probabilities(), &response);
  }
  response.set_num_worlds(total);
  return response;
}

absl::StatusOr<EstimatorResponse> PosteriorEstimator::Estimate(
    const EstimatorRequest& request) {
  RETURN_IF_ERROR(store_.status());
  const EstimatorRequest r = WithDefaults(request);
  switch (r.method()) {
    case EstimatorRequest::EXACT_COUNT:
      return CountExact(r, 0);
    case EstimatorRequest::MONTE_CARLO:
      return Sample(r);
    case EstimatorRequest::SAT_ENUMERATION:
      return Enumerate(r);
    default:
      break;
  }
  absl::StatusOr<EstimatorResponse> exact = CountExact(r, r.max_exact_states());
  if (!absl::IsResourceExhausted(exact.status())) {
    return exact;
  }
  VLOG(1) << "Falling back to sampling: " << exact.status();
  return Sample(r);
}

absl::StatusOr<EstimatorResponse> Estimate(const KnowledgeStore& store,
                                           const EstimatorRequest& request) {
  return PosteriorEstimator(store).Estimate(request);
}

double EnvelopeProbability(const EstimatorResponse& response, Card card) {
  CHECK_EQ(response.cards_size(), kNumCards);
  return response.cards(CardIndex(card)).envelope();
}

double HolderProbability(const EstimatorResponse& response, Card card,
                         int player) {
  if (player == kEnvelope) {
    return EnvelopeProbability(response, card);
  }
  const auto& cp = response.cards(CardIndex(card));
  CHECK_LT(player, cp.players_size()) << "No holder probabilities";
  return cp.players(player);
}

Card MostLikelyEnvelopeCard(const EstimatorResponse& response,
                            Category category) {
  Card best = CARD_UNSPECIFIED;
  double best_p = -1;
  for (Card card : CardsInCategory(category)) {
    const double p = EnvelopeProbability(response, card);
    if (p > best_p) {
      best = card;
      best_p = p;
    }
  }
  return best;
}

Guess MostLikelySolution(const EstimatorResponse& response) {
  return NewGuess(MostLikelyEnvelopeCard(response, PERSON),
                  MostLikelyEnvelopeCard(response, WEAPON),
                  MostLikelyEnvelopeCard(response, ROOM));
}

double CategoryEntropy(const EstimatorResponse& response, Category category) {
  double entropy = 0;
  for (Card card : CardsInCategory(category)) {
    const double p = EnvelopeProbability(response, card);
    if (p > 0) {
      entropy -= p * std::log2(p);
    }
  }
  return entropy;
}

double SolutionMass(const EstimatorResponse& response, const Guess& guess) {
  double mass = 0;
  for (Card card : GuessCards(guess)) {
    mass += EnvelopeProbability(response, card);
  }
  return mass / kNumCategories;
}

}  // namespace clue
