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

#ifndef SRC_MODEL_WRAPPER_H_
#define SRC_MODEL_WRAPPER_H_

#include <filesystem>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "ortools/sat/cp_model.h"

namespace clue {

using operations_research::sat::CpModelBuilder;
using operations_research::sat::BoolVar;
using std::filesystem::path;
using std::string;
using std::vector;
using std::unordered_map;
using std::unordered_set;

vector<BoolVar> Not(absl::Span<const BoolVar> literals);

// A convenience wrapper over CpModelBuilder that names every variable and
// constraint, and skips duplicates.
class ModelWrapper {
 public:
  const CpModelBuilder& Model() const { return model_; }
  void WriteToFile(const path& filename) const;
  void WriteVariablesToFile(const path& filename) const;
  BoolVar NewVar(const string& name);
  void FixVariable(const BoolVar& var, bool val);
  void AddOr(absl::Span<const BoolVar> literals);
  void AddExactlyOne(absl::Span<const BoolVar> literals);
  void AddEqualitySum(absl::Span<const BoolVar> literals, int sum);
  void AddContradiction(const string& reason);
  int NumConstraints() const { return constraint_cache_.size(); }

 private:
  CpModelBuilder model_;
  unordered_map<string, BoolVar> var_cache_;  // To prevent duplicate variables
  unordered_set<string> constraint_cache_;    // and constraints.
};

}  // namespace clue

#endif  // SRC_MODEL_WRAPPER_H_
