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

#include "src/model_wrapper.h"

#include <algorithm>
#include <fstream>

#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model_utils.h"
#include "src/util.h"

namespace clue {
using operations_research::sat::LinearExpr;
using std::ofstream;

vector<BoolVar> Not(absl::Span<const BoolVar> literals) {
  vector<BoolVar> result;
  for (const auto& v : literals) {
    result.push_back(Not(v));
  }
  return result;
}

namespace {
string ConstraintName(const string& separator,
                      absl::Span<const BoolVar> literals) {
  if (literals.size() == 0) {
    return "0";
  }
  vector<string> names;
  for (const BoolVar& v : literals) {
    names.push_back(v.Name());
  }
  sort(names.begin(), names.end());
  string name = names[0];
  for (int i = 1; i < names.size(); ++i) {
    absl::StrAppend(&name, absl::StrFormat(" %s %s", separator, names[i]));
  }
  return name;
}
}  // namespace

void ModelWrapper::WriteToFile(const path& filename) const {
  WriteProtoToFile(model_.Build(), filename);
}

void ModelWrapper::WriteVariablesToFile(const path& filename) const {
  const auto& model_pb = model_.Build();
  ofstream f;
  f.open(filename);
  CHECK(f.is_open()) << "Failed opening file: " << filename;
  for (int i = 0; i < model_pb.variables_size(); ++i) {
    f << i << ": " << operations_research::sat::VarDebugString(model_pb, i)
      << "\n";
  }
  f.close();
}

BoolVar ModelWrapper::NewVar(const string& name) {
  const auto it = var_cache_.find(name);
  if (it != var_cache_.end()) {
    return it->second;
  }
  BoolVar v = model_.NewBoolVar().WithName(name);
  var_cache_[name] = v;
  return v;
}

void ModelWrapper::FixVariable(const BoolVar& var, bool val) {
  model_.FixVariable(var, val);
}

void ModelWrapper::AddOr(absl::Span<const BoolVar> literals) {
  const string name = ConstraintName("V", literals);
  if (!constraint_cache_.contains(name)) {
    model_.AddBoolOr(literals).WithName(name);
    constraint_cache_.insert(name);
  }
}

void ModelWrapper::AddExactlyOne(absl::Span<const BoolVar> literals) {
  const string name = absl::StrFormat("1 == %s", ConstraintName("+", literals));
  if (!constraint_cache_.contains(name)) {
    model_.AddExactlyOne(literals).WithName(name);
    constraint_cache_.insert(name);
  }
}

void ModelWrapper::AddEqualitySum(absl::Span<const BoolVar> literals, int sum) {
  const string name = absl::StrFormat(
      "%d = %s", sum, ConstraintName("+", literals));
  if (!constraint_cache_.contains(name)) {
    model_.AddEquality(LinearExpr::Sum(literals), sum).WithName(name);
    constraint_cache_.insert(name);
  }
}

void ModelWrapper::AddContradiction(const string& reason) {
  const string name = absl::StrCat("Contradiction: ", reason);
  if (!constraint_cache_.contains(name)) {
    model_.AddBoolOr({model_.FalseVar()}).WithName(name);
    constraint_cache_.insert(name);
  }
}

}  // namespace clue
