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

#include "src/util.h"

#include <fstream>

#include "src/simulation.pb.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace clue {
namespace {

path TempFile(const std::string& name) {
  return path(testing::TempDir()) / name;
}

TEST(ParseProtoFromFile, ReadsWrittenProto) {
  SimulationConfig config;
  config.set_num_games(12);
  config.set_num_players(4);
  config.add_strategies("mle");
  const path filename = TempFile("config.pbtxt");
  WriteProtoToFile(config, filename);
  SimulationConfig parsed;
  ASSERT_TRUE(ParseProtoFromFile(filename, &parsed).ok());
  EXPECT_EQ(parsed.DebugString(), config.DebugString());
}

TEST(ParseProtoFromFile, MissingFile) {
  SimulationConfig config;
  EXPECT_EQ(ParseProtoFromFile(TempFile("no_such_file.pbtxt"), &config).code(),
            absl::StatusCode::kNotFound);
}

TEST(ParseProtoFromFile, MalformedFile) {
  const path filename = TempFile("malformed.pbtxt");
  {
    std::ofstream f(filename);
    f << "num_games: \"many\"\n";
  }
  SimulationConfig config;
  EXPECT_EQ(ParseProtoFromFile(filename, &config).code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace clue

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
