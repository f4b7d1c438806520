/*
 * Copyright 2017 Google Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "chunk/random_evaluator.h"

#include <deque>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "base/time/time.h"
#include "chunk/media_chunk.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace dashabr {
namespace chunk {

using ::testing::Eq;
using ::testing::NotNull;

namespace {
constexpr uint32_t kTestSeed = 12345;
constexpr int kEvaluations = 300;

std::vector<util::Format> MakeFormats() {
  return std::vector<util::Format>{
      util::Format("high", "video/mp4", 1280, 720, 2000000),
      util::Format("mid", "video/mp4", 854, 480, 800000),
      util::Format("low", "video/mp4", 640, 360, 300000),
  };
}
}  // namespace

TEST(RandomEvaluatorTest, SelectsEveryFormat) {
  const std::vector<util::Format> formats = MakeFormats();
  const std::deque<std::unique_ptr<MediaChunk>> queue;

  RandomEvaluator evaluator(kTestSeed);
  ScopedFormatEvaluatorEnabler enabler(&evaluator);

  std::set<std::string> seen;
  FormatEvaluation evaluation;
  for (int i = 0; i < kEvaluations; i++) {
    evaluator.Evaluate(queue, base::TimeDelta(), formats, &evaluation);
    ASSERT_THAT(evaluation.format_, NotNull());
    seen.insert(evaluation.format_->GetId());
  }

  EXPECT_THAT(seen.size(), Eq(formats.size()));
  EXPECT_THAT(evaluation.queue_size_, Eq(0));
}

TEST(RandomEvaluatorTest, SameSeedSameSelections) {
  const std::vector<util::Format> formats = MakeFormats();
  const std::deque<std::unique_ptr<MediaChunk>> queue;

  RandomEvaluator evaluator1(kTestSeed);
  RandomEvaluator evaluator2(kTestSeed);

  FormatEvaluation evaluation1;
  FormatEvaluation evaluation2;
  for (int i = 0; i < kEvaluations; i++) {
    evaluator1.Evaluate(queue, base::TimeDelta(), formats, &evaluation1);
    evaluator2.Evaluate(queue, base::TimeDelta(), formats, &evaluation2);
    EXPECT_THAT(*evaluation1.format_, Eq(*evaluation2.format_));
  }
}

TEST(RandomEvaluatorTest, TriggerIsSticky) {
  const std::vector<util::Format> formats = MakeFormats();
  const std::deque<std::unique_ptr<MediaChunk>> queue;

  RandomEvaluator evaluator(kTestSeed);
  FormatEvaluation evaluation;

  // The first selection keeps the initial trigger.
  evaluator.Evaluate(queue, base::TimeDelta(), formats, &evaluation);
  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));

  int changes = 0;
  for (int i = 0; i < kEvaluations; i++) {
    const util::Format previous(*evaluation.format_);
    evaluation.trigger_ = MediaChunk::kTriggerManual;

    evaluator.Evaluate(queue, base::TimeDelta(), formats, &evaluation);

    if (*evaluation.format_ == previous) {
      EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerManual));
    } else {
      EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));
      changes++;
    }
  }
  EXPECT_GT(changes, 0);
}

TEST(RandomEvaluatorTest, SingleFormat) {
  const std::vector<util::Format> formats{
      util::Format("only", "video/mp4", 640, 360, 300000)};
  const std::deque<std::unique_ptr<MediaChunk>> queue;

  RandomEvaluator evaluator;
  FormatEvaluation evaluation;
  evaluation.trigger_ = MediaChunk::kTriggerCustomBase + 1;
  for (int i = 0; i < 10; i++) {
    evaluator.Evaluate(queue, base::TimeDelta(), formats, &evaluation);
    EXPECT_THAT(*evaluation.format_, Eq(formats[0]));
    EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerCustomBase + 1));
  }
}

}  // namespace chunk
}  // namespace dashabr
