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

#include "chunk/round_robin_evaluator.h"

#include <deque>
#include <memory>
#include <vector>

#include "base/time/time.h"
#include "chunk/media_chunk.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace dashabr {
namespace chunk {

using ::testing::Eq;
using ::testing::NotNull;

class RoundRobinEvaluatorTest : public ::testing::Test {
 protected:
  RoundRobinEvaluatorTest()
      : formats_{
            util::Format("high", "video/mp4", 1280, 720, 2000000),
            util::Format("mid", "video/mp4", 854, 480, 800000),
            util::Format("low", "video/mp4", 640, 360, 300000),
        } {}

  const util::Format& Next(RoundRobinEvaluator* evaluator,
                           FormatEvaluation* evaluation) {
    evaluator->Evaluate(queue_, base::TimeDelta(), formats_, evaluation);
    return *evaluation->format_;
  }

  const std::vector<util::Format> formats_;
  const std::deque<std::unique_ptr<MediaChunk>> queue_;
};

TEST_F(RoundRobinEvaluatorTest, StepsEveryThirdEvaluation) {
  RoundRobinEvaluator evaluator;
  ScopedFormatEvaluatorEnabler enabler(&evaluator);
  FormatEvaluation evaluation;

  const int expected[] = {2, 2, 2, 1, 1, 1, 0, 0, 0, 2, 2, 2};
  for (int index : expected) {
    EXPECT_THAT(Next(&evaluator, &evaluation), Eq(formats_[index]));
  }
  EXPECT_THAT(evaluation.queue_size_, Eq(0));
}

TEST_F(RoundRobinEvaluatorTest, TriggerChangesOnlyWithFormat) {
  RoundRobinEvaluator evaluator;
  evaluator.Enable();
  FormatEvaluation evaluation;

  Next(&evaluator, &evaluation);
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));
  Next(&evaluator, &evaluation);
  Next(&evaluator, &evaluation);
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));

  // Fourth evaluation moves to the next format.
  EXPECT_THAT(Next(&evaluator, &evaluation), Eq(formats_[1]));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));

  evaluation.trigger_ = MediaChunk::kTriggerManual;
  EXPECT_THAT(Next(&evaluator, &evaluation), Eq(formats_[1]));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerManual));
  evaluator.Disable();
}

TEST_F(RoundRobinEvaluatorTest, InstancesDoNotShareState) {
  RoundRobinEvaluator video_evaluator;
  RoundRobinEvaluator audio_evaluator;
  FormatEvaluation video_evaluation;
  FormatEvaluation audio_evaluation;

  for (int i = 0; i < 3; i++) {
    EXPECT_THAT(Next(&video_evaluator, &video_evaluation), Eq(formats_[2]));
  }
  EXPECT_THAT(Next(&video_evaluator, &video_evaluation), Eq(formats_[1]));

  // The second instance starts its own cycle.
  EXPECT_THAT(Next(&audio_evaluator, &audio_evaluation), Eq(formats_[2]));
  EXPECT_THAT(Next(&video_evaluator, &video_evaluation), Eq(formats_[1]));
}

TEST_F(RoundRobinEvaluatorTest, EnableRestartsCycle) {
  RoundRobinEvaluator evaluator;
  FormatEvaluation evaluation;

  for (int i = 0; i < 4; i++) {
    Next(&evaluator, &evaluation);
  }
  EXPECT_THAT(*evaluation.format_, Eq(formats_[1]));

  evaluator.Disable();
  evaluator.Enable();
  EXPECT_THAT(Next(&evaluator, &evaluation), Eq(formats_[2]));
}

TEST_F(RoundRobinEvaluatorTest, FormatListShrinks) {
  RoundRobinEvaluator evaluator;
  FormatEvaluation evaluation;

  // Advance the cursor past the end of a shorter list.
  for (int i = 0; i < 6; i++) {
    Next(&evaluator, &evaluation);
  }

  const std::vector<util::Format> two_formats{formats_[0], formats_[1]};
  evaluator.Evaluate(queue_, base::TimeDelta(), two_formats, &evaluation);
  ASSERT_THAT(evaluation.format_, NotNull());
  // cursor 2 % 2 == 0 selects the last format.
  EXPECT_THAT(*evaluation.format_, Eq(two_formats[1]));
}

}  // namespace chunk
}  // namespace dashabr
