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

#include "chunk/fixed_evaluator.h"

#include <deque>
#include <limits>
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

class FixedEvaluatorTest : public ::testing::Test {
 protected:
  FixedEvaluatorTest()
      : formats_{
            util::Format("1080p", "video/mp4", 1920, 1080, 6000000),
            util::Format("720p", "video/mp4", 1280, 720, 3000000),
            util::Format("480p_high", "video/mp4", 854, 480, 1200000),
            util::Format("480p_low", "video/mp4", 854, 480, 900000),
            util::Format("240p", "video/mp4", 426, 240, 300000),
        } {}

  const util::Format* Select(FixedEvaluator* evaluator,
                             FormatEvaluation* evaluation) {
    evaluator->Evaluate(queue_, base::TimeDelta::FromSeconds(10), formats_,
                        evaluation);
    return evaluation->format_.get();
  }

  const std::vector<util::Format> formats_;
  const std::deque<std::unique_ptr<MediaChunk>> queue_;
};

TEST_F(FixedEvaluatorTest, TestEvaluate) {
  std::deque<std::unique_ptr<MediaChunk>> queue1;
  for (int i = 0; i < 10; i++) {
    queue1.emplace_back(new MediaChunk(MediaChunk::kTriggerInitial,
                                       &formats_[0], i * 2000000,
                                       (i + 1) * 2000000, i));
  }

  FixedEvaluator evaluator(720);
  ScopedFormatEvaluatorEnabler enabler(&evaluator);

  FormatEvaluation evaluation;
  evaluation.queue_size_ = queue1.size();
  for (int i = 0; i < 3; i++) {
    evaluator.Evaluate(queue1, base::TimeDelta::FromSeconds(i * 10), formats_,
                       &evaluation);
    ASSERT_THAT(evaluation.format_, NotNull());
    EXPECT_THAT(*evaluation.format_, Eq(formats_[1]));
    EXPECT_THAT(evaluation.queue_size_, Eq(10));
    EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));
  }
}

TEST_F(FixedEvaluatorTest, LowestQuality) {
  FixedEvaluator evaluator;
  EXPECT_THAT(evaluator.height(), Eq(FixedEvaluator::kLowestQuality));

  FormatEvaluation evaluation;
  const util::Format* selected = Select(&evaluator, &evaluation);
  ASSERT_THAT(selected, NotNull());
  EXPECT_THAT(*selected, Eq(formats_.back()));
}

TEST_F(FixedEvaluatorTest, SharedHeightPicksLowestBitrate) {
  FixedEvaluator evaluator(480);
  FormatEvaluation evaluation;
  const util::Format* selected = Select(&evaluator, &evaluation);
  ASSERT_THAT(selected, NotNull());
  EXPECT_THAT(selected->GetId(), Eq("480p_low"));
}

TEST_F(FixedEvaluatorTest, UnmatchedHeightPicksClosest) {
  FormatEvaluation evaluation;

  FixedEvaluator evaluator_540(540);
  EXPECT_THAT(Select(&evaluator_540, &evaluation)->GetId(), Eq("480p_low"));

  FixedEvaluator evaluator_2160(2160);
  EXPECT_THAT(Select(&evaluator_2160, &evaluation)->GetId(), Eq("1080p"));

  FixedEvaluator evaluator_144(144);
  EXPECT_THAT(Select(&evaluator_144, &evaluation)->GetId(), Eq("240p"));

  // 600 is equally far from 720 and 480; the lower bitrate wins.
  FixedEvaluator evaluator_600(600);
  EXPECT_THAT(Select(&evaluator_600, &evaluation)->GetId(), Eq("480p_low"));
}

TEST_F(FixedEvaluatorTest, ExtremeHeights) {
  const std::vector<util::Format> formats{
      util::Format("1080p", "video/mp4", 1920, 1080, 6000000),
      util::Format("480p", "video/mp4", 854, 480, 900000),
      util::Format("unknown", "video/mp4", -1, -1, 100000),
  };
  FormatEvaluation evaluation;

  FixedEvaluator tallest(std::numeric_limits<int32_t>::max());
  tallest.Evaluate(queue_, base::TimeDelta(), formats, &evaluation);
  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(evaluation.format_->GetId(), Eq("1080p"));

  FixedEvaluator shortest(std::numeric_limits<int32_t>::min());
  shortest.Evaluate(queue_, base::TimeDelta(), formats, &evaluation);
  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(evaluation.format_->GetId(), Eq("unknown"));
}

TEST_F(FixedEvaluatorTest, LeavesTriggerAlone) {
  FixedEvaluator evaluator(1080);
  FormatEvaluation evaluation;
  evaluation.format_.reset(new util::Format(formats_[4]));
  evaluation.trigger_ = MediaChunk::kTriggerManual;

  const util::Format* selected = Select(&evaluator, &evaluation);
  ASSERT_THAT(selected, NotNull());
  EXPECT_THAT(*selected, Eq(formats_[0]));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerManual));
}

}  // namespace chunk
}  // namespace dashabr
