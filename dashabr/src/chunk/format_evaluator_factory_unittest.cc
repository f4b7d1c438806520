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

#include "chunk/format_evaluator_factory.h"

#include <deque>
#include <memory>
#include <vector>

#include "base/time/time.h"
#include "chunk/adaptive_evaluator.h"
#include "chunk/fixed_evaluator.h"
#include "chunk/format_evaluator_listener_mock.h"
#include "chunk/media_chunk.h"
#include "chunk/random_evaluator.h"
#include "chunk/round_robin_evaluator.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "upstream/bandwidth_meter_mock.h"
#include "util/format.h"

namespace dashabr {
namespace chunk {

using ::testing::_;
using ::testing::Eq;
using ::testing::IsNull;
using ::testing::NotNull;
using ::testing::Return;
using ::testing::StrictMock;

namespace {
std::vector<util::Format> MakeFormats() {
  return std::vector<util::Format>{
      util::Format("high", "video/mp4", 1280, 720, 2000000),
      util::Format("mid", "video/mp4", 854, 480, 800000),
      util::Format("low", "video/mp4", 640, 360, 300000),
  };
}
}  // namespace

TEST(FormatEvaluatorFactoryTest, ParseEvaluatorType) {
  EvaluatorType type = EvaluatorType::kAdaptive;
  EXPECT_TRUE(ParseEvaluatorType("fixed", &type));
  EXPECT_THAT(type, Eq(EvaluatorType::kFixed));
  EXPECT_TRUE(ParseEvaluatorType("Random", &type));
  EXPECT_THAT(type, Eq(EvaluatorType::kRandom));
  EXPECT_TRUE(ParseEvaluatorType("ROUNDROBIN", &type));
  EXPECT_THAT(type, Eq(EvaluatorType::kRoundRobin));
  EXPECT_TRUE(ParseEvaluatorType("loop", &type));
  EXPECT_THAT(type, Eq(EvaluatorType::kRoundRobin));
  EXPECT_TRUE(ParseEvaluatorType("adaptive", &type));
  EXPECT_THAT(type, Eq(EvaluatorType::kAdaptive));

  EXPECT_FALSE(ParseEvaluatorType("", &type));
  EXPECT_FALSE(ParseEvaluatorType("bola", &type));
  EXPECT_THAT(type, Eq(EvaluatorType::kAdaptive));
}

TEST(FormatEvaluatorFactoryTest, TypeNamesParseBack) {
  const EvaluatorType types[] = {EvaluatorType::kFixed, EvaluatorType::kRandom,
                                 EvaluatorType::kRoundRobin,
                                 EvaluatorType::kAdaptive};
  for (EvaluatorType type : types) {
    EvaluatorType parsed;
    ASSERT_TRUE(ParseEvaluatorType(EvaluatorTypeToString(type), &parsed));
    EXPECT_THAT(parsed, Eq(type));
  }
}

TEST(FormatEvaluatorFactoryTest, DefaultOptions) {
  FormatEvaluatorOptions options;
  EXPECT_THAT(options.fixed_height, Eq(FixedEvaluator::kLowestQuality));
  EXPECT_FALSE(options.has_random_seed);
  EXPECT_THAT(options.max_initial_bitrate, Eq(800000));
  EXPECT_THAT(options.min_duration_for_quality_increase,
              Eq(base::TimeDelta::FromSeconds(10)));
  EXPECT_THAT(options.max_duration_for_quality_decrease,
              Eq(base::TimeDelta::FromSeconds(25)));
  EXPECT_THAT(options.min_duration_to_retain_after_discard,
              Eq(base::TimeDelta::FromSeconds(25)));
  EXPECT_FLOAT_EQ(0.75f, options.bandwidth_fraction);
}

TEST(FormatEvaluatorFactoryTest, CreatesFixedEvaluator) {
  FormatEvaluatorOptions options;
  options.fixed_height = 480;

  std::unique_ptr<FormatEvaluatorInterface> evaluator =
      CreateFormatEvaluator(EvaluatorType::kFixed, options, nullptr, nullptr);
  ASSERT_THAT(evaluator, NotNull());
  FixedEvaluator* fixed = dynamic_cast<FixedEvaluator*>(evaluator.get());
  ASSERT_THAT(fixed, NotNull());
  EXPECT_THAT(fixed->height(), Eq(480));

  const std::vector<util::Format> formats = MakeFormats();
  const std::deque<std::unique_ptr<MediaChunk>> queue;
  FormatEvaluation evaluation;
  evaluator->Evaluate(queue, base::TimeDelta(), formats, &evaluation);
  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(evaluation.format_->GetId(), Eq("mid"));
}

TEST(FormatEvaluatorFactoryTest, CreatesSeededRandomEvaluators) {
  FormatEvaluatorOptions options;
  options.has_random_seed = true;
  options.random_seed = 42;

  std::unique_ptr<FormatEvaluatorInterface> evaluator1 =
      CreateFormatEvaluator(EvaluatorType::kRandom, options, nullptr, nullptr);
  std::unique_ptr<FormatEvaluatorInterface> evaluator2 =
      CreateFormatEvaluator(EvaluatorType::kRandom, options, nullptr, nullptr);
  ASSERT_THAT(dynamic_cast<RandomEvaluator*>(evaluator1.get()), NotNull());
  ASSERT_THAT(dynamic_cast<RandomEvaluator*>(evaluator2.get()), NotNull());

  const std::vector<util::Format> formats = MakeFormats();
  const std::deque<std::unique_ptr<MediaChunk>> queue;
  FormatEvaluation evaluation1;
  FormatEvaluation evaluation2;
  for (int i = 0; i < 20; i++) {
    evaluator1->Evaluate(queue, base::TimeDelta(), formats, &evaluation1);
    evaluator2->Evaluate(queue, base::TimeDelta(), formats, &evaluation2);
    EXPECT_THAT(*evaluation1.format_, Eq(*evaluation2.format_));
  }
}

TEST(FormatEvaluatorFactoryTest, CreatesRoundRobinEvaluator) {
  FormatEvaluatorOptions options;
  std::unique_ptr<FormatEvaluatorInterface> evaluator = CreateFormatEvaluator(
      EvaluatorType::kRoundRobin, options, nullptr, nullptr);
  EXPECT_THAT(dynamic_cast<RoundRobinEvaluator*>(evaluator.get()), NotNull());
}

TEST(FormatEvaluatorFactoryTest, CreatesAdaptiveEvaluatorWithListener) {
  StrictMock<upstream::MockBandwidthMeter> bandwidth_meter;
  StrictMock<MockFormatEvaluatorListener> listener;

  FormatEvaluatorOptions options;
  options.max_initial_bitrate = 1000000;
  std::unique_ptr<FormatEvaluatorInterface> evaluator = CreateFormatEvaluator(
      EvaluatorType::kAdaptive, options, &bandwidth_meter, &listener);
  ASSERT_THAT(dynamic_cast<AdaptiveEvaluator*>(evaluator.get()), NotNull());

  // Without an estimate, the configured initial bitrate picks the format.
  EXPECT_CALL(bandwidth_meter, GetBitrateEstimate())
      .WillOnce(Return(upstream::BandwidthMeterInterface::kNoEstimate));
  EXPECT_CALL(listener, OnIdealFormatDetermined(_, 1000000));
  EXPECT_CALL(listener,
              OnFormatChanged(IsNull(), _, MediaChunk::kTriggerInitial));

  const std::vector<util::Format> formats = MakeFormats();
  const std::deque<std::unique_ptr<MediaChunk>> queue;
  FormatEvaluation evaluation;
  evaluator->Evaluate(queue, base::TimeDelta(), formats, &evaluation);
  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(evaluation.format_->GetId(), Eq("mid"));
}

}  // namespace chunk
}  // namespace dashabr
