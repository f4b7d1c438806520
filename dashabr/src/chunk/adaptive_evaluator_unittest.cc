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

#include "chunk/adaptive_evaluator.h"

#include <algorithm>
#include <deque>
#include <memory>
#include <vector>

#include "base/logging.h"
#include "base/time/time.h"
#include "chunk/format_evaluator_listener.h"
#include "chunk/format_evaluator_listener_mock.h"
#include "chunk/media_chunk.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "upstream/bandwidth_meter.h"
#include "upstream/bandwidth_meter_mock.h"

namespace dashabr {
namespace chunk {

using ::testing::Eq;
using ::testing::IsNull;
using ::testing::NotNull;
using ::testing::Ge;
using ::testing::InSequence;
using ::testing::Mock;
using ::testing::Pointee;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::_;

typedef std::deque<std::unique_ptr<MediaChunk>> ChunkQueue;
typedef FormatEvaluatorListenerInterface::DeferReason DeferReason;

class AdaptiveEvaluatorTest : public ::testing::Test {
 protected:
  AdaptiveEvaluatorTest()
      : formats_{
            util::Format("hd_high", "video/mp4", 1920, 1080, 6000000),
            util::Format("hd_low", "video/mp4", 1280, 720, 3000000),
            util::Format("sd_high", "video/mp4", 960, 540, 1500000),
            util::Format("sd_mid", "video/mp4", 854, 480, 900000),
            util::Format("sd_low", "video/mp4", 640, 360, 600000),
            util::Format("sd_min", "video/mp4", 426, 240, 300000),
        },
        hd_high_(formats_[0]),
        hd_low_(formats_[1]),
        sd_mid_(formats_[3]),
        sd_low_(formats_[4]) {}
  ~AdaptiveEvaluatorTest() override {}

  void VerifyAndClearMocks() { Mock::VerifyAndClearExpectations(&meter_); }

  static const util::Format* DetermineIdealFormat(
      const std::vector<util::Format>& formats,
      int64_t effective_bitrate) {
    return AdaptiveEvaluator::DetermineIdealFormat(formats, effective_bitrate);
  }

  static int64_t EffectiveBitrate(const AdaptiveEvaluator* evaluator,
                                  int64_t bitrate_estimate) {
    return evaluator->EffectiveBitrate(bitrate_estimate);
  }

  // The raw estimate that kExampleBandwidthFraction turns into |bitrate|.
  // Exact for multiples of 3.
  static int64_t EstimateFor(int64_t bitrate) { return bitrate * 4 / 3; }

  std::unique_ptr<AdaptiveEvaluator> MakeEvaluator() {
    return std::unique_ptr<AdaptiveEvaluator>(new AdaptiveEvaluator(
        &meter_, kExampleInitialBitrate, kExampleMinDurationIncrease,
        kExampleMaxDurationDecrease, kExampleMinDurationRetain,
        kExampleBandwidthFraction));
  }

  // Appends |count| chunks of |chunk_duration| in |format| to |queue|,
  // continuing from the end of the last chunk (or from |first_start| if the
  // queue is empty).
  static void AppendChunks(ChunkQueue* queue,
                           const util::Format& format,
                           int count,
                           base::TimeDelta first_start,
                           base::TimeDelta chunk_duration) {
    base::TimeDelta start =
        queue->empty()
            ? first_start
            : base::TimeDelta::FromMicroseconds(queue->back()->end_time_us());
    for (int i = 0; i < count; i++) {
      base::TimeDelta end = start + chunk_duration;
      int32_t index = queue->empty() ? kFirstChunkIndex
                                     : queue->back()->GetNextChunkIndex();
      queue->emplace_back(new MediaChunk(MediaChunk::kTriggerAdaptive, &format,
                                         start.InMicroseconds(),
                                         end.InMicroseconds(), index));
      VLOG(2) << "Chunk " << index << ": [" << start << ", " << end << "]";
      start = end;
    }
  }

  static void SetCurrent(FormatEvaluation* evaluation,
                         const util::Format& format,
                         int32_t queue_size) {
    evaluation->format_.reset(new util::Format(format));
    evaluation->trigger_ = MediaChunk::kTriggerInitial;
    evaluation->queue_size_ = queue_size;
  }

  static constexpr int32_t kFirstChunkIndex = 42;

  const int32_t kExampleInitialBitrate = 8000000;
  const base::TimeDelta kExampleMinDurationIncrease =
      base::TimeDelta::FromSeconds(10);
  const base::TimeDelta kExampleMaxDurationDecrease =
      base::TimeDelta::FromSeconds(25);
  const base::TimeDelta kExampleMinDurationRetain =
      base::TimeDelta::FromSeconds(25);
  const float kExampleBandwidthFraction = 0.75f;

  const base::TimeDelta kStartPlaybackTime = base::TimeDelta::FromSeconds(1);
  const base::TimeDelta kFirstChunkStartTime = base::TimeDelta::FromSeconds(3);
  const base::TimeDelta kChunkDuration = base::TimeDelta::FromSeconds(2);

  const std::vector<util::Format> formats_;
  const util::Format& hd_high_;
  const util::Format& hd_low_;
  const util::Format& sd_mid_;
  const util::Format& sd_low_;

  StrictMock<upstream::MockBandwidthMeter> meter_;
};

constexpr int32_t AdaptiveEvaluatorTest::kFirstChunkIndex;

TEST_F(AdaptiveEvaluatorTest, EffectiveBitrate) {
  struct {
    float fraction;
    int64_t estimate;
    int64_t expected;
  } const kCases[] = {
      {1.0f, 0, 0},
      {1.0f, 1234567, 1234567},
      {1.0f, 1500000000, 1500000000},
      {0.75f, 1000000, 750000},
      {0.75f, 4000000, 3000000},
      {0.75f, 1000001, 750000},
      {0.75f, 1000003, 750002},
      {0.75f, 1, 0},
      {0.5f, 3, 1},
      {0.5f, 999999999, 499999999},
      {0.25f, 800000, 200000},
      {0.25f, 800003, 200000},
  };

  for (const auto& test_case : kCases) {
    AdaptiveEvaluator evaluator(
        &meter_, kExampleInitialBitrate, kExampleMinDurationIncrease,
        kExampleMaxDurationDecrease, kExampleMinDurationRetain,
        test_case.fraction);
    EXPECT_THAT(EffectiveBitrate(&evaluator, test_case.estimate),
                Eq(test_case.expected))
        << "fraction " << test_case.fraction << ", estimate "
        << test_case.estimate;
    // Without an estimate the fraction does not apply.
    EXPECT_THAT(
        EffectiveBitrate(&evaluator,
                         upstream::BandwidthMeterInterface::kNoEstimate),
        Eq(kExampleInitialBitrate));
  }

  // The scaled estimate is the floor of the exact product, never above it.
  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  for (int64_t estimate = 0; estimate < 1500000000; estimate += 7654321) {
    EXPECT_THAT(EffectiveBitrate(evaluator.get(), estimate),
                Eq(estimate * 3 / 4))
        << "estimate " << estimate;
  }
}

TEST_F(AdaptiveEvaluatorTest, FractionalBandwidthDoesNotAffordFormat) {
  const std::vector<util::Format> formats{
      util::Format("A", "video/mp4", 854, 480, 750001),
      util::Format("B", "video/mp4", 640, 360, 750000),
      util::Format("C", "video/mp4", 426, 240, 300000),
  };
  const ChunkQueue empty_queue;

  // 1000001 * 0.75 is 750000.75, which does not cover A.
  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  EXPECT_CALL(meter_, GetBitrateEstimate()).WillRepeatedly(Return(1000001));

  FormatEvaluation evaluation;
  evaluator->Evaluate(empty_queue, base::TimeDelta(), formats, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(formats[1]));

  VerifyAndClearMocks();

  // 1000002 * 0.75 is exactly 750001.
  EXPECT_CALL(meter_, GetBitrateEstimate()).WillRepeatedly(Return(1000002));
  FormatEvaluation next;
  evaluator->Evaluate(empty_queue, base::TimeDelta(), formats, &next);

  ASSERT_THAT(next.format_, NotNull());
  EXPECT_THAT(*next.format_, Eq(formats[0]));
}

TEST_F(AdaptiveEvaluatorTest, DetermineIdealFormat) {
  const std::vector<util::Format> formats{
      util::Format("1", "video/x-any", -1, -1, 5000),
      util::Format("2", "video/x-any", -1, -1, 400),
      util::Format("3", "video/x-any", -1, -1, 30),
      util::Format("4", "video/x-any", -1, -1, 29),
      util::Format("5", "video/x-any", -1, -1, 28),
      util::Format("6", "video/x-any", -1, -1, 5),
  };

  ASSERT_THAT(std::is_sorted(formats.begin(), formats.end(),
                             util::Format::DecreasingBandwidthComparator()),
              Eq(true));

  EXPECT_THAT(DetermineIdealFormat(formats, 10000), Eq(&formats[0]));
  EXPECT_THAT(DetermineIdealFormat(formats, 5001), Eq(&formats[0]));
  EXPECT_THAT(DetermineIdealFormat(formats, 5000), Eq(&formats[0]));
  EXPECT_THAT(DetermineIdealFormat(formats, 4999), Eq(&formats[1]));
  EXPECT_THAT(DetermineIdealFormat(formats, 2000), Eq(&formats[1]));
  EXPECT_THAT(DetermineIdealFormat(formats, 401), Eq(&formats[1]));
  EXPECT_THAT(DetermineIdealFormat(formats, 400), Eq(&formats[1]));
  EXPECT_THAT(DetermineIdealFormat(formats, 399), Eq(&formats[2]));
  EXPECT_THAT(DetermineIdealFormat(formats, 31), Eq(&formats[2]));
  EXPECT_THAT(DetermineIdealFormat(formats, 30), Eq(&formats[2]));
  EXPECT_THAT(DetermineIdealFormat(formats, 29), Eq(&formats[3]));
  EXPECT_THAT(DetermineIdealFormat(formats, 28), Eq(&formats[4]));
  EXPECT_THAT(DetermineIdealFormat(formats, 27), Eq(&formats[5]));
  EXPECT_THAT(DetermineIdealFormat(formats, 5), Eq(&formats[5]));
  EXPECT_THAT(DetermineIdealFormat(formats, 1), Eq(&formats[5]));
  EXPECT_THAT(DetermineIdealFormat(formats, 0), Eq(&formats[5]));
  EXPECT_THAT(DetermineIdealFormat(formats, -1), Eq(&formats[5]));
  EXPECT_THAT(DetermineIdealFormat(formats, -1000000), Eq(&formats[5]));

  // A single format is always ideal.
  const std::vector<util::Format> single{
      util::Format("only", "video/x-any", -1, -1, 1000)};
  EXPECT_THAT(DetermineIdealFormat(single, 1), Eq(&single[0]));
  EXPECT_THAT(DetermineIdealFormat(single, 100000), Eq(&single[0]));
}

TEST_F(AdaptiveEvaluatorTest, DetermineIdealFormatFromLadderExample) {
  const std::vector<util::Format> formats{
      util::Format("A", "video/mp4", 1280, 720, 2000000),
      util::Format("B", "video/mp4", 854, 480, 800000),
      util::Format("C", "video/mp4", 640, 360, 300000),
  };

  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  int64_t effective_bitrate = EffectiveBitrate(evaluator.get(), 1000000);
  EXPECT_THAT(effective_bitrate, Eq(750000));
  EXPECT_THAT(DetermineIdealFormat(formats, effective_bitrate),
              Eq(&formats[1]));

  EXPECT_THAT(DetermineIdealFormat(formats, 800000), Eq(&formats[1]));
  EXPECT_THAT(DetermineIdealFormat(formats, 299999), Eq(&formats[2]));
}

TEST_F(AdaptiveEvaluatorTest, InitialSelectionWithoutEstimate) {
  const std::vector<util::Format> formats{
      util::Format("A", "video/mp4", 1280, 720, 2000000),
      util::Format("B", "video/mp4", 854, 480, 800000),
      util::Format("C", "video/mp4", 640, 360, 300000),
  };
  const ChunkQueue empty_queue;

  // The default max initial bitrate is 800000, which exactly affords B. The
  // meter has no estimate unless told otherwise.
  AdaptiveEvaluator evaluator(&meter_);
  EXPECT_CALL(meter_, GetBitrateEstimate());

  FormatEvaluation evaluation;
  evaluator.Enable();
  evaluator.Evaluate(empty_queue, base::TimeDelta(), formats, &evaluation);
  evaluator.Disable();

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(formats[1]));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));
  EXPECT_THAT(evaluation.queue_size_, Eq(0));
}

TEST_F(AdaptiveEvaluatorTest, InitialSelectionWithEstimate) {
  const std::vector<util::Format> formats{
      util::Format("A", "video/mp4", 1280, 720, 2000000),
      util::Format("B", "video/mp4", 854, 480, 800000),
      util::Format("C", "video/mp4", 640, 360, 300000),
  };
  const ChunkQueue empty_queue;

  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  EXPECT_CALL(meter_, GetBitrateEstimate()).WillRepeatedly(Return(1000000));

  FormatEvaluation evaluation;
  evaluator->Evaluate(empty_queue, base::TimeDelta(), formats, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(formats[1]));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));
}

TEST_F(AdaptiveEvaluatorTest, DowngradeDeferredWithLongBuffer) {
  const std::vector<util::Format> formats{
      util::Format("A", "video/mp4", 1280, 720, 2000000),
      util::Format("B", "video/mp4", 854, 480, 800000),
      util::Format("C", "video/mp4", 640, 360, 300000),
  };

  // 30 seconds buffered ahead of the playback position.
  ChunkQueue queue;
  AppendChunks(&queue, formats[0], 15, base::TimeDelta(), kChunkDuration);

  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  EXPECT_CALL(meter_, GetBitrateEstimate()).WillRepeatedly(Return(100000));

  FormatEvaluation evaluation;
  SetCurrent(&evaluation, formats[0], queue.size());
  evaluator->Evaluate(queue, base::TimeDelta(), formats, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(formats[0]));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));
  EXPECT_THAT(evaluation.queue_size_, Eq(15));
}

TEST_F(AdaptiveEvaluatorTest, Evaluate) {
  const ChunkQueue empty_queue;

  // Queue with 32s of video. This is above the kExampleMaxDurationDecrease and
  // kExampleMinDurationRetain thresholds.
  // There are two queues: one with a SD format and one with an HD format.
  ChunkQueue queue_32s_hd;
  ChunkQueue queue_32s_sd;
  // Queue with 18s of SD video. This is above the kExampleMinDurationIncrease
  // threshold and below the kExampleMinDurationRetain threshold.
  ChunkQueue queue_18s_sd;
  ChunkQueue queue_18s_hd;
  AppendChunks(&queue_32s_hd, hd_low_, 15, kFirstChunkStartTime,
               kChunkDuration);
  AppendChunks(&queue_32s_sd, sd_mid_, 15, kFirstChunkStartTime,
               kChunkDuration);
  AppendChunks(&queue_18s_sd, sd_mid_, 8, kFirstChunkStartTime,
               kChunkDuration);
  AppendChunks(&queue_18s_hd, hd_low_, 8, kFirstChunkStartTime,
               kChunkDuration);
  // 2s chunks starting at 3s, playback at 1s, min time to retain = 25s.
  constexpr int32_t kChunksAfterDiscard = 12;

  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  ScopedFormatEvaluatorEnabler enabler(evaluator.get());

  FormatEvaluation evaluation;

  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(sd_mid_.GetBitrate())));

  evaluator->Evaluate(empty_queue, kStartPlaybackTime, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(sd_mid_));
  EXPECT_THAT(evaluation.queue_size_, Eq(0));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));

  // The trigger is sticky while the format does not change.
  evaluator->Evaluate(empty_queue, kStartPlaybackTime, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(sd_mid_));
  EXPECT_THAT(evaluation.queue_size_, Eq(0));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));

  VerifyAndClearMocks();

  // Without a buffer every switch down happens and every switch up waits.
  for (const util::Format& format : formats_) {
    SetCurrent(&evaluation, sd_mid_, 0);
    EXPECT_CALL(meter_, GetBitrateEstimate())
        .WillRepeatedly(Return(EstimateFor(format.GetBitrate())));

    bool is_lower = format.GetBitrate() < sd_mid_.GetBitrate();

    evaluator->Evaluate(empty_queue, kStartPlaybackTime, formats_,
                        &evaluation);

    ASSERT_THAT(evaluation.format_, NotNull());
    if (is_lower) {
      EXPECT_THAT(*evaluation.format_, Eq(format));
      EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));
    } else {
      EXPECT_THAT(*evaluation.format_, Eq(sd_mid_));
      EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));
    }
    EXPECT_THAT(evaluation.queue_size_, Eq(0));

    VerifyAndClearMocks();
  }

  // 18s buffered: enough to go up, not enough to discard.
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(hd_low_.GetBitrate())));

  SetCurrent(&evaluation, sd_mid_, queue_18s_sd.size());
  evaluator->Evaluate(queue_18s_sd, kStartPlaybackTime, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(hd_low_));
  EXPECT_THAT(evaluation.queue_size_, Eq(queue_18s_sd.size()));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));

  VerifyAndClearMocks();

  // 32s buffered: go up and refetch the tail of the queue.
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(hd_high_.GetBitrate())));

  SetCurrent(&evaluation, sd_mid_, queue_32s_sd.size());
  evaluator->Evaluate(queue_32s_sd, kStartPlaybackTime, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(hd_high_));
  EXPECT_THAT(evaluation.queue_size_, Eq(kChunksAfterDiscard));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));

  // HD chunks are kept.
  SetCurrent(&evaluation, hd_low_, queue_32s_hd.size());
  evaluator->Evaluate(queue_32s_hd, kStartPlaybackTime, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(hd_high_));
  EXPECT_THAT(evaluation.queue_size_, Eq(queue_32s_hd.size()));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));

  VerifyAndClearMocks();

  // 32s buffered: going down can wait.
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(sd_mid_.GetBitrate())));

  SetCurrent(&evaluation, hd_high_, queue_32s_hd.size());
  evaluator->Evaluate(queue_32s_hd, kStartPlaybackTime, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(hd_high_));
  EXPECT_THAT(evaluation.queue_size_, Eq(queue_32s_hd.size()));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));

  // 18s buffered: go down.
  SetCurrent(&evaluation, hd_high_, queue_18s_hd.size());
  evaluator->Evaluate(queue_18s_hd, kStartPlaybackTime, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(sd_mid_));
  EXPECT_THAT(evaluation.queue_size_, Eq(queue_18s_hd.size()));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));
}

TEST_F(AdaptiveEvaluatorTest, BufferThresholdBoundaries) {
  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  FormatEvaluation evaluation;

  // Exactly kExampleMinDurationIncrease buffered: the switch up is allowed.
  ChunkQueue queue_10s;
  AppendChunks(&queue_10s, sd_mid_, 5, base::TimeDelta(), kChunkDuration);
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(hd_low_.GetBitrate())));
  SetCurrent(&evaluation, sd_mid_, queue_10s.size());
  evaluator->Evaluate(queue_10s, base::TimeDelta(), formats_, &evaluation);
  EXPECT_THAT(*evaluation.format_, Eq(hd_low_));

  // One microsecond short of it: the switch up is deferred.
  SetCurrent(&evaluation, sd_mid_, queue_10s.size());
  evaluator->Evaluate(queue_10s, base::TimeDelta::FromMicroseconds(1),
                      formats_, &evaluation);
  EXPECT_THAT(*evaluation.format_, Eq(sd_mid_));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));

  VerifyAndClearMocks();

  // Exactly kExampleMaxDurationDecrease buffered: the switch down is deferred.
  ChunkQueue queue_25s;
  AppendChunks(&queue_25s, hd_low_, 5, base::TimeDelta(),
               base::TimeDelta::FromSeconds(5));
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(sd_low_.GetBitrate())));
  SetCurrent(&evaluation, hd_low_, queue_25s.size());
  evaluator->Evaluate(queue_25s, base::TimeDelta(), formats_, &evaluation);
  EXPECT_THAT(*evaluation.format_, Eq(hd_low_));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerInitial));

  // One microsecond short of it: the switch down happens.
  SetCurrent(&evaluation, hd_low_, queue_25s.size());
  evaluator->Evaluate(queue_25s, base::TimeDelta::FromMicroseconds(1),
                      formats_, &evaluation);
  EXPECT_THAT(*evaluation.format_, Eq(sd_low_));
  EXPECT_THAT(evaluation.trigger_, Eq(MediaChunk::kTriggerAdaptive));
}

TEST_F(AdaptiveEvaluatorTest, DiscardsFromFirstQualifyingChunk) {
  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(hd_high_.GetBitrate())));

  // Chunks 0-12 start less than 25s after the playback position. Chunk 13 is
  // HD and chunk 14 is the first that may go.
  ChunkQueue queue;
  AppendChunks(&queue, sd_low_, 13, base::TimeDelta(), kChunkDuration);
  AppendChunks(&queue, hd_low_, 1, base::TimeDelta(), kChunkDuration);
  AppendChunks(&queue, sd_mid_, 2, base::TimeDelta(), kChunkDuration);
  const base::TimeDelta playback_position = base::TimeDelta::FromSeconds(1);

  FormatEvaluation evaluation;
  SetCurrent(&evaluation, sd_low_, queue.size());
  evaluator->Evaluate(queue, playback_position, formats_, &evaluation);

  EXPECT_THAT(*evaluation.format_, Eq(hd_high_));
  EXPECT_THAT(evaluation.queue_size_, Eq(14));

  // Nothing before the chosen index satisfies all the discard conditions.
  for (int32_t i = 1; i < evaluation.queue_size_; i++) {
    const MediaChunk& chunk = *queue[i];
    bool qualifies =
        base::TimeDelta::FromMicroseconds(chunk.start_time_us()) -
                playback_position >=
            kExampleMinDurationRetain &&
        chunk.format()->GetBitrate() < hd_high_.GetBitrate() &&
        chunk.format()->GetHeight() < hd_high_.GetHeight() &&
        !chunk.format()->IsHd();
    EXPECT_FALSE(qualifies) << "chunk " << i;
  }
}

TEST_F(AdaptiveEvaluatorTest, DiscardRequiresLowerHeight) {
  const util::Format& sd_high = formats_[2];
  // Same height as sd_high, at a lower bitrate.
  const util::Format sd_high_lite("sd_high_lite", "video/mp4", 960, 540,
                                  1000000);

  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(sd_high.GetBitrate())));

  // Chunk 13 starts 25s after the playback position but matches the ideal
  // height. Chunk 14 is both cheaper and shorter.
  ChunkQueue queue;
  AppendChunks(&queue, sd_low_, 13, base::TimeDelta(), kChunkDuration);
  AppendChunks(&queue, sd_high_lite, 1, base::TimeDelta(), kChunkDuration);
  AppendChunks(&queue, sd_mid_, 2, base::TimeDelta(), kChunkDuration);
  const base::TimeDelta playback_position = base::TimeDelta::FromSeconds(1);
  ASSERT_THAT(base::TimeDelta::FromMicroseconds(queue[13]->start_time_us()) -
                  playback_position,
              Ge(kExampleMinDurationRetain));

  FormatEvaluation evaluation;
  SetCurrent(&evaluation, sd_low_, queue.size());
  evaluator->Evaluate(queue, playback_position, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(sd_high));
  EXPECT_THAT(evaluation.queue_size_, Eq(14));

  // With only the same-height chunk past the threshold nothing is discarded.
  ChunkQueue same_height;
  AppendChunks(&same_height, sd_low_, 13, base::TimeDelta(), kChunkDuration);
  AppendChunks(&same_height, sd_high_lite, 3, base::TimeDelta(),
               kChunkDuration);

  SetCurrent(&evaluation, sd_low_, same_height.size());
  evaluator->Evaluate(same_height, playback_position, formats_, &evaluation);

  ASSERT_THAT(evaluation.format_, NotNull());
  EXPECT_THAT(*evaluation.format_, Eq(sd_high));
  EXPECT_THAT(evaluation.queue_size_, Eq(16));
}

TEST_F(AdaptiveEvaluatorTest, NeverDiscardsNextChunk) {
  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(hd_high_.GetBitrate())));

  // Every chunk starts more than 25s ahead, including the first one.
  ChunkQueue queue;
  AppendChunks(&queue, sd_low_, 3, base::TimeDelta::FromSeconds(30),
               kChunkDuration);

  FormatEvaluation evaluation;
  SetCurrent(&evaluation, sd_low_, queue.size());
  evaluator->Evaluate(queue, base::TimeDelta(), formats_, &evaluation);

  EXPECT_THAT(*evaluation.format_, Eq(hd_high_));
  EXPECT_THAT(evaluation.queue_size_, Eq(1));

  // A single chunk queue has nothing that can be discarded.
  ChunkQueue single;
  AppendChunks(&single, sd_low_, 1, base::TimeDelta::FromSeconds(30),
               kChunkDuration);
  SetCurrent(&evaluation, sd_low_, single.size());
  evaluator->Evaluate(single, base::TimeDelta(), formats_, &evaluation);

  EXPECT_THAT(*evaluation.format_, Eq(hd_high_));
  EXPECT_THAT(evaluation.queue_size_, Eq(1));
}

TEST_F(AdaptiveEvaluatorTest, NeverGrowsQueueSize) {
  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  EXPECT_CALL(meter_, GetBitrateEstimate())
      .WillRepeatedly(Return(EstimateFor(hd_high_.GetBitrate())));

  ChunkQueue queue;
  AppendChunks(&queue, sd_mid_, 15, kFirstChunkStartTime, kChunkDuration);

  // The caller already asked for fewer chunks than the discard point.
  FormatEvaluation evaluation;
  SetCurrent(&evaluation, sd_mid_, 5);
  evaluator->Evaluate(queue, kStartPlaybackTime, formats_, &evaluation);

  EXPECT_THAT(*evaluation.format_, Eq(hd_high_));
  EXPECT_THAT(evaluation.queue_size_, Eq(5));
}

TEST_F(AdaptiveEvaluatorTest, NotifiesListener) {
  std::unique_ptr<AdaptiveEvaluator> evaluator = MakeEvaluator();
  StrictMock<MockFormatEvaluatorListener> listener;
  evaluator->set_listener(&listener);

  const ChunkQueue empty_queue;
  ChunkQueue queue_32s_sd;
  AppendChunks(&queue_32s_sd, sd_mid_, 15, kFirstChunkStartTime,
               kChunkDuration);

  FormatEvaluation evaluation;

  {
    InSequence sequence;
    EXPECT_CALL(meter_, GetBitrateEstimate())
        .WillOnce(Return(upstream::BandwidthMeterInterface::kNoEstimate));
    EXPECT_CALL(listener,
                OnIdealFormatDetermined(Eq(hd_high_), kExampleInitialBitrate));
    EXPECT_CALL(listener, OnFormatChanged(IsNull(), Eq(hd_high_),
                                          MediaChunk::kTriggerInitial));
  }
  evaluator->Evaluate(empty_queue, kStartPlaybackTime, formats_, &evaluation);
  Mock::VerifyAndClearExpectations(&listener);
  VerifyAndClearMocks();

  // No buffer to protect against a decrease, and nothing to defer.
  {
    InSequence sequence;
    EXPECT_CALL(meter_, GetBitrateEstimate())
        .WillOnce(Return(EstimateFor(sd_mid_.GetBitrate())));
    EXPECT_CALL(listener,
                OnIdealFormatDetermined(Eq(sd_mid_), sd_mid_.GetBitrate()));
    EXPECT_CALL(listener, OnFormatChanged(Pointee(Eq(hd_high_)), Eq(sd_mid_),
                                          MediaChunk::kTriggerAdaptive));
  }
  evaluator->Evaluate(empty_queue, kStartPlaybackTime, formats_, &evaluation);
  Mock::VerifyAndClearExpectations(&listener);
  VerifyAndClearMocks();

  // Not enough buffer to go up.
  {
    InSequence sequence;
    EXPECT_CALL(meter_, GetBitrateEstimate())
        .WillOnce(Return(EstimateFor(hd_low_.GetBitrate())));
    EXPECT_CALL(listener,
                OnIdealFormatDetermined(Eq(hd_low_), hd_low_.GetBitrate()));
    EXPECT_CALL(listener,
                OnSwitchDeferred(Eq(sd_mid_), Eq(hd_low_), base::TimeDelta(),
                                 DeferReason::kInsufficientBufferForIncrease));
  }
  evaluator->Evaluate(empty_queue, kStartPlaybackTime, formats_, &evaluation);
  Mock::VerifyAndClearExpectations(&listener);
  VerifyAndClearMocks();

  // Plenty of buffer: go up and discard the tail.
  evaluation.queue_size_ = queue_32s_sd.size();
  {
    InSequence sequence;
    EXPECT_CALL(meter_, GetBitrateEstimate())
        .WillOnce(Return(EstimateFor(hd_high_.GetBitrate())));
    EXPECT_CALL(listener,
                OnIdealFormatDetermined(Eq(hd_high_), hd_high_.GetBitrate()));
    EXPECT_CALL(listener, OnQueueDiscardRequested(15, 12));
    EXPECT_CALL(listener, OnFormatChanged(Pointee(Eq(sd_mid_)), Eq(hd_high_),
                                          MediaChunk::kTriggerAdaptive));
  }
  evaluator->Evaluate(queue_32s_sd, kStartPlaybackTime, formats_, &evaluation);
  Mock::VerifyAndClearExpectations(&listener);
  VerifyAndClearMocks();

  // Plenty of buffer: stay up.
  {
    InSequence sequence;
    EXPECT_CALL(meter_, GetBitrateEstimate())
        .WillOnce(Return(EstimateFor(sd_low_.GetBitrate())));
    EXPECT_CALL(listener,
                OnIdealFormatDetermined(Eq(sd_low_), sd_low_.GetBitrate()));
    EXPECT_CALL(listener,
                OnSwitchDeferred(Eq(hd_high_), Eq(sd_low_),
                                 base::TimeDelta::FromSeconds(32),
                                 DeferReason::kSufficientBufferForDecrease));
  }
  evaluator->Evaluate(queue_32s_sd, kStartPlaybackTime, formats_, &evaluation);
  Mock::VerifyAndClearExpectations(&listener);

  evaluator->set_listener(nullptr);
}

}  // namespace chunk
}  // namespace dashabr
