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

#ifndef DASHABR_CHUNK_ADAPTIVE_EVALUATOR_H_
#define DASHABR_CHUNK_ADAPTIVE_EVALUATOR_H_

#include <deque>
#include <memory>
#include <vector>

#include "base/time/time.h"
#include "chunk/format_evaluator.h"
#include "chunk/media_chunk.h"
#include "util/format.h"

namespace dashabr {

namespace upstream {
class BandwidthMeterInterface;
}  // namespace upstream

namespace chunk {

class FormatEvaluatorListenerInterface;

// An adaptive evaluator for video formats, which attempts to select the best
// quality possible given the current network conditions and state of the
// buffer. Not intended for audio.
class AdaptiveEvaluator : public FormatEvaluatorInterface {
 public:
  static constexpr int32_t kDefaultMaxInitialBitrate = 800000;

  static constexpr int kDefaultMinDurationForQualityIncreaseMs = 10000;
  static constexpr int kDefaultMaxDurationForQualityDecreaseMs = 25000;
  static constexpr int kDefaultMinDurationToRetainAfterDiscardMs = 25000;
  static constexpr float kDefaultBandwidthFraction = 0.75f;

  // Uses the default thresholds. |bandwidth_meter| is not owned and must
  // outlive the evaluator.
  explicit AdaptiveEvaluator(
      const upstream::BandwidthMeterInterface* bandwidth_meter);

  // bandwidth_meter: Source of the bitrate estimate. Not owned.
  // max_initial_bitrate: Bitrate (bits per second) assumed until the meter
  //                      has an estimate.
  // min_duration_for_quality_increase: Buffered media needed before a switch
  //                                    to a higher bitrate is made.
  // max_duration_for_quality_decrease: Buffered media above which a switch
  //                                    to a lower bitrate is put off.
  // min_duration_to_retain_after_discard: Buffered media kept ahead of the
  //                                       playback position when lower
  //                                       quality chunks are dropped to
  //                                       reach a higher quality sooner.
  // bandwidth_fraction: Share of the estimate treated as usable, leaving
  //                     headroom for estimation error.
  AdaptiveEvaluator(const upstream::BandwidthMeterInterface* bandwidth_meter,
                    int32_t max_initial_bitrate,
                    base::TimeDelta min_duration_for_quality_increase,
                    base::TimeDelta max_duration_for_quality_decrease,
                    base::TimeDelta min_duration_to_retain_after_discard,
                    float bandwidth_fraction);

  ~AdaptiveEvaluator() override;

  void Enable() override;
  void Disable() override;
  void Evaluate(const std::deque<std::unique_ptr<MediaChunk>>& queue,
                base::TimeDelta playback_position,
                const std::vector<util::Format>& formats,
                FormatEvaluation* evaluation) override;

  // |listener| is not owned and may be null. It must outlive the evaluator or
  // be cleared first.
  void set_listener(FormatEvaluatorListenerInterface* listener) {
    listener_ = listener;
  }

 private:
  friend class AdaptiveEvaluatorTest;

  AdaptiveEvaluator(const AdaptiveEvaluator& other) = delete;
  AdaptiveEvaluator& operator=(const AdaptiveEvaluator& other) = delete;

  // The bitrate formats are measured against: the scaled estimate, or
  // |max_initial_bitrate_| while there is none.
  int64_t EffectiveBitrate(int64_t bitrate_estimate) const;

  // The best format |effective_bitrate| can sustain, or the cheapest one when
  // none fits. Buffer health is not considered.
  static const util::Format* DetermineIdealFormat(
      const std::vector<util::Format>& formats,
      int64_t effective_bitrate);

  // Returns the index of the first chunk in |queue| that may be discarded to
  // switch up to |ideal| sooner, or 0 if there is none.
  size_t FindDiscardIndex(const std::deque<std::unique_ptr<MediaChunk>>& queue,
                          base::TimeDelta playback_position,
                          const util::Format& ideal) const;

  const upstream::BandwidthMeterInterface* const bandwidth_meter_;

  const int32_t max_initial_bitrate_;
  const base::TimeDelta min_duration_for_quality_increase_;
  const base::TimeDelta max_duration_for_quality_decrease_;
  const base::TimeDelta min_duration_to_retain_after_discard_;
  const float bandwidth_fraction_;

  FormatEvaluatorListenerInterface* listener_ = nullptr;
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_ADAPTIVE_EVALUATOR_H_
