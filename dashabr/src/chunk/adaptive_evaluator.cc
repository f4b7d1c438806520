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

#include <deque>
#include <memory>
#include <vector>

#include "base/logging.h"
#include "base/time/time.h"
#include "chunk/format_evaluator.h"
#include "chunk/format_evaluator_listener.h"
#include "chunk/media_chunk.h"
#include "upstream/bandwidth_meter.h"
#include "util/format.h"

namespace dashabr {
namespace chunk {

constexpr int32_t AdaptiveEvaluator::kDefaultMaxInitialBitrate;
constexpr int AdaptiveEvaluator::kDefaultMinDurationForQualityIncreaseMs;
constexpr int AdaptiveEvaluator::kDefaultMaxDurationForQualityDecreaseMs;
constexpr int AdaptiveEvaluator::kDefaultMinDurationToRetainAfterDiscardMs;
constexpr float AdaptiveEvaluator::kDefaultBandwidthFraction;

AdaptiveEvaluator::AdaptiveEvaluator(
    const upstream::BandwidthMeterInterface* bandwidth_meter)
    : AdaptiveEvaluator(bandwidth_meter,
                        kDefaultMaxInitialBitrate,
                        base::TimeDelta::FromMilliseconds(
                            kDefaultMinDurationForQualityIncreaseMs),
                        base::TimeDelta::FromMilliseconds(
                            kDefaultMaxDurationForQualityDecreaseMs),
                        base::TimeDelta::FromMilliseconds(
                            kDefaultMinDurationToRetainAfterDiscardMs),
                        kDefaultBandwidthFraction) {}

AdaptiveEvaluator::AdaptiveEvaluator(
    const upstream::BandwidthMeterInterface* bandwidth_meter,
    int32_t max_initial_bitrate,
    base::TimeDelta min_duration_for_quality_increase,
    base::TimeDelta max_duration_for_quality_decrease,
    base::TimeDelta min_duration_to_retain_after_discard,
    float bandwidth_fraction)
    : bandwidth_meter_(bandwidth_meter),
      max_initial_bitrate_(max_initial_bitrate),
      min_duration_for_quality_increase_(min_duration_for_quality_increase),
      max_duration_for_quality_decrease_(max_duration_for_quality_decrease),
      min_duration_to_retain_after_discard_(
          min_duration_to_retain_after_discard),
      bandwidth_fraction_(bandwidth_fraction) {
  CHECK(bandwidth_meter_);
}

AdaptiveEvaluator::~AdaptiveEvaluator() {}

void AdaptiveEvaluator::Enable() {}
void AdaptiveEvaluator::Disable() {}

void AdaptiveEvaluator::Evaluate(
    const std::deque<std::unique_ptr<MediaChunk>>& queue,
    base::TimeDelta playback_position,
    const std::vector<util::Format>& formats,
    FormatEvaluation* evaluation) {
  CHECK(evaluation);
  DCHECK(!formats.empty());

  const base::TimeDelta buffered_duration =
      queue.empty()
          ? base::TimeDelta()
          : base::TimeDelta::FromMicroseconds(queue.back()->end_time_us()) -
                playback_position;

  const util::Format* current = evaluation->format_.get();
  const int64_t effective_bitrate =
      EffectiveBitrate(bandwidth_meter_->GetBitrateEstimate());
  const util::Format* ideal = DetermineIdealFormat(formats, effective_bitrate);
  CHECK(ideal);
  if (listener_) {
    listener_->OnIdealFormatDetermined(*ideal, effective_bitrate);
  }

  bool is_higher = current && ideal->GetBitrate() > current->GetBitrate();
  bool is_lower = current && ideal->GetBitrate() < current->GetBitrate();
  if (is_higher) {
    if (buffered_duration < min_duration_for_quality_increase_) {
      // Too little buffered to absorb slower, larger chunks. Stay put.
      VLOG(1) << "Switch up to " << ideal->GetId() << " deferred, only "
              << buffered_duration.InMilliseconds() << "ms buffered";
      if (listener_) {
        listener_->OnSwitchDeferred(
            *current, *ideal, buffered_duration,
            FormatEvaluatorListenerInterface::DeferReason::
                kInsufficientBufferForIncrease);
      }
      ideal = current;
    } else if (buffered_duration >= min_duration_to_retain_after_discard_) {
      VLOG(1) << "Switch up to " << ideal->GetId()
              << ", looking for chunks to refetch";
      size_t discard_index =
          FindDiscardIndex(queue, playback_position, *ideal);
      if (discard_index > 0 &&
          discard_index < static_cast<size_t>(evaluation->queue_size_)) {
        if (listener_) {
          listener_->OnQueueDiscardRequested(
              evaluation->queue_size_, static_cast<int32_t>(discard_index));
        }
        evaluation->queue_size_ = static_cast<int32_t>(discard_index);
      }
    } else {
      VLOG(1) << "Switch up to " << ideal->GetId();
    }
  } else if (is_lower) {
    if (buffered_duration >= max_duration_for_quality_decrease_) {
      // Enough buffered to ride out the drop in throughput for a while.
      VLOG(1) << "Switch down to " << ideal->GetId() << " deferred, "
              << buffered_duration.InMilliseconds() << "ms buffered";
      if (listener_) {
        listener_->OnSwitchDeferred(
            *current, *ideal, buffered_duration,
            FormatEvaluatorListenerInterface::DeferReason::
                kSufficientBufferForDecrease);
      }
      ideal = current;
    } else {
      VLOG(1) << "Switch down to " << ideal->GetId();
    }
  }

  if (current && *current == *ideal) {
    VLOG(2) << "Keeping " << current->GetId();
    return;
  }

  VLOG(2) << "Selected " << *ideal << " at effective bitrate "
          << effective_bitrate;
  if (current) {
    evaluation->trigger_ = MediaChunk::kTriggerAdaptive;
  }
  if (listener_) {
    listener_->OnFormatChanged(current, *ideal, evaluation->trigger_);
  }
  // |ideal| points into |formats| here, never at the format being replaced.
  evaluation->format_.reset(new util::Format(*ideal));
}

int64_t AdaptiveEvaluator::EffectiveBitrate(int64_t bitrate_estimate) const {
  return bitrate_estimate == upstream::BandwidthMeterInterface::kNoEstimate
             ? max_initial_bitrate_
             : static_cast<int64_t>(bitrate_estimate *
                                    static_cast<double>(bandwidth_fraction_));
}

const util::Format* AdaptiveEvaluator::DetermineIdealFormat(
    const std::vector<util::Format>& formats,
    int64_t effective_bitrate) {
  CHECK(!formats.empty());
  if (VLOG_IS_ON(5)) {
    for (const util::Format& format : formats) {
      VLOG(5) << "Candidate " << format;
    }
  }

  // Search for the best format with a linear scan. Formats normally arrive in
  // descending bandwidth order, where this returns the first format that fits
  // (or the last one), but the scan does not depend on that order, so a list
  // assembled across period boundaries does not have to be re-sorted.
  const util::Format* best_so_far = nullptr;

  for (const util::Format& format : formats) {
    if (!best_so_far) {
      best_so_far = &format;
      continue;
    }
    const bool fits = format.GetBitrate() <= effective_bitrate;
    const bool best_fits = best_so_far->GetBitrate() <= effective_bitrate;
    // Anything that fits beats anything that does not. Among formats that
    // fit the highest bitrate wins, otherwise the lowest.
    if (fits ? (!best_fits ||
                format.GetBitrate() > best_so_far->GetBitrate())
             : (!best_fits &&
                format.GetBitrate() < best_so_far->GetBitrate())) {
      best_so_far = &format;
    }
  }

  return best_so_far;
}

size_t AdaptiveEvaluator::FindDiscardIndex(
    const std::deque<std::unique_ptr<MediaChunk>>& queue,
    base::TimeDelta playback_position,
    const util::Format& ideal) const {
  // The first chunk far enough ahead that is SD and worse than |ideal| on both
  // bitrate and height starts the discarded tail. Index 0 is about to play and
  // is never a candidate.
  for (size_t i = 1; i < queue.size(); i++) {
    const MediaChunk& candidate = *queue[i];
    const util::Format& chunk_format = *candidate.format();
    const base::TimeDelta time_to_chunk =
        base::TimeDelta::FromMicroseconds(candidate.start_time_us()) -
        playback_position;
    if (time_to_chunk >= min_duration_to_retain_after_discard_ &&
        chunk_format.GetBitrate() < ideal.GetBitrate() &&
        chunk_format.GetHeight() < ideal.GetHeight() &&
        !chunk_format.IsHd()) {
      return i;
    }
  }
  return 0;
}

}  // namespace chunk
}  // namespace dashabr
