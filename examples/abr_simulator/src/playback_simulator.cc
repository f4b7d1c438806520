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

#include "playback_simulator.h"

#include "base/logging.h"
#include "trace_bandwidth_meter.h"

namespace dashabr {
namespace simulator {

namespace {
constexpr int64_t kMicrosecondsPerSecond = 1000000;
}  // namespace

PlaybackSimulator::PlaybackSimulator(
    const SimulationConfig& config,
    const std::vector<util::Format>& formats,
    TraceBandwidthMeter* bandwidth_meter,
    chunk::FormatEvaluatorInterface* evaluator)
    : config_(config),
      formats_(formats),
      bandwidth_meter_(bandwidth_meter),
      evaluator_(evaluator) {
  CHECK(!formats_.empty());
  CHECK(bandwidth_meter_);
  CHECK(evaluator_);
  CHECK_GT(config_.chunk_duration.InMicroseconds(), 0);
  CHECK_GT(config_.max_buffer.InMicroseconds(), 0);
  CHECK_GE(config_.chunk_count, 0);
}

PlaybackSimulator::~PlaybackSimulator() {}

SimulationResult PlaybackSimulator::Run() {
  CHECK(!ran_);
  ran_ = true;

  chunk::ScopedFormatEvaluatorEnabler enabler(evaluator_);

  while (next_chunk_index_ < config_.chunk_count) {
    if (BufferedDuration() >= config_.max_buffer) {
      // Buffer full. Wait for the current chunk to finish playing.
      Play(base::TimeDelta::FromMicroseconds(queue_.front()->end_time_us()) -
           playback_position_);
      continue;
    }

    evaluation_.queue_size_ = static_cast<int32_t>(queue_.size());
    evaluator_->Evaluate(queue_, playback_position_, formats_, &evaluation_);
    CHECK(evaluation_.format_);
    CHECK_GE(evaluation_.queue_size_, 0);
    if (static_cast<size_t>(evaluation_.queue_size_) < queue_.size()) {
      DiscardTail(evaluation_.queue_size_);
    }

    DownloadNextChunk();
  }

  if (!queue_.empty()) {
    Play(BufferedDuration());
  }

  result_.session_duration = now_;
  if (result_.chunks_played > 0) {
    result_.average_bitrate = played_bitrate_sum_ / result_.chunks_played;
  }
  return result_;
}

base::TimeDelta PlaybackSimulator::BufferedDuration() const {
  if (queue_.empty()) {
    return base::TimeDelta();
  }
  return base::TimeDelta::FromMicroseconds(queue_.back()->end_time_us()) -
         playback_position_;
}

void PlaybackSimulator::Play(base::TimeDelta duration) {
  now_ += duration;
  if (!started_) {
    return;
  }

  while (duration > base::TimeDelta()) {
    if (queue_.empty()) {
      if (!stalled_) {
        VLOG(1) << "Stalled at " << playback_position_.InMilliseconds()
                << "ms";
        result_.stall_count++;
        stalled_ = true;
      }
      result_.stall_duration += duration;
      return;
    }

    const chunk::MediaChunk& playing = *queue_.front();
    base::TimeDelta remaining =
        base::TimeDelta::FromMicroseconds(playing.end_time_us()) -
        playback_position_;
    if (duration < remaining) {
      playback_position_ += duration;
      return;
    }

    playback_position_ += remaining;
    duration -= remaining;
    result_.chunks_played++;
    result_.chunks_per_format[playing.format()->GetId()]++;
    played_bitrate_sum_ += playing.format()->GetBitrate();
    queue_.pop_front();
  }
}

void PlaybackSimulator::DiscardTail(size_t queue_size) {
  while (queue_.size() > queue_size) {
    VLOG(1) << "Discarding chunk " << queue_.back()->chunk_index() << " ("
            << queue_.back()->format()->GetId() << ")";
    queue_.pop_back();
    result_.chunks_discarded++;
  }

  if (queue_.empty()) {
    next_chunk_index_ = static_cast<int32_t>(
        playback_position_.InMicroseconds() /
        config_.chunk_duration.InMicroseconds());
  } else {
    next_chunk_index_ = queue_.back()->GetNextChunkIndex();
  }
}

void PlaybackSimulator::DownloadNextChunk() {
  const util::Format& format = *evaluation_.format_;
  const int64_t chunk_us = config_.chunk_duration.InMicroseconds();
  const int64_t bits =
      static_cast<int64_t>(format.GetBitrate()) * chunk_us /
      kMicrosecondsPerSecond;

  base::TimeDelta elapsed = bandwidth_meter_->Download(now_, bits);
  Play(elapsed);

  if (!last_format_id_.empty() && last_format_id_ != format.GetId()) {
    result_.format_switches++;
  }
  last_format_id_ = format.GetId();

  const int64_t start_time_us = next_chunk_index_ * chunk_us;
  queue_.push_back(std::unique_ptr<chunk::MediaChunk>(
      new chunk::MediaChunk(evaluation_.trigger_, &format, start_time_us,
                            start_time_us + chunk_us, next_chunk_index_)));
  next_chunk_index_ = queue_.back()->GetNextChunkIndex();
  result_.chunks_downloaded++;
  stalled_ = false;

  if (!started_) {
    started_ = true;
    result_.startup_delay = now_;
  }

  VLOG(1) << "t=" << now_.InMilliseconds() << "ms chunk "
          << queue_.back()->chunk_index() << " " << format.GetId() << " in "
          << elapsed.InMilliseconds() << "ms, buffered "
          << BufferedDuration().InMilliseconds() << "ms, trigger "
          << evaluation_.trigger_;
}

}  // namespace simulator
}  // namespace dashabr
