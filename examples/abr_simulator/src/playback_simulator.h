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

#ifndef PLAYBACK_SIMULATOR_H_
#define PLAYBACK_SIMULATOR_H_

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "base/time/time.h"
#include "chunk/format_evaluator.h"
#include "chunk/media_chunk.h"
#include "util/format.h"

namespace dashabr {
namespace simulator {

class TraceBandwidthMeter;

struct SimulationConfig {
  // Media duration of every chunk.
  base::TimeDelta chunk_duration = base::TimeDelta::FromSeconds(2);
  // Number of chunks in the presentation.
  int32_t chunk_count = 150;
  // No chunk is requested while at least this much media is buffered.
  base::TimeDelta max_buffer = base::TimeDelta::FromSeconds(30);
};

struct SimulationResult {
  int32_t chunks_downloaded = 0;
  int32_t chunks_discarded = 0;
  int32_t chunks_played = 0;
  // Number of downloaded chunks whose format differs from the previous one.
  int32_t format_switches = 0;
  int32_t stall_count = 0;
  base::TimeDelta stall_duration;
  // Time until the first chunk was buffered.
  base::TimeDelta startup_delay;
  // Time until the last chunk finished playing.
  base::TimeDelta session_duration;
  // Mean bitrate of the played chunks.
  int64_t average_bitrate = 0;
  // Played chunks per format id.
  std::map<std::string, int32_t> chunks_per_format;
};

// Drives a format evaluator through a simulated playback session. Chunks are
// fetched one at a time over |bandwidth_meter|'s trace while playback drains
// the buffer in the same simulated clock.
class PlaybackSimulator {
 public:
  // formats: Ordered by decreasing bandwidth. Must not be empty.
  // bandwidth_meter: Not owned.
  // evaluator: Not owned.
  PlaybackSimulator(const SimulationConfig& config,
                    const std::vector<util::Format>& formats,
                    TraceBandwidthMeter* bandwidth_meter,
                    chunk::FormatEvaluatorInterface* evaluator);
  ~PlaybackSimulator();

  // Runs the whole session. May only be called once.
  SimulationResult Run();

 private:
  PlaybackSimulator(const PlaybackSimulator& other) = delete;
  PlaybackSimulator& operator=(const PlaybackSimulator& other) = delete;

  base::TimeDelta BufferedDuration() const;

  // Advances the clock by |duration|, playing from the queue once playback
  // has started and accounting for stalls when the queue runs dry.
  void Play(base::TimeDelta duration);

  // Drops queued chunks beyond |queue_size| and rewinds the next chunk to
  // fetch.
  void DiscardTail(size_t queue_size);

  void DownloadNextChunk();

  const SimulationConfig config_;
  const std::vector<util::Format> formats_;
  TraceBandwidthMeter* const bandwidth_meter_;
  chunk::FormatEvaluatorInterface* const evaluator_;

  std::deque<std::unique_ptr<chunk::MediaChunk>> queue_;
  chunk::FormatEvaluation evaluation_;

  base::TimeDelta now_;
  base::TimeDelta playback_position_;
  int32_t next_chunk_index_ = 0;
  std::string last_format_id_;
  bool started_ = false;
  bool stalled_ = false;
  bool ran_ = false;
  int64_t played_bitrate_sum_ = 0;

  SimulationResult result_;
};

}  // namespace simulator
}  // namespace dashabr

#endif  // PLAYBACK_SIMULATOR_H_
