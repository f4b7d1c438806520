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

#ifndef DASHABR_CHUNK_MEDIA_CHUNK_H_
#define DASHABR_CHUNK_MEDIA_CHUNK_H_

#include <cstdint>
#include <memory>

#include "base/time/time.h"
#include "util/format.h"

namespace dashabr {
namespace chunk {

// A downloaded, not yet played, unit of media encoded in a single format.
class MediaChunk {
 public:
  typedef int32_t TriggerReason;

  // Triggered by an initial format selection.
  static constexpr TriggerReason kTriggerInitial = 0;
  // Triggered by a user initiated format selection.
  static constexpr TriggerReason kTriggerManual = 1;
  // Triggered by an adaptive format selection.
  static constexpr TriggerReason kTriggerAdaptive = 2;
  // Implementations may define custom 'trigger' codes greater than or equal to
  // this value.
  static constexpr TriggerReason kTriggerCustomBase = 10000;

  // trigger: The reason for this chunk being selected.
  // format: The format of the stream to which this chunk belongs. A local
  //         copy is stored. Must not be null.
  // start_time_us: The start time of the media contained by the chunk, in
  //                microseconds.
  // end_time_us: The end time of the media contained by the chunk, in
  //              microseconds.
  // chunk_index: The index of the chunk.
  MediaChunk(TriggerReason trigger,
             const util::Format* format,
             int64_t start_time_us,
             int64_t end_time_us,
             int32_t chunk_index);
  ~MediaChunk();

  int32_t GetNextChunkIndex() const { return chunk_index_ + 1; }
  int32_t GetPrevChunkIndex() const { return chunk_index_ - 1; }

  base::TimeDelta GetDuration() const {
    return base::TimeDelta::FromMicroseconds(end_time_us_ - start_time_us_);
  }

  // Accessors
  TriggerReason trigger() const { return trigger_; }
  const util::Format* format() const { return format_.get(); }
  int64_t start_time_us() const { return start_time_us_; }
  int64_t end_time_us() const { return end_time_us_; }
  int32_t chunk_index() const { return chunk_index_; }

 private:
  MediaChunk(const MediaChunk& other) = delete;
  MediaChunk& operator=(const MediaChunk& other) = delete;

  // The reason why the chunk was generated. For reporting only.
  const TriggerReason trigger_;
  // The format of the media contained by the chunk.
  const std::unique_ptr<const util::Format> format_;
  // The start time of the media contained by the chunk.
  const int64_t start_time_us_;
  // The end time of the media contained by the chunk.
  const int64_t end_time_us_;
  // The chunk index.
  const int32_t chunk_index_;
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_MEDIA_CHUNK_H_
