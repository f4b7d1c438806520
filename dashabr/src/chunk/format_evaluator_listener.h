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

#ifndef DASHABR_CHUNK_FORMAT_EVALUATOR_LISTENER_H_
#define DASHABR_CHUNK_FORMAT_EVALUATOR_LISTENER_H_

#include <cstdint>

#include "base/time/time.h"
#include "chunk/media_chunk.h"
#include "util/format.h"

namespace dashabr {
namespace chunk {

// Interface for callbacks to be notified of the decisions taken by a format
// evaluator. Callbacks run synchronously on the thread calling Evaluate() and
// must not block.
class FormatEvaluatorListenerInterface {
 public:
  // Why a switch to the ideal format was not made.
  enum class DeferReason {
    // The ideal format is better, but the buffer is too short to risk it.
    kInsufficientBufferForIncrease,
    // The ideal format is worse, but the buffer is long enough to wait.
    kSufficientBufferForDecrease,
  };

  FormatEvaluatorListenerInterface() {}
  virtual ~FormatEvaluatorListenerInterface() {}

  // Invoked once per evaluation with the format that would be selected if
  // buffer health were ignored.
  //
  // ideal The ideal format.
  // effective_bitrate The bitrate, in bits per second, the ideal format was
  //   chosen against.
  virtual void OnIdealFormatDetermined(const util::Format& ideal,
                                       int64_t effective_bitrate) = 0;

  // Invoked when the evaluator keeps |current| instead of switching to
  // |ideal|.
  //
  // buffered_duration The duration of media buffered ahead of the playback
  //   position at the time of the evaluation.
  virtual void OnSwitchDeferred(const util::Format& current,
                                const util::Format& ideal,
                                base::TimeDelta buffered_duration,
                                DeferReason reason) = 0;

  // Invoked when the evaluator asks the caller to drop buffered chunks so
  // they can be fetched again at a higher quality.
  //
  // old_queue_size The queue size before the evaluation.
  // new_queue_size The number of chunks to retain.
  virtual void OnQueueDiscardRequested(int32_t old_queue_size,
                                       int32_t new_queue_size) = 0;

  // Invoked when the selected format changes.
  //
  // old_format The previous selection, or null for the first evaluation.
  // new_format The new selection.
  // trigger The trigger left in the evaluation.
  virtual void OnFormatChanged(const util::Format* old_format,
                               const util::Format& new_format,
                               MediaChunk::TriggerReason trigger) = 0;
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_FORMAT_EVALUATOR_LISTENER_H_
