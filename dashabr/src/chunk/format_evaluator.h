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

#ifndef DASHABR_CHUNK_FORMAT_EVALUATOR_H_
#define DASHABR_CHUNK_FORMAT_EVALUATOR_H_

#include <deque>
#include <memory>
#include <vector>

#include "base/time/time.h"
#include "chunk/media_chunk.h"
#include "util/format.h"

namespace dashabr {
namespace chunk {

// A format evaluation.
struct FormatEvaluation {
  // The desired size of the queue. The caller sets this to the current queue
  // size before each evaluation; evaluators may only reduce it.
  int32_t queue_size_ = 0;

  // The sticky reason for the format selection.
  MediaChunk::TriggerReason trigger_ = MediaChunk::kTriggerInitial;

  // The selected format.
  std::unique_ptr<util::Format> format_ = nullptr;
};

// Selects from a number of available formats during playback.
//
// An evaluator instance keeps private state between calls and must be driven
// by a single track loop at a time. Audio and video tracks that adapt
// independently each need their own evaluator and their own
// FormatEvaluation.
class FormatEvaluatorInterface {
 public:
  FormatEvaluatorInterface() {}
  virtual ~FormatEvaluatorInterface() {}

  // Enables the evaluator.
  virtual void Enable() = 0;

  // Disables the evaluator.
  virtual void Disable() = 0;

  // Update the supplied evaluation.
  // When the method is invoked, 'evaluation' will contain the currently
  // selected format (null for the first evaluation), the most recent trigger
  // (kTriggerInitial for the first evaluation) and the current queue size.
  // The implementation should update these fields as necessary, and must
  // leave a non-null format behind.
  //
  // The trigger should be considered "sticky" for as long as a given
  // representation is selected, and so should only be changed if the
  // representation is also changed.
  //
  // queue: A read only representation of the currently buffered MediaChunks.
  // playback_position: The current playback position.
  // formats: The formats from which to select, ordered by decreasing
  //          bandwidth. Must not be empty.
  // evaluation: The evaluation.
  virtual void Evaluate(const std::deque<std::unique_ptr<MediaChunk>>& queue,
                        base::TimeDelta playback_position,
                        const std::vector<util::Format>& formats,
                        FormatEvaluation* evaluation) = 0;
};

// Enables |evaluator| for the lifetime of the scope and disables it on the
// way out, however the scope is left.
class ScopedFormatEvaluatorEnabler {
 public:
  explicit ScopedFormatEvaluatorEnabler(FormatEvaluatorInterface* evaluator)
      : evaluator_(evaluator) {
    evaluator_->Enable();
  }
  ~ScopedFormatEvaluatorEnabler() { evaluator_->Disable(); }

 private:
  ScopedFormatEvaluatorEnabler(const ScopedFormatEvaluatorEnabler& other) =
      delete;
  ScopedFormatEvaluatorEnabler& operator=(
      const ScopedFormatEvaluatorEnabler& other) = delete;

  FormatEvaluatorInterface* const evaluator_;
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_FORMAT_EVALUATOR_H_
