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

#include "evaluator_event_logger.h"

#include "base/logging.h"

namespace dashabr {
namespace simulator {

EvaluatorEventLogger::EvaluatorEventLogger() {}
EvaluatorEventLogger::~EvaluatorEventLogger() {}

void EvaluatorEventLogger::OnIdealFormatDetermined(const util::Format& ideal,
                                                   int64_t effective_bitrate) {
  VLOG(3) << "Ideal " << ideal.GetId() << " for effective bitrate "
          << effective_bitrate;
}

void EvaluatorEventLogger::OnSwitchDeferred(const util::Format& current,
                                            const util::Format& ideal,
                                            base::TimeDelta buffered_duration,
                                            DeferReason reason) {
  switch (reason) {
    case DeferReason::kInsufficientBufferForIncrease:
      deferred_increases_++;
      break;
    case DeferReason::kSufficientBufferForDecrease:
      deferred_decreases_++;
      break;
  }
  VLOG(2) << "Staying on " << current.GetId() << " instead of "
          << ideal.GetId() << " with " << buffered_duration.InMilliseconds()
          << "ms buffered";
}

void EvaluatorEventLogger::OnQueueDiscardRequested(int32_t old_queue_size,
                                                   int32_t new_queue_size) {
  discard_requests_++;
  VLOG(1) << "Discarding queue from " << old_queue_size << " to "
          << new_queue_size << " chunks";
}

void EvaluatorEventLogger::OnFormatChanged(
    const util::Format* old_format,
    const util::Format& new_format,
    chunk::MediaChunk::TriggerReason trigger) {
  VLOG(1) << "Format " << (old_format ? old_format->GetId() : "(none)")
          << " -> " << new_format.GetId() << " (trigger " << trigger << ")";
}

}  // namespace simulator
}  // namespace dashabr
