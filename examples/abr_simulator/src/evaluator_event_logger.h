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

#ifndef EVALUATOR_EVENT_LOGGER_H_
#define EVALUATOR_EVENT_LOGGER_H_

#include <cstdint>

#include "base/time/time.h"
#include "chunk/format_evaluator_listener.h"
#include "chunk/media_chunk.h"
#include "util/format.h"

namespace dashabr {
namespace simulator {

// Logs evaluator decisions and counts the ones that end up in the report.
class EvaluatorEventLogger : public chunk::FormatEvaluatorListenerInterface {
 public:
  EvaluatorEventLogger();
  ~EvaluatorEventLogger() override;

  void OnIdealFormatDetermined(const util::Format& ideal,
                               int64_t effective_bitrate) override;
  void OnSwitchDeferred(const util::Format& current,
                        const util::Format& ideal,
                        base::TimeDelta buffered_duration,
                        DeferReason reason) override;
  void OnQueueDiscardRequested(int32_t old_queue_size,
                               int32_t new_queue_size) override;
  void OnFormatChanged(const util::Format* old_format,
                       const util::Format& new_format,
                       chunk::MediaChunk::TriggerReason trigger) override;

  int32_t deferred_increases() const { return deferred_increases_; }
  int32_t deferred_decreases() const { return deferred_decreases_; }
  int32_t discard_requests() const { return discard_requests_; }

 private:
  EvaluatorEventLogger(const EvaluatorEventLogger& other) = delete;
  EvaluatorEventLogger& operator=(const EvaluatorEventLogger& other) = delete;

  int32_t deferred_increases_ = 0;
  int32_t deferred_decreases_ = 0;
  int32_t discard_requests_ = 0;
};

}  // namespace simulator
}  // namespace dashabr

#endif  // EVALUATOR_EVENT_LOGGER_H_
