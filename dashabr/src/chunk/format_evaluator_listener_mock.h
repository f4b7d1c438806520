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

#ifndef DASHABR_CHUNK_FORMAT_EVALUATOR_LISTENER_MOCK_H_
#define DASHABR_CHUNK_FORMAT_EVALUATOR_LISTENER_MOCK_H_

#include <cstdint>

#include "chunk/format_evaluator_listener.h"
#include "gmock/gmock.h"

namespace dashabr {
namespace chunk {

class MockFormatEvaluatorListener : public FormatEvaluatorListenerInterface {
 public:
  MockFormatEvaluatorListener();
  ~MockFormatEvaluatorListener() override;

  MOCK_METHOD2(OnIdealFormatDetermined,
               void(const util::Format& ideal, int64_t effective_bitrate));
  MOCK_METHOD4(OnSwitchDeferred,
               void(const util::Format& current,
                    const util::Format& ideal,
                    base::TimeDelta buffered_duration,
                    DeferReason reason));
  MOCK_METHOD2(OnQueueDiscardRequested,
               void(int32_t old_queue_size, int32_t new_queue_size));
  MOCK_METHOD3(OnFormatChanged,
               void(const util::Format* old_format,
                    const util::Format& new_format,
                    MediaChunk::TriggerReason trigger));
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_FORMAT_EVALUATOR_LISTENER_MOCK_H_
