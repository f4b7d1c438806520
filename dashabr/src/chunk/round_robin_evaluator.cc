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

#include "chunk/round_robin_evaluator.h"

#include "base/logging.h"

namespace dashabr {
namespace chunk {

constexpr int32_t RoundRobinEvaluator::kEvaluationsPerFormat;

RoundRobinEvaluator::RoundRobinEvaluator() {}
RoundRobinEvaluator::~RoundRobinEvaluator() {}

void RoundRobinEvaluator::Enable() {
  cursor_ = 0;
  evaluation_count_ = 0;
}

void RoundRobinEvaluator::Disable() {}

void RoundRobinEvaluator::Evaluate(
    const std::deque<std::unique_ptr<MediaChunk>>& queue,
    base::TimeDelta playback_position,
    const std::vector<util::Format>& formats,
    FormatEvaluation* evaluation) {
  CHECK(evaluation);
  CHECK(!formats.empty());

  const size_t num_formats = formats.size();
  const util::Format& new_format =
      formats[num_formats - 1 - cursor_ % num_formats];

  // The advanced cursor takes effect from the next evaluation.
  if (++evaluation_count_ % kEvaluationsPerFormat == 0) {
    cursor_ = (cursor_ + 1) % num_formats;
  }

  if (evaluation->format_ && *evaluation->format_ == new_format) {
    return;
  }
  if (evaluation->format_) {
    evaluation->trigger_ = MediaChunk::kTriggerAdaptive;
  }
  VLOG(2) << "Round robin evaluation: " << new_format;
  evaluation->format_.reset(new util::Format(new_format));
}

}  // namespace chunk
}  // namespace dashabr
