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

#include "chunk/random_evaluator.h"

#include "base/logging.h"

namespace dashabr {
namespace chunk {

RandomEvaluator::RandomEvaluator() : random_(std::random_device()()) {}
RandomEvaluator::RandomEvaluator(uint32_t seed) : random_(seed) {}
RandomEvaluator::~RandomEvaluator() {}

void RandomEvaluator::Enable() {}
void RandomEvaluator::Disable() {}

void RandomEvaluator::Evaluate(
    const std::deque<std::unique_ptr<MediaChunk>>& queue,
    base::TimeDelta playback_position,
    const std::vector<util::Format>& formats,
    FormatEvaluation* evaluation) {
  CHECK(evaluation);
  CHECK(!formats.empty());

  std::uniform_int_distribution<size_t> distribution(0, formats.size() - 1);
  const util::Format& new_format = formats[distribution(random_)];

  if (evaluation->format_ && *evaluation->format_ == new_format) {
    return;
  }
  if (evaluation->format_) {
    evaluation->trigger_ = MediaChunk::kTriggerAdaptive;
  }
  VLOG(2) << "Random evaluation: " << new_format;
  evaluation->format_.reset(new util::Format(new_format));
}

}  // namespace chunk
}  // namespace dashabr
