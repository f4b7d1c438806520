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

#include "chunk/fixed_evaluator.h"

#include <cstdlib>

#include "base/logging.h"

namespace dashabr {
namespace chunk {

constexpr int32_t FixedEvaluator::kLowestQuality;

FixedEvaluator::FixedEvaluator(int32_t height) : height_(height) {}
FixedEvaluator::~FixedEvaluator() {}

void FixedEvaluator::Enable() {}
void FixedEvaluator::Disable() {}

void FixedEvaluator::Evaluate(
    const std::deque<std::unique_ptr<MediaChunk>>& queue,
    base::TimeDelta playback_position,
    const std::vector<util::Format>& formats,
    FormatEvaluation* evaluation) {
  CHECK(evaluation);
  CHECK(!formats.empty());

  const util::Format* selected = SelectFormat(formats);
  if (!evaluation->format_ || *evaluation->format_ != *selected) {
    evaluation->format_.reset(new util::Format(*selected));
  }
}

const util::Format* FixedEvaluator::SelectFormat(
    const std::vector<util::Format>& formats) const {
  if (height_ == kLowestQuality) {
    return &formats.back();
  }

  // Later formats win ties, so among equal heights the lowest bitrate is
  // chosen.
  const util::Format* best = nullptr;
  int64_t best_distance = 0;
  for (const util::Format& format : formats) {
    // Heights span the full int32_t range, so the difference is taken wider.
    int64_t distance = std::abs(static_cast<int64_t>(format.GetHeight()) -
                                static_cast<int64_t>(height_));
    if (!best || distance <= best_distance) {
      best = &format;
      best_distance = distance;
    }
  }

  if (best_distance != 0) {
    VLOG(1) << "No format with height " << height_ << ", using " << *best;
  }
  return best;
}

}  // namespace chunk
}  // namespace dashabr
