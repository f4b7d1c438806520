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

#ifndef DASHABR_CHUNK_ROUND_ROBIN_EVALUATOR_H_
#define DASHABR_CHUNK_ROUND_ROBIN_EVALUATOR_H_

#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

#include "base/time/time.h"
#include "chunk/format_evaluator.h"
#include "chunk/media_chunk.h"
#include "util/format.h"

namespace dashabr {
namespace chunk {

// Cycles through the available formats from the lowest bitrate to the
// highest, moving on to the next format every kEvaluationsPerFormat
// evaluations. Ignores bandwidth and buffer health; intended for tests and
// demos.
class RoundRobinEvaluator : public FormatEvaluatorInterface {
 public:
  static constexpr int32_t kEvaluationsPerFormat = 3;

  RoundRobinEvaluator();
  ~RoundRobinEvaluator() override;

  // Restarts the cycle from the lowest bitrate format.
  void Enable() override;
  void Disable() override;
  void Evaluate(const std::deque<std::unique_ptr<MediaChunk>>& queue,
                base::TimeDelta playback_position,
                const std::vector<util::Format>& formats,
                FormatEvaluation* evaluation) override;

 private:
  RoundRobinEvaluator(const RoundRobinEvaluator& other) = delete;
  RoundRobinEvaluator& operator=(const RoundRobinEvaluator& other) = delete;

  // Number of formats stepped over, counted from the end of the list.
  size_t cursor_ = 0;
  int64_t evaluation_count_ = 0;
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_ROUND_ROBIN_EVALUATOR_H_
