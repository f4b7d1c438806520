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

#ifndef DASHABR_CHUNK_RANDOM_EVALUATOR_H_
#define DASHABR_CHUNK_RANDOM_EVALUATOR_H_

#include <cstdint>
#include <deque>
#include <memory>
#include <random>
#include <vector>

#include "base/time/time.h"
#include "chunk/format_evaluator.h"
#include "chunk/media_chunk.h"
#include "util/format.h"

namespace dashabr {
namespace chunk {

// Selects randomly between the available formats.
class RandomEvaluator : public FormatEvaluatorInterface {
 public:
  // Seeds the random source from std::random_device.
  RandomEvaluator();
  // seed: Seed for the random source. Evaluators created with the same seed
  //       make the same selections.
  explicit RandomEvaluator(uint32_t seed);
  ~RandomEvaluator() override;

  void Enable() override;
  void Disable() override;
  void Evaluate(const std::deque<std::unique_ptr<MediaChunk>>& queue,
                base::TimeDelta playback_position,
                const std::vector<util::Format>& formats,
                FormatEvaluation* evaluation) override;

 private:
  RandomEvaluator(const RandomEvaluator& other) = delete;
  RandomEvaluator& operator=(const RandomEvaluator& other) = delete;

  std::mt19937 random_;
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_RANDOM_EVALUATOR_H_
