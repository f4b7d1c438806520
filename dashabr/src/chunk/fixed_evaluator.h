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

#ifndef DASHABR_CHUNK_FIXED_EVALUATOR_H_
#define DASHABR_CHUNK_FIXED_EVALUATOR_H_

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

// Always selects the format with a configured pixel height.
//
// A height of kLowestQuality selects the last (lowest bitrate) format. When
// several formats share the height, the lowest bitrate one is used. When no
// format has the height, the format with the closest height is used instead.
class FixedEvaluator : public FormatEvaluatorInterface {
 public:
  static constexpr int32_t kLowestQuality = 0;

  explicit FixedEvaluator(int32_t height = kLowestQuality);
  ~FixedEvaluator() override;

  void Enable() override;
  void Disable() override;
  void Evaluate(const std::deque<std::unique_ptr<MediaChunk>>& queue,
                base::TimeDelta playback_position,
                const std::vector<util::Format>& formats,
                FormatEvaluation* evaluation) override;

  int32_t height() const { return height_; }

 private:
  FixedEvaluator(const FixedEvaluator& other) = delete;
  FixedEvaluator& operator=(const FixedEvaluator& other) = delete;

  const util::Format* SelectFormat(
      const std::vector<util::Format>& formats) const;

  const int32_t height_;
};

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_FIXED_EVALUATOR_H_
