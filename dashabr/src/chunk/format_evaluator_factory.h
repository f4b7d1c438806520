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

#ifndef DASHABR_CHUNK_FORMAT_EVALUATOR_FACTORY_H_
#define DASHABR_CHUNK_FORMAT_EVALUATOR_FACTORY_H_

#include <cstdint>
#include <memory>
#include <string>

#include "base/time/time.h"
#include "chunk/format_evaluator.h"

namespace dashabr {

namespace upstream {
class BandwidthMeterInterface;
}  // namespace upstream

namespace chunk {

class FormatEvaluatorListenerInterface;

enum class EvaluatorType {
  kFixed,
  kRandom,
  kRoundRobin,
  kAdaptive,
};

// Settings for the evaluators built by CreateFormatEvaluator(). Each field is
// only read by the evaluator type it names.
struct FormatEvaluatorOptions {
  FormatEvaluatorOptions();
  ~FormatEvaluatorOptions();

  // Fixed
  int32_t fixed_height;

  // Random. The random source is seeded from std::random_device unless
  // |has_random_seed| is set.
  bool has_random_seed;
  uint32_t random_seed;

  // Adaptive
  int32_t max_initial_bitrate;
  base::TimeDelta min_duration_for_quality_increase;
  base::TimeDelta max_duration_for_quality_decrease;
  base::TimeDelta min_duration_to_retain_after_discard;
  float bandwidth_fraction;
};

// Parses "fixed", "random", "roundrobin" (or "loop") and "adaptive",
// ignoring case. Returns false and leaves |type| untouched for anything else.
bool ParseEvaluatorType(const std::string& name, EvaluatorType* type);

const char* EvaluatorTypeToString(EvaluatorType type);

// Creates an evaluator of the given type.
// bandwidth_meter: Required for kAdaptive, ignored otherwise. Not owned.
// listener: Attached to kAdaptive evaluators, may be null. Not owned.
std::unique_ptr<FormatEvaluatorInterface> CreateFormatEvaluator(
    EvaluatorType type,
    const FormatEvaluatorOptions& options,
    const upstream::BandwidthMeterInterface* bandwidth_meter,
    FormatEvaluatorListenerInterface* listener);

}  // namespace chunk
}  // namespace dashabr

#endif  // DASHABR_CHUNK_FORMAT_EVALUATOR_FACTORY_H_
