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

#include "chunk/format_evaluator_factory.h"

#include <utility>

#include "base/logging.h"
#include "base/strings/string_util.h"
#include "chunk/adaptive_evaluator.h"
#include "chunk/fixed_evaluator.h"
#include "chunk/random_evaluator.h"
#include "chunk/round_robin_evaluator.h"

namespace dashabr {
namespace chunk {

FormatEvaluatorOptions::FormatEvaluatorOptions()
    : fixed_height(FixedEvaluator::kLowestQuality),
      has_random_seed(false),
      random_seed(0),
      max_initial_bitrate(AdaptiveEvaluator::kDefaultMaxInitialBitrate),
      min_duration_for_quality_increase(base::TimeDelta::FromMilliseconds(
          AdaptiveEvaluator::kDefaultMinDurationForQualityIncreaseMs)),
      max_duration_for_quality_decrease(base::TimeDelta::FromMilliseconds(
          AdaptiveEvaluator::kDefaultMaxDurationForQualityDecreaseMs)),
      min_duration_to_retain_after_discard(base::TimeDelta::FromMilliseconds(
          AdaptiveEvaluator::kDefaultMinDurationToRetainAfterDiscardMs)),
      bandwidth_fraction(AdaptiveEvaluator::kDefaultBandwidthFraction) {}

FormatEvaluatorOptions::~FormatEvaluatorOptions() {}

bool ParseEvaluatorType(const std::string& name, EvaluatorType* type) {
  const std::string lower = base::ToLowerASCII(name);
  if (lower == "fixed") {
    *type = EvaluatorType::kFixed;
  } else if (lower == "random") {
    *type = EvaluatorType::kRandom;
  } else if (lower == "roundrobin" || lower == "loop") {
    *type = EvaluatorType::kRoundRobin;
  } else if (lower == "adaptive") {
    *type = EvaluatorType::kAdaptive;
  } else {
    return false;
  }
  return true;
}

const char* EvaluatorTypeToString(EvaluatorType type) {
  switch (type) {
    case EvaluatorType::kFixed:
      return "fixed";
    case EvaluatorType::kRandom:
      return "random";
    case EvaluatorType::kRoundRobin:
      return "roundrobin";
    case EvaluatorType::kAdaptive:
      return "adaptive";
  }
  NOTREACHED();
  return "unknown";
}

std::unique_ptr<FormatEvaluatorInterface> CreateFormatEvaluator(
    EvaluatorType type,
    const FormatEvaluatorOptions& options,
    const upstream::BandwidthMeterInterface* bandwidth_meter,
    FormatEvaluatorListenerInterface* listener) {
  VLOG(1) << "Creating " << EvaluatorTypeToString(type) << " evaluator";
  switch (type) {
    case EvaluatorType::kFixed:
      return std::unique_ptr<FormatEvaluatorInterface>(
          new FixedEvaluator(options.fixed_height));
    case EvaluatorType::kRandom:
      if (options.has_random_seed) {
        return std::unique_ptr<FormatEvaluatorInterface>(
            new RandomEvaluator(options.random_seed));
      }
      return std::unique_ptr<FormatEvaluatorInterface>(new RandomEvaluator());
    case EvaluatorType::kRoundRobin:
      return std::unique_ptr<FormatEvaluatorInterface>(
          new RoundRobinEvaluator());
    case EvaluatorType::kAdaptive: {
      CHECK(bandwidth_meter);
      std::unique_ptr<AdaptiveEvaluator> evaluator(new AdaptiveEvaluator(
          bandwidth_meter, options.max_initial_bitrate,
          options.min_duration_for_quality_increase,
          options.max_duration_for_quality_decrease,
          options.min_duration_to_retain_after_discard,
          options.bandwidth_fraction));
      evaluator->set_listener(listener);
      return std::move(evaluator);
    }
  }
  NOTREACHED();
  return nullptr;
}

}  // namespace chunk
}  // namespace dashabr
