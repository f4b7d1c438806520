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

#ifndef DASHABR_UPSTREAM_BANDWIDTH_METER_H_
#define DASHABR_UPSTREAM_BANDWIDTH_METER_H_

#include <cstdint>

#include "base/macros.h"

namespace dashabr {
namespace upstream {

// Source of throughput estimates for the adaptive evaluator. The evaluator
// samples the meter once per evaluation and never takes ownership of it; the
// meter must outlive every evaluator it is handed to.
class BandwidthMeterInterface {
 public:
  // Returned until the meter has observed enough traffic to say anything.
  constexpr static int64_t kNoEstimate = -1;

  virtual ~BandwidthMeterInterface() {}

  // Current throughput in bits per second, or kNoEstimate.
  virtual int64_t GetBitrateEstimate() const = 0;

 protected:
  BandwidthMeterInterface() {}

 private:
  DISALLOW_COPY_AND_ASSIGN(BandwidthMeterInterface);
};

}  // namespace upstream
}  // namespace dashabr

#endif  // DASHABR_UPSTREAM_BANDWIDTH_METER_H_
