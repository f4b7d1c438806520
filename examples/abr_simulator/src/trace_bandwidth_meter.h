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

#ifndef TRACE_BANDWIDTH_METER_H_
#define TRACE_BANDWIDTH_METER_H_

#include <cstdint>
#include <vector>

#include "base/time/time.h"
#include "upstream/bandwidth_meter.h"

namespace dashabr {
namespace simulator {

// A bandwidth meter fed by simulated downloads over a piecewise constant
// network trace.
class TraceBandwidthMeter : public upstream::BandwidthMeterInterface {
 public:
  // trace: Throughput in bits per second for each consecutive step of
  //        |step_duration|. The last value holds past the end of the trace.
  //        Must not be empty and every value must be positive.
  TraceBandwidthMeter(const std::vector<int64_t>& trace,
                      base::TimeDelta step_duration);
  ~TraceBandwidthMeter() override;

  // Returns kNoEstimate until the first download completes, then the
  // throughput observed over the most recent download.
  int64_t GetBitrateEstimate() const override;

  // Simulates the download of |bits| starting at |start| (measured from the
  // beginning of the trace) and returns how long it took.
  base::TimeDelta Download(base::TimeDelta start, int64_t bits);

  // The trace throughput at |time|.
  int64_t ThroughputAt(base::TimeDelta time) const;

 private:
  TraceBandwidthMeter(const TraceBandwidthMeter& other) = delete;
  TraceBandwidthMeter& operator=(const TraceBandwidthMeter& other) = delete;

  const std::vector<int64_t> trace_;
  const base::TimeDelta step_duration_;

  int64_t bitrate_estimate_ = kNoEstimate;
};

}  // namespace simulator
}  // namespace dashabr

#endif  // TRACE_BANDWIDTH_METER_H_
