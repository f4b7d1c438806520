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

#include "trace_bandwidth_meter.h"

#include "base/logging.h"

namespace dashabr {
namespace simulator {

namespace {
constexpr int64_t kMicrosecondsPerSecond = 1000000;
}  // namespace

TraceBandwidthMeter::TraceBandwidthMeter(const std::vector<int64_t>& trace,
                                         base::TimeDelta step_duration)
    : trace_(trace), step_duration_(step_duration) {
  CHECK(!trace_.empty());
  CHECK_GT(step_duration_.InMicroseconds(), 0);
  for (int64_t throughput : trace_) {
    CHECK_GT(throughput, 0);
  }
}

TraceBandwidthMeter::~TraceBandwidthMeter() {}

int64_t TraceBandwidthMeter::GetBitrateEstimate() const {
  return bitrate_estimate_;
}

int64_t TraceBandwidthMeter::ThroughputAt(base::TimeDelta time) const {
  int64_t step = time.InMicroseconds() / step_duration_.InMicroseconds();
  if (step < 0) {
    step = 0;
  }
  if (step >= static_cast<int64_t>(trace_.size())) {
    return trace_.back();
  }
  return trace_[step];
}

base::TimeDelta TraceBandwidthMeter::Download(base::TimeDelta start,
                                              int64_t bits) {
  DCHECK_GE(bits, 0);
  const int64_t step_us = step_duration_.InMicroseconds();
  const int64_t last_step = static_cast<int64_t>(trace_.size()) - 1;

  int64_t now_us = start.InMicroseconds();
  int64_t remaining_bits = bits;
  while (remaining_bits > 0) {
    const int64_t step = now_us / step_us;
    const int64_t throughput = ThroughputAt(base::TimeDelta::FromMicroseconds(
        now_us));
    if (step >= last_step) {
      // The final throughput lasts forever.
      now_us += (remaining_bits * kMicrosecondsPerSecond + throughput - 1) /
                throughput;
      break;
    }
    const int64_t step_end_us = (step + 1) * step_us;
    const int64_t step_bits =
        throughput * (step_end_us - now_us) / kMicrosecondsPerSecond;
    if (remaining_bits <= step_bits) {
      now_us += (remaining_bits * kMicrosecondsPerSecond + throughput - 1) /
                throughput;
      break;
    }
    remaining_bits -= step_bits;
    now_us = step_end_us;
  }

  base::TimeDelta elapsed =
      base::TimeDelta::FromMicroseconds(now_us) - start;
  if (elapsed > base::TimeDelta()) {
    bitrate_estimate_ =
        bits * kMicrosecondsPerSecond / elapsed.InMicroseconds();
    VLOG(2) << "Downloaded " << bits << " bits in "
            << elapsed.InMilliseconds() << "ms, estimate " << bitrate_estimate_;
  }
  return elapsed;
}

}  // namespace simulator
}  // namespace dashabr
