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

#include "gtest/gtest.h"

namespace dashabr {
namespace simulator {

namespace {
constexpr int64_t kNoEstimate = upstream::BandwidthMeterInterface::kNoEstimate;
}  // namespace

TEST(TraceBandwidthMeterTest, NoEstimateBeforeFirstDownload) {
  TraceBandwidthMeter meter({1000000}, base::TimeDelta::FromSeconds(1));
  EXPECT_EQ(kNoEstimate, meter.GetBitrateEstimate());
}

TEST(TraceBandwidthMeterTest, ThroughputAt) {
  TraceBandwidthMeter meter({1000000, 2000000, 3000000},
                            base::TimeDelta::FromSeconds(1));
  EXPECT_EQ(1000000, meter.ThroughputAt(base::TimeDelta()));
  EXPECT_EQ(1000000,
            meter.ThroughputAt(base::TimeDelta::FromMilliseconds(999)));
  EXPECT_EQ(2000000, meter.ThroughputAt(base::TimeDelta::FromSeconds(1)));
  EXPECT_EQ(3000000, meter.ThroughputAt(base::TimeDelta::FromSeconds(2)));
  // The last throughput holds past the end of the trace.
  EXPECT_EQ(3000000, meter.ThroughputAt(base::TimeDelta::FromSeconds(100)));
}

TEST(TraceBandwidthMeterTest, DownloadWithinStep) {
  TraceBandwidthMeter meter({1000000, 4000000},
                            base::TimeDelta::FromSeconds(1));
  EXPECT_EQ(base::TimeDelta::FromMilliseconds(500),
            meter.Download(base::TimeDelta(), 500000));
  EXPECT_EQ(1000000, meter.GetBitrateEstimate());
}

TEST(TraceBandwidthMeterTest, DownloadAcrossSteps) {
  TraceBandwidthMeter meter({1000000, 2000000, 4000000},
                            base::TimeDelta::FromSeconds(1));
  // 1000000 bits in the first second, then 1000000 bits at 2000000 bps.
  EXPECT_EQ(base::TimeDelta::FromMilliseconds(1500),
            meter.Download(base::TimeDelta(), 2000000));
  EXPECT_EQ(1333333, meter.GetBitrateEstimate());

  // Starting half way through the second step: 1000000 bits, then 4000000
  // bits at 4000000 bps.
  EXPECT_EQ(base::TimeDelta::FromMilliseconds(1500),
            meter.Download(base::TimeDelta::FromMilliseconds(1500), 5000000));
  EXPECT_EQ(3333333, meter.GetBitrateEstimate());
}

TEST(TraceBandwidthMeterTest, DownloadPastEndOfTrace) {
  TraceBandwidthMeter meter({1000000, 2000000},
                            base::TimeDelta::FromSeconds(1));
  EXPECT_EQ(base::TimeDelta::FromMilliseconds(1500),
            meter.Download(base::TimeDelta::FromSeconds(10), 3000000));
  EXPECT_EQ(2000000, meter.GetBitrateEstimate());
}

TEST(TraceBandwidthMeterTest, EmptyDownloadKeepsEstimate) {
  TraceBandwidthMeter meter({1000000}, base::TimeDelta::FromSeconds(1));
  EXPECT_EQ(base::TimeDelta(), meter.Download(base::TimeDelta(), 0));
  EXPECT_EQ(kNoEstimate, meter.GetBitrateEstimate());
}

}  // namespace simulator
}  // namespace dashabr
