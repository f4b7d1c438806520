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

#include "playback_simulator.h"

#include <vector>

#include "chunk/adaptive_evaluator.h"
#include "chunk/fixed_evaluator.h"
#include "chunk/round_robin_evaluator.h"
#include "evaluator_event_logger.h"
#include "gtest/gtest.h"
#include "trace_bandwidth_meter.h"

namespace dashabr {
namespace simulator {

namespace {
std::vector<util::Format> MakeFormats(int32_t high_bitrate,
                                      int32_t low_bitrate) {
  return std::vector<util::Format>{
      util::Format("hi", "video/mp4", 1280, 720, high_bitrate),
      util::Format("lo", "video/mp4", 640, 360, low_bitrate),
  };
}
}  // namespace

TEST(PlaybackSimulatorTest, SmoothPlayback) {
  TraceBandwidthMeter meter({10000000}, base::TimeDelta::FromSeconds(1));
  chunk::FixedEvaluator evaluator;

  SimulationConfig config;
  config.chunk_count = 10;
  PlaybackSimulator simulator(config, MakeFormats(3000000, 500000), &meter,
                              &evaluator);
  SimulationResult result = simulator.Run();

  EXPECT_EQ(10, result.chunks_downloaded);
  EXPECT_EQ(10, result.chunks_played);
  EXPECT_EQ(0, result.chunks_discarded);
  EXPECT_EQ(0, result.format_switches);
  EXPECT_EQ(0, result.stall_count);
  EXPECT_EQ(base::TimeDelta(), result.stall_duration);
  // 1000000 bits at 10000000 bps.
  EXPECT_EQ(base::TimeDelta::FromMilliseconds(100), result.startup_delay);
  EXPECT_EQ(base::TimeDelta::FromMilliseconds(20100), result.session_duration);
  EXPECT_EQ(500000, result.average_bitrate);
  EXPECT_EQ(10, result.chunks_per_format["lo"]);
}

TEST(PlaybackSimulatorTest, StallsWhenDownloadsAreSlow) {
  TraceBandwidthMeter meter({1000000}, base::TimeDelta::FromSeconds(1));
  chunk::FixedEvaluator evaluator(720);

  SimulationConfig config;
  config.chunk_count = 3;
  PlaybackSimulator simulator(config, MakeFormats(3000000, 500000), &meter,
                              &evaluator);
  SimulationResult result = simulator.Run();

  // Every chunk takes 6s to fetch and plays for 2s.
  EXPECT_EQ(3, result.chunks_played);
  EXPECT_EQ(base::TimeDelta::FromSeconds(6), result.startup_delay);
  EXPECT_EQ(2, result.stall_count);
  EXPECT_EQ(base::TimeDelta::FromSeconds(8), result.stall_duration);
  EXPECT_EQ(base::TimeDelta::FromSeconds(20), result.session_duration);
  EXPECT_EQ(3000000, result.average_bitrate);
}

TEST(PlaybackSimulatorTest, WaitsWhenBufferIsFull) {
  TraceBandwidthMeter meter({100000000}, base::TimeDelta::FromSeconds(1));
  chunk::FixedEvaluator evaluator;

  SimulationConfig config;
  config.chunk_count = 20;
  config.max_buffer = base::TimeDelta::FromSeconds(6);
  PlaybackSimulator simulator(config, MakeFormats(3000000, 500000), &meter,
                              &evaluator);
  SimulationResult result = simulator.Run();

  EXPECT_EQ(20, result.chunks_downloaded);
  EXPECT_EQ(20, result.chunks_played);
  EXPECT_EQ(0, result.stall_count);
  // Playback, not the network, sets the pace.
  EXPECT_GE(result.session_duration, base::TimeDelta::FromSeconds(40));
}

TEST(PlaybackSimulatorTest, RoundRobinSwitches) {
  TraceBandwidthMeter meter({100000000}, base::TimeDelta::FromSeconds(1));
  chunk::RoundRobinEvaluator evaluator;

  SimulationConfig config;
  config.chunk_count = 12;
  PlaybackSimulator simulator(config, MakeFormats(3000000, 500000), &meter,
                              &evaluator);
  SimulationResult result = simulator.Run();

  // lo, lo, lo, hi, hi, hi, lo, ...
  EXPECT_EQ(3, result.format_switches);
  EXPECT_EQ(6, result.chunks_per_format["lo"]);
  EXPECT_EQ(6, result.chunks_per_format["hi"]);
  EXPECT_EQ(1750000, result.average_bitrate);
}

TEST(PlaybackSimulatorTest, AdaptiveSwitchesUp) {
  std::vector<int64_t> trace(10, 2000000);
  trace.push_back(20000000);
  TraceBandwidthMeter meter(trace, base::TimeDelta::FromSeconds(1));
  chunk::AdaptiveEvaluator evaluator(&meter);
  EvaluatorEventLogger event_logger;
  evaluator.set_listener(&event_logger);

  SimulationConfig config;
  config.chunk_count = 60;
  PlaybackSimulator simulator(config, MakeFormats(4000000, 1000000), &meter,
                              &evaluator);
  SimulationResult result = simulator.Run();

  // The throughput jump is only measured by the first download after it.
  EXPECT_EQ(1, result.format_switches);
  EXPECT_EQ(11, result.chunks_per_format["lo"]);
  EXPECT_EQ(49, result.chunks_per_format["hi"]);
  EXPECT_EQ(0, result.chunks_discarded);
  EXPECT_EQ(0, result.stall_count);
  EXPECT_EQ(0, event_logger.discard_requests());
}

TEST(PlaybackSimulatorTest, AdaptiveDiscardsLowQualityBuffer) {
  std::vector<int64_t> trace(20, 4000000);
  trace.push_back(40000000);
  TraceBandwidthMeter meter(trace, base::TimeDelta::FromSeconds(1));
  chunk::AdaptiveEvaluator evaluator(&meter);
  EvaluatorEventLogger event_logger;
  evaluator.set_listener(&event_logger);

  SimulationConfig config;
  config.chunk_count = 80;
  config.max_buffer = base::TimeDelta::FromSeconds(40);
  PlaybackSimulator simulator(config, MakeFormats(4000000, 1000000), &meter,
                              &evaluator);
  SimulationResult result = simulator.Run();

  EXPECT_GT(result.chunks_discarded, 0);
  EXPECT_GT(event_logger.discard_requests(), 0);
  EXPECT_EQ(result.chunks_downloaded,
            result.chunks_played + result.chunks_discarded);
  EXPECT_EQ(80, result.chunks_played);
  EXPECT_EQ(0, result.stall_count);
}

}  // namespace simulator
}  // namespace dashabr
