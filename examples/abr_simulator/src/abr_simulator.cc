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

#include <inttypes.h>

#include <iostream>
#include <memory>
#include <vector>

#include <gflags/gflags.h>

#include "base/at_exit.h"
#include "base/command_line.h"
#include "base/logging.h"
#include "base/strings/stringprintf.h"
#include "base/time/time.h"
#include "chunk/format_evaluator_factory.h"
#include "evaluator_event_logger.h"
#include "format_ladder.h"
#include "playback_simulator.h"
#include "trace_bandwidth_meter.h"
#include "util/format.h"

DEFINE_string(evaluator,
              "adaptive",
              "Format evaluator: fixed, random, roundrobin or adaptive");
DEFINE_string(formats,
              "1080p:6000000:1920x1080,720p:3000000:1280x720,"
              "480p:1500000:854x480,360p:800000:640x360,240p:400000:426x240",
              "Comma separated id:bitrate:WIDTHxHEIGHT format ladder");
DEFINE_string(mime_type, "video/mp4", "Mime type given to every format");
DEFINE_string(trace,
              "5000000,5000000,5000000,2000000,2000000,1000000,1000000,"
              "4000000,8000000,8000000",
              "Comma separated network throughputs in bits per second");
DEFINE_int32(trace_step_ms, 5000, "Duration of each throughput in --trace");
DEFINE_int32(chunk_duration_ms, 2000, "Media duration of every chunk");
DEFINE_int32(chunk_count, 150, "Number of chunks in the presentation");
DEFINE_int32(max_buffer_ms, 30000, "Maximum buffered media duration");

DEFINE_int32(fixed_height, 0, "Pixel height for --evaluator=fixed, 0 for the "
                              "lowest quality");
DEFINE_int64(random_seed, -1, "Seed for --evaluator=random, negative to seed "
                              "from the system");
DEFINE_int32(max_initial_bitrate, 800000,
             "Bitrate assumed by --evaluator=adaptive before any estimate");
DEFINE_int32(min_duration_for_quality_increase_ms, 10000,
             "Buffer required before switching up");
DEFINE_int32(max_duration_for_quality_decrease_ms, 25000,
             "Buffer above which switching down is deferred");
DEFINE_int32(min_duration_to_retain_after_discard_ms, 25000,
             "Buffer kept when discarding to switch up");
DEFINE_double(bandwidth_fraction, 0.75,
              "Fraction of the estimated bandwidth considered usable");

// Consumed by base logging through base::CommandLine.
DEFINE_int32(v, 0, "Verbose logging level");
DEFINE_string(vmodule, "", "Per module verbose logging levels");

namespace {
void PrintReport(const dashabr::simulator::SimulationResult& result) {
  std::cout << base::StringPrintf(
      "evaluator:        %s\n"
      "downloaded:       %d chunks\n"
      "discarded:        %d chunks\n"
      "played:           %d chunks\n"
      "switches:         %d\n"
      "stalls:           %d (%" PRId64 " ms)\n"
      "startup delay:    %" PRId64 " ms\n"
      "session duration: %" PRId64 " ms\n"
      "average bitrate:  %" PRId64 " bps\n",
      FLAGS_evaluator.c_str(), result.chunks_downloaded,
      result.chunks_discarded, result.chunks_played, result.format_switches,
      result.stall_count, result.stall_duration.InMilliseconds(),
      result.startup_delay.InMilliseconds(),
      result.session_duration.InMilliseconds(), result.average_bitrate);
  for (const auto& entry : result.chunks_per_format) {
    std::cout << base::StringPrintf("  %-14s  %d chunks\n",
                                    entry.first.c_str(), entry.second);
  }
}
}  // namespace

int main(int argc, char** argv) {
  base::AtExitManager exit_manager;
  base::CommandLine::Init(argc, argv);

  logging::LoggingSettings logging_settings;
  logging::InitLogging(logging_settings);

  gflags::ParseCommandLineFlags(&argc, &argv, true);

  using dashabr::chunk::EvaluatorType;
  using dashabr::chunk::FormatEvaluatorOptions;

  EvaluatorType type;
  if (!dashabr::chunk::ParseEvaluatorType(FLAGS_evaluator, &type)) {
    LOG(ERROR) << "Unknown --evaluator " << FLAGS_evaluator;
    return 1;
  }

  std::vector<dashabr::util::Format> formats;
  if (!dashabr::simulator::ParseFormatLadder(FLAGS_formats, FLAGS_mime_type,
                                             &formats)) {
    LOG(ERROR) << "Invalid --formats";
    return 1;
  }

  std::vector<int64_t> trace;
  if (!dashabr::simulator::ParseThroughputTrace(FLAGS_trace, &trace)) {
    LOG(ERROR) << "Invalid --trace";
    return 1;
  }

  if (FLAGS_trace_step_ms <= 0 || FLAGS_chunk_duration_ms <= 0 ||
      FLAGS_chunk_count < 0 || FLAGS_max_buffer_ms <= 0) {
    LOG(ERROR) << "Durations must be positive";
    return 1;
  }

  if (FLAGS_bandwidth_fraction <= 0) {
    LOG(ERROR) << "--bandwidth_fraction must be positive";
    return 1;
  }

  FormatEvaluatorOptions options;
  options.fixed_height = FLAGS_fixed_height;
  if (FLAGS_random_seed >= 0) {
    options.has_random_seed = true;
    options.random_seed = static_cast<uint32_t>(FLAGS_random_seed);
  }
  options.max_initial_bitrate = FLAGS_max_initial_bitrate;
  options.min_duration_for_quality_increase =
      base::TimeDelta::FromMilliseconds(
          FLAGS_min_duration_for_quality_increase_ms);
  options.max_duration_for_quality_decrease =
      base::TimeDelta::FromMilliseconds(
          FLAGS_max_duration_for_quality_decrease_ms);
  options.min_duration_to_retain_after_discard =
      base::TimeDelta::FromMilliseconds(
          FLAGS_min_duration_to_retain_after_discard_ms);
  options.bandwidth_fraction = static_cast<float>(FLAGS_bandwidth_fraction);

  dashabr::simulator::TraceBandwidthMeter bandwidth_meter(
      trace, base::TimeDelta::FromMilliseconds(FLAGS_trace_step_ms));
  dashabr::simulator::EvaluatorEventLogger event_logger;
  std::unique_ptr<dashabr::chunk::FormatEvaluatorInterface> evaluator =
      dashabr::chunk::CreateFormatEvaluator(type, options, &bandwidth_meter,
                                            &event_logger);

  dashabr::simulator::SimulationConfig config;
  config.chunk_duration =
      base::TimeDelta::FromMilliseconds(FLAGS_chunk_duration_ms);
  config.chunk_count = FLAGS_chunk_count;
  config.max_buffer = base::TimeDelta::FromMilliseconds(FLAGS_max_buffer_ms);

  dashabr::simulator::PlaybackSimulator simulator(config, formats,
                                                  &bandwidth_meter,
                                                  evaluator.get());
  dashabr::simulator::SimulationResult result = simulator.Run();

  PrintReport(result);
  if (type == EvaluatorType::kAdaptive) {
    std::cout << base::StringPrintf(
        "deferred:         %d up, %d down\n"
        "discard requests: %d\n",
        event_logger.deferred_increases(), event_logger.deferred_decreases(),
        event_logger.discard_requests());
  }

  return 0;
}
