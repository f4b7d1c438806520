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

#include "format_ladder.h"

#include <algorithm>
#include <set>

#include "base/logging.h"
#include "base/strings/string_number_conversions.h"
#include "base/strings/string_split.h"

namespace dashabr {
namespace simulator {

namespace {
bool ParseFormat(const std::string& entry,
                 const std::string& mime_type,
                 std::vector<util::Format>* formats) {
  std::vector<std::string> fields = base::SplitString(
      entry, ":", base::TRIM_WHITESPACE, base::SPLIT_WANT_ALL);
  if (fields.size() != 3 || fields[0].empty()) {
    LOG(ERROR) << "Expected id:bitrate:WIDTHxHEIGHT, got \"" << entry << "\"";
    return false;
  }

  int bitrate;
  if (!base::StringToInt(fields[1], &bitrate) || bitrate <= 0) {
    LOG(ERROR) << "Bad bitrate in \"" << entry << "\"";
    return false;
  }

  std::vector<std::string> dimensions = base::SplitString(
      fields[2], "x", base::TRIM_WHITESPACE, base::SPLIT_WANT_ALL);
  int width;
  int height;
  if (dimensions.size() != 2 || !base::StringToInt(dimensions[0], &width) ||
      !base::StringToInt(dimensions[1], &height) || width <= 0 ||
      height <= 0) {
    LOG(ERROR) << "Bad resolution in \"" << entry << "\"";
    return false;
  }

  formats->push_back(
      util::Format(fields[0], mime_type, width, height, bitrate));
  return true;
}
}  // namespace

bool ParseFormatLadder(const std::string& ladder,
                       const std::string& mime_type,
                       std::vector<util::Format>* formats) {
  std::vector<util::Format> parsed;
  std::set<std::string> ids;
  for (const std::string& entry : base::SplitString(
           ladder, ",", base::TRIM_WHITESPACE, base::SPLIT_WANT_NONEMPTY)) {
    if (!ParseFormat(entry, mime_type, &parsed)) {
      return false;
    }
    if (!ids.insert(parsed.back().GetId()).second) {
      LOG(ERROR) << "Duplicate format id " << parsed.back().GetId();
      return false;
    }
  }

  if (parsed.empty()) {
    LOG(ERROR) << "No formats in ladder";
    return false;
  }

  std::stable_sort(parsed.begin(), parsed.end(),
                   util::Format::DecreasingBandwidthComparator());
  for (size_t i = 1; i < parsed.size(); i++) {
    if (parsed[i].GetBitrate() == parsed[i - 1].GetBitrate()) {
      LOG(ERROR) << "Formats " << parsed[i - 1].GetId() << " and "
                 << parsed[i].GetId() << " share bitrate "
                 << parsed[i].GetBitrate();
      return false;
    }
  }
  formats->swap(parsed);
  return true;
}

bool ParseThroughputTrace(const std::string& trace,
                          std::vector<int64_t>* throughputs) {
  std::vector<int64_t> parsed;
  for (const std::string& value : base::SplitString(
           trace, ",", base::TRIM_WHITESPACE, base::SPLIT_WANT_NONEMPTY)) {
    int64_t throughput;
    if (!base::StringToInt64(value, &throughput) || throughput <= 0) {
      LOG(ERROR) << "Bad throughput \"" << value << "\"";
      return false;
    }
    parsed.push_back(throughput);
  }

  if (parsed.empty()) {
    LOG(ERROR) << "Empty throughput trace";
    return false;
  }

  throughputs->swap(parsed);
  return true;
}

}  // namespace simulator
}  // namespace dashabr
