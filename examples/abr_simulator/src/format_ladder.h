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

#ifndef FORMAT_LADDER_H_
#define FORMAT_LADDER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "util/format.h"

namespace dashabr {
namespace simulator {

// Parses a comma separated list of "id:bitrate:WIDTHxHEIGHT" entries, for
// example "hd:3000000:1280x720,sd:800000:640x360". Every format gets
// |mime_type|. On success |formats| is replaced with the parsed formats
// ordered by decreasing bitrate. Returns false, leaving |formats| untouched,
// if an entry is malformed, an id is repeated or the list is empty.
bool ParseFormatLadder(const std::string& ladder,
                       const std::string& mime_type,
                       std::vector<util::Format>* formats);

// Parses a comma separated list of throughputs in bits per second. Every
// value must be positive. Returns false, leaving |throughputs| untouched, on
// any error.
bool ParseThroughputTrace(const std::string& trace,
                          std::vector<int64_t>* throughputs);

}  // namespace simulator
}  // namespace dashabr

#endif  // FORMAT_LADDER_H_
