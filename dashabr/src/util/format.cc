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

#include "util/format.h"

namespace dashabr {

namespace util {

namespace {
constexpr int32_t kMinHdHeight = 720;
constexpr int32_t kMinHdWidth = 1280;
}  // namespace

Format::Format(const std::string& id,
               const std::string& mime_type,
               int32_t width,
               int32_t height,
               int32_t bitrate,
               const std::string& codecs)
    : id_(id),
      mime_type_(mime_type),
      width_(width),
      height_(height),
      bitrate_(bitrate),
      codecs_(codecs) {}

Format::~Format() {}

Format::Format(const Format& other)
    : id_(other.id_),
      mime_type_(other.mime_type_),
      width_(other.width_),
      height_(other.height_),
      bitrate_(other.bitrate_),
      codecs_(other.codecs_) {}

bool Format::operator==(const Format& other) const {
  return id_ == other.id_;
}

bool Format::IsHd() const {
  return height_ >= kMinHdHeight || width_ >= kMinHdWidth;
}

void PrintTo(const Format& format, ::std::ostream* os) {
  *os << "Format[" << format.GetId() << "; mime=" << format.GetMimeType()
      << "; " << format.GetWidth() << "x" << format.GetHeight()
      << "; bitrate=" << format.GetBitrate() << "]";
}

std::ostream& operator<<(std::ostream& os, const Format& format) {
  PrintTo(format, &os);
  return os;
}

}  // namespace util

}  // namespace dashabr
