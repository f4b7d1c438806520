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

#ifndef DASHABR_UTIL_FORMAT_H_
#define DASHABR_UTIL_FORMAT_H_

#include <cstdint>
#include <iostream>
#include <string>

namespace dashabr {

namespace util {

// Describes one encoded variant of a media stream.
class Format {
 public:
  Format(const std::string& id,
         const std::string& mime_type,
         int32_t width,
         int32_t height,
         int32_t bitrate,
         const std::string& codecs = "");
  Format(const Format& other);
  ~Format();

  // Implements equality based on id only.
  bool operator==(const Format& other) const;
  bool operator!=(const Format& other) const { return !(*this == other); }

  int32_t GetBitrate() const { return bitrate_; }

  const std::string& GetCodecs() const { return codecs_; }

  int32_t GetHeight() const { return height_; }

  const std::string& GetId() const { return id_; }

  const std::string& GetMimeType() const { return mime_type_; }

  int32_t GetWidth() const { return width_; }

  // True if either dimension reaches 720p (1280x720).
  bool IsHd() const;

  class DecreasingBandwidthComparator {
   public:
    bool operator()(const Format& lhs, const Format& rhs) const {
      return lhs.GetBitrate() > rhs.GetBitrate();
    }
  };

 private:
  // An identifier for the format.
  std::string id_;

  // The mime type of the format. Can be empty if unknown.
  std::string mime_type_;

  // The width of the video in pixels, or -1 if unknown or not applicable.
  int32_t width_;

  // The height of the video in pixels, or -1 if unknown or not applicable.
  int32_t height_;

  // The average bandwidth in bits per second.
  int32_t bitrate_;

  // The codecs used to decode the format. Can be empty if unknown.
  std::string codecs_;
};

// gmock pretty printer
void PrintTo(const Format& format, ::std::ostream* os);

std::ostream& operator<<(std::ostream& os, const Format& format);

}  // namespace util

}  // namespace dashabr

#endif  // DASHABR_UTIL_FORMAT_H_
