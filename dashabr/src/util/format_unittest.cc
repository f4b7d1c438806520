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

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace dashabr {

namespace util {

TEST(FormatTest, ConstructorArgs) {
  Format f("id1", "video/mp4", 320, 480, 6000000, "avc1.4d401e");

  EXPECT_EQ("id1", f.GetId());
  EXPECT_EQ("video/mp4", f.GetMimeType());
  EXPECT_EQ(320, f.GetWidth());
  EXPECT_EQ(480, f.GetHeight());
  EXPECT_EQ(6000000, f.GetBitrate());
  EXPECT_EQ("avc1.4d401e", f.GetCodecs());

  Format copy(f);
  EXPECT_EQ("id1", copy.GetId());
  EXPECT_EQ(480, copy.GetHeight());
  EXPECT_EQ(6000000, copy.GetBitrate());
}

TEST(FormatTest, FormatEquality) {
  Format f1("id1", "video/mp4", 320, 480, 5000000);
  Format f2("id2", "video/mp4", 320, 480, 6000000);
  Format f3("id1", "video/webm", 640, 360, 6000000, "vp9");

  EXPECT_FALSE(f1 == f2);
  EXPECT_TRUE(f1 != f2);
  EXPECT_TRUE(f1 == f3);
  EXPECT_FALSE(f1 != f3);
}

TEST(FormatTest, IsHd) {
  EXPECT_TRUE(Format("a", "video/mp4", 1280, 720, 1).IsHd());
  EXPECT_TRUE(Format("b", "video/mp4", 1920, 1080, 1).IsHd());
  EXPECT_TRUE(Format("c", "video/mp4", 1280, 536, 1).IsHd());
  EXPECT_TRUE(Format("d", "video/mp4", 960, 720, 1).IsHd());
  EXPECT_FALSE(Format("e", "video/mp4", 854, 480, 1).IsHd());
  EXPECT_FALSE(Format("f", "video/mp4", 1279, 719, 1).IsHd());
  EXPECT_FALSE(Format("g", "audio/mp4", -1, -1, 1).IsHd());
}

TEST(FormatTest, DecreasingBandwidthComparator) {
  std::vector<Format> formats{
      Format("low", "video/mp4", 640, 360, 300000),
      Format("high", "video/mp4", 1280, 720, 2000000),
      Format("mid", "video/mp4", 854, 480, 800000),
  };

  std::sort(formats.begin(), formats.end(),
            Format::DecreasingBandwidthComparator());

  EXPECT_EQ("high", formats[0].GetId());
  EXPECT_EQ("mid", formats[1].GetId());
  EXPECT_EQ("low", formats[2].GetId());
}

TEST(FormatTest, StreamOutput) {
  std::ostringstream os;
  os << Format("b", "video/mp4", 854, 480, 800000);
  EXPECT_EQ("Format[b; mime=video/mp4; 854x480; bitrate=800000]", os.str());
}

}  // namespace util

}  // namespace dashabr
