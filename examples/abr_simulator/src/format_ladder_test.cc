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

#include "gtest/gtest.h"

namespace dashabr {
namespace simulator {

TEST(FormatLadderTest, ParsesAndSortsLadder) {
  std::vector<util::Format> formats;
  ASSERT_TRUE(ParseFormatLadder(
      "sd:800000:640x360, hd:3000000:1280x720,fhd:6000000:1920x1080",
      "video/mp4", &formats));
  ASSERT_EQ(3u, formats.size());

  EXPECT_EQ("fhd", formats[0].GetId());
  EXPECT_EQ(6000000, formats[0].GetBitrate());
  EXPECT_EQ(1920, formats[0].GetWidth());
  EXPECT_EQ(1080, formats[0].GetHeight());
  EXPECT_EQ("video/mp4", formats[0].GetMimeType());

  EXPECT_EQ("hd", formats[1].GetId());
  EXPECT_EQ("sd", formats[2].GetId());
  EXPECT_EQ(360, formats[2].GetHeight());
}

TEST(FormatLadderTest, RejectsBadLadders) {
  std::vector<util::Format> formats;
  formats.push_back(util::Format("keep", "video/mp4", 640, 360, 500000));

  EXPECT_FALSE(ParseFormatLadder("", "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("sd:800000", "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder(":800000:640x360", "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("sd:fast:640x360", "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("sd:0:640x360", "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("sd:800000:640", "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("sd:800000:640x0", "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("sd:800000:640x360,sd:900000:854x480",
                                 "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("a:800000:640x360,b:800000:854x480",
                                 "video/mp4", &formats));
  EXPECT_FALSE(ParseFormatLadder("a:800000:640x360,b:300000:426x240,"
                                 "c:800000:854x480",
                                 "video/mp4", &formats));

  ASSERT_EQ(1u, formats.size());
  EXPECT_EQ("keep", formats[0].GetId());
}

TEST(FormatLadderTest, ParsesThroughputTrace) {
  std::vector<int64_t> trace;
  ASSERT_TRUE(ParseThroughputTrace("1000000, 2500000,10000000000", &trace));
  ASSERT_EQ(3u, trace.size());
  EXPECT_EQ(1000000, trace[0]);
  EXPECT_EQ(2500000, trace[1]);
  EXPECT_EQ(10000000000, trace[2]);

  EXPECT_FALSE(ParseThroughputTrace("", &trace));
  EXPECT_FALSE(ParseThroughputTrace("1000,-5", &trace));
  EXPECT_FALSE(ParseThroughputTrace("1000,0", &trace));
  EXPECT_FALSE(ParseThroughputTrace("1000,1k", &trace));
  EXPECT_EQ(3u, trace.size());
}

}  // namespace simulator
}  // namespace dashabr
