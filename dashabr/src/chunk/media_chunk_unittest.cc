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

#include "chunk/media_chunk.h"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/format.h"

using ::testing::Eq;
using ::testing::Ne;

namespace dashabr {
namespace chunk {

TEST(MediaChunkTest, Accessors) {
  util::Format format("sd", "video/mp4", 854, 480, 800000);
  constexpr int64_t kTestStartTime = 1000000;
  constexpr int64_t kTestEndTime = 3000000;
  constexpr int32_t kTestChunkIndex = 3;

  MediaChunk media_chunk(MediaChunk::kTriggerAdaptive, &format,
                         kTestStartTime, kTestEndTime, kTestChunkIndex);

  EXPECT_THAT(media_chunk.trigger(), Eq(MediaChunk::kTriggerAdaptive));
  EXPECT_THAT(media_chunk.start_time_us(), Eq(kTestStartTime));
  EXPECT_THAT(media_chunk.end_time_us(), Eq(kTestEndTime));
  EXPECT_THAT(media_chunk.chunk_index(), Eq(kTestChunkIndex));
  EXPECT_THAT(media_chunk.GetDuration(), Eq(base::TimeDelta::FromSeconds(2)));
}

TEST(MediaChunkTest, HoldsCopyOfFormat) {
  std::unique_ptr<util::Format> format(
      new util::Format("sd", "video/mp4", 854, 480, 800000));

  MediaChunk media_chunk(MediaChunk::kTriggerInitial, format.get(), 0, 0, 0);
  EXPECT_THAT(media_chunk.format(), Ne(format.get()));

  format.reset();
  EXPECT_THAT(media_chunk.format()->GetId(), Eq("sd"));
  EXPECT_THAT(media_chunk.format()->GetBitrate(), Eq(800000));
}

TEST(MediaChunkTest, GetNextChunkIndex) {
  util::Format format("", "", 0, 0, 0);

  constexpr int32_t kTestChunkIndex = 3;

  MediaChunk media_chunk(MediaChunk::kTriggerInitial, &format, 0, 0,
                         kTestChunkIndex);

  EXPECT_THAT(media_chunk.GetNextChunkIndex(), Eq(kTestChunkIndex + 1));
}

TEST(MediaChunkTest, GetPrevChunkIndex) {
  util::Format format("", "", 0, 0, 0);

  constexpr int32_t kTestChunkIndex = 3;

  MediaChunk media_chunk(MediaChunk::kTriggerInitial, &format, 0, 0,
                         kTestChunkIndex);

  EXPECT_THAT(media_chunk.GetPrevChunkIndex(), Eq(kTestChunkIndex - 1));
}

}  // namespace chunk
}  // namespace dashabr
