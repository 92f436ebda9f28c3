#include "capture/bounded_buffer.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using capture::BoundedBuffer;

// NOLINTNEXTLINE
TEST(BoundedBuffer, KeepsEverythingWithinCapacity) {
  BoundedBuffer buffer(8);
  EXPECT_EQ(buffer.Append("abc"), 3u);
  EXPECT_EQ(buffer.Append("defgh"), 5u);
  EXPECT_EQ(buffer.Data(), "abcdefgh");
  EXPECT_FALSE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, KeepsPrefixAndFlagsTruncation) {
  BoundedBuffer buffer(4);
  EXPECT_EQ(buffer.Append("abcdef"), 4u);
  EXPECT_EQ(buffer.Append("g"), 0u);
  EXPECT_EQ(buffer.Data(), "abcd");
  EXPECT_TRUE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, EmptyAppendNeverTruncates) {
  BoundedBuffer buffer(0);
  EXPECT_EQ(buffer.Append(""), 0u);
  EXPECT_FALSE(buffer.Truncated());
  EXPECT_EQ(buffer.Append("x"), 0u);
  EXPECT_TRUE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, BinaryData) {
  BoundedBuffer buffer(16);
  const char data[] = {'a', '\0', 'b'};
  EXPECT_EQ(buffer.Append(data, sizeof(data)), 3u);
  EXPECT_EQ(buffer.Data(), std::string(data, sizeof(data)));
}

}  // namespace
