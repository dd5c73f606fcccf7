#include "bulbtrace/render/frame_buffer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace bulbtrace::render {
namespace {

TEST(FrameBufferTest, RejectsNonPositiveDimensions) {
    EXPECT_THROW(FrameBuffer(0, 4), std::invalid_argument);
    EXPECT_THROW(FrameBuffer(4, -1), std::invalid_argument);

    FrameBuffer frame(2, 2);
    EXPECT_THROW(frame.resize(0, 0), std::invalid_argument);
    EXPECT_EQ(frame.width(), 2);
}

TEST(FrameBufferTest, StartsOpaqueBlack) {
    const FrameBuffer frame(3, 2);
    EXPECT_EQ(frame.width(), 3);
    EXPECT_EQ(frame.height(), 2);
    EXPECT_EQ(frame.pitch_bytes(), 12);
    EXPECT_FALSE(frame.empty());
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) {
            EXPECT_EQ(frame.at(x, y).r, 0);
            EXPECT_EQ(frame.at(x, y).a, 255);
        }
    }
}

TEST(FrameBufferTest, RowsAliasPixels) {
    FrameBuffer frame(4, 3);
    auto row = frame.row(1);
    ASSERT_EQ(row.size(), 4u);
    row[2] = Pixel{10, 20, 30, 255};

    EXPECT_EQ(frame.at(2, 1).g, 20);
    EXPECT_EQ(frame.data()[1 * 4 + 2].b, 30);
}

TEST(FrameBufferTest, ClearAndResize) {
    FrameBuffer frame(2, 2);
    frame.clear(Pixel{1, 2, 3, 255});
    EXPECT_EQ(frame.at(1, 1).r, 1);

    frame.resize(5, 1);
    EXPECT_EQ(frame.width(), 5);
    EXPECT_EQ(frame.height(), 1);
    EXPECT_EQ(frame.at(4, 0).r, 0);
}

TEST(FrameBufferTest, ToPixelClampsAndRounds) {
    const Pixel p = to_pixel({-0.5f, 0.5f, 2.0f});
    EXPECT_EQ(p.r, 0);
    EXPECT_EQ(p.g, 128);
    EXPECT_EQ(p.b, 255);
    EXPECT_EQ(p.a, 255);
}

TEST(FrameBufferTest, DefaultIsEmpty) {
    const FrameBuffer frame;
    EXPECT_TRUE(frame.empty());
    EXPECT_EQ(frame.width(), 0);
}

} // namespace
} // namespace bulbtrace::render
