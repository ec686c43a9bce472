#include <gtest/gtest.h>

#include <cmath>
#include <keyforge/frame_time.hpp>

using namespace keyforge;

// ─── Frame rate ──────────────────────────────────────────────────────────────

TEST(FrameRate, RoundsAndClamps)
{
    EXPECT_EQ(clamp_fps(29.6f), 30);
    EXPECT_EQ(clamp_fps(0.0f), MIN_FPS);
    EXPECT_EQ(clamp_fps(-10.0f), MIN_FPS);
    EXPECT_EQ(clamp_fps(1000.0f), MAX_FPS);
    EXPECT_EQ(clamp_fps(NAN), 30);
}

// ─── Quantization ────────────────────────────────────────────────────────────

TEST(FrameQuantize, SnapsToNearestFrame)
{
    EXPECT_FLOAT_EQ(quantize_to_frame(0.51f, 10), 0.5f);
    EXPECT_FLOAT_EQ(quantize_to_frame(0.56f, 10), 0.6f);
    EXPECT_FLOAT_EQ(quantize_to_frame(1.0f / 30.0f + 0.001f, 30), 1.0f / 30.0f);
}

TEST(FrameQuantize, IsIdempotent)
{
    for (int fps : {12, 24, 30, 60})
    {
        for (float t : {0.0f, 0.137f, 1.5f, 3.333f, 12.01f})
        {
            float once = quantize_to_frame(t, fps);
            EXPECT_EQ(quantize_to_frame(once, fps), once) << "fps=" << fps << " t=" << t;
        }
    }
}

// ─── Frame index ─────────────────────────────────────────────────────────────

TEST(FrameIndex, TimeToFrame)
{
    EXPECT_EQ(time_to_frame(0.0f, 30), 0);
    EXPECT_EQ(time_to_frame(-1.0f, 30), 0);
    EXPECT_EQ(time_to_frame(1.0f, 30), 30);
    EXPECT_EQ(time_to_frame(0.5f, 24), 12);
}

TEST(FrameIndex, FrameToTime)
{
    EXPECT_FLOAT_EQ(frame_to_time(30, 30), 1.0f);
    EXPECT_FLOAT_EQ(frame_to_time(12, 24), 0.5f);
    EXPECT_FLOAT_EQ(frame_to_time(0, 60), 0.0f);
}

// ─── Timecode ────────────────────────────────────────────────────────────────

TEST(Timecode, FormatsHoursMinutesSecondsFrames)
{
    EXPECT_EQ(format_timecode(0.0f, 30), "00:00:00:00");
    EXPECT_EQ(format_timecode(1.5f, 30), "00:00:01:15");
    EXPECT_EQ(format_timecode(61.0f, 24), "00:01:01:00");
    EXPECT_EQ(format_timecode(3600.0f, 30), "01:00:00:00");
}

TEST(Timecode, NegativeTimeIsZero)
{
    EXPECT_EQ(format_timecode(-3.0f, 30), "00:00:00:00");
}
