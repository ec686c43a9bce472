#pragma once

#include <cstdint>
#include <string>

namespace keyforge
{

inline constexpr int MIN_FPS = 1;
inline constexpr int MAX_FPS = 240;

// Round `fps` to an integer in [MIN_FPS, MAX_FPS].
int clamp_fps(float fps);

// round(t * fps) / fps. Idempotent for times already on a frame boundary.
float quantize_to_frame(float time, int fps);

// Nearest frame index for a time (negative times map to frame 0).
int64_t time_to_frame(float time, int fps);

float frame_to_time(int64_t frame, int fps);

// "HH:MM:SS:FF" for a non-negative time at the given frame rate.
std::string format_timecode(float seconds, int fps);

}  // namespace keyforge
