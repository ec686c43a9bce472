#include <algorithm>
#include <cmath>
#include <cstdio>
#include <keyforge/frame_time.hpp>

namespace keyforge
{

int clamp_fps(float fps)
{
    if (!std::isfinite(fps))
        return 30;
    return std::clamp(static_cast<int>(std::lround(fps)), MIN_FPS, MAX_FPS);
}

float quantize_to_frame(float time, int fps)
{
    if (fps <= 0)
        return time;
    auto f = static_cast<float>(fps);
    return std::round(time * f) / f;
}

int64_t time_to_frame(float time, int fps)
{
    if (fps <= 0 || time <= 0.0f)
        return 0;
    return static_cast<int64_t>(std::llround(static_cast<double>(time) * fps));
}

float frame_to_time(int64_t frame, int fps)
{
    if (fps <= 0)
        return 0.0f;
    return static_cast<float>(frame) / static_cast<float>(fps);
}

std::string format_timecode(float seconds, int fps)
{
    fps                  = std::max(1, fps);
    int64_t total_frames = time_to_frame(std::max(0.0f, seconds), fps);
    int64_t frames       = total_frames % fps;
    int64_t total_secs   = total_frames / fps;
    int64_t secs         = total_secs % 60;
    int64_t minutes      = (total_secs / 60) % 60;
    int64_t hours        = total_secs / 3600;

    char buf[48];
    std::snprintf(buf,
                  sizeof(buf),
                  "%02lld:%02lld:%02lld:%02lld",
                  static_cast<long long>(hours),
                  static_cast<long long>(minutes),
                  static_cast<long long>(secs),
                  static_cast<long long>(frames));
    return buf;
}

}  // namespace keyforge
