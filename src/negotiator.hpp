#pragma once

#include "types.hpp"

namespace negotiate {

// Clamp to caps and compose the -vf chain (flips first, then scale/custom).
ResolutionInfo determine_resolution(int width, int height,
                                    const VideoConfig &cfg);

int clamp_fps(int fps, const VideoConfig &cfg);

// Video honours both max and min bitrate; audio is only capped.
Bitrates clamp_bitrates(int video_kbps, int audio_kbps,
                        const VideoConfig &cfg);

} // namespace negotiate
