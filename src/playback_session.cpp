#include "playback_session.h"

#include <cstdio>

PlaybackSession::PlaybackSession(const SessionConfig &cfg_in)
    : cfg(cfg_in), params(cfg_in.params),
      left_color(cfg_in.left_color), right_color(cfg_in.right_color),
      left_src(nullptr), right_src(nullptr)
{
}

void PlaybackSession::setSources(MediaSource *left, MediaSource *right)
{
    left_src  = left;
    right_src = right;
}

MediaSource *PlaybackSession::source(Side side) const
{
    return side == Side::Left ? left_src : right_src;
}

TextureLayout PlaybackSession::layout() const
{
    return left_src == right_src ? TextureLayout::Stacked : TextureLayout::Dual;
}

const CameraIntrinsics &PlaybackSession::intrinsics(Side side) const
{
    return side == Side::Left ? cfg.left : cfg.right;
}

const ColorCorrection &PlaybackSession::color(Side side) const
{
    return side == Side::Left ? left_color : right_color;
}

bool PlaybackSession::replaceParameters(const StitchParameters &p,
                                        std::string *reason)
{
    if (!validate_stitch_parameters(p, reason))
        return false;
    params = p;
    return true;
}

void PlaybackSession::replaceColor(Side side, const ColorCorrection &cc)
{
    ColorCorrection clamped = cc;
    clamp_color_correction(&clamped);
    if (side == Side::Left)
        left_color = clamped;
    else
        right_color = clamped;
}

bool PlaybackSession::setBlendWidth(float width)
{
    StitchParameters p = params;
    p.blend_width = width;
    return replaceParameters(p, nullptr);
}

RenderKey PlaybackSession::renderKey() const
{
    RenderKey key;
    key.params      = params;
    key.left_color  = left_color;
    key.right_color = right_color;
    return key;
}

CaptureRequest PlaybackSession::captureRequest(double time_s) const
{
    CaptureRequest req;
    req.time_s           = time_s;
    req.layout           = layout();
    if (req.layout == TextureLayout::Dual)
        req.secondary_offset_s = cfg.sync.offset_s;
    req.left.intrinsics  = cfg.left;
    req.left.color       = left_color;
    req.right.intrinsics = cfg.right;
    req.right.color      = right_color;
    req.timeout_ms       = cfg.capture_timeout_ms;
    return req;
}

double PlaybackSession::captureTime(double duration_s) const
{
    if (cfg.has_frame_time)
        return cfg.frame_time_s;
    double t = default_capture_time(duration_s, cfg.frame_time_percent);
    printf("[session] capture time %.0f s (%.0f%% of %.1f s)\n", t,
           cfg.frame_time_percent * 100.0, duration_s);
    return t;
}
