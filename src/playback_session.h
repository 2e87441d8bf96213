/*
 * Playback session context: one per active session.  Owns the current
 * stitch parameters and per-side color state, and knows which media
 * source feeds each side.  Parameter and color updates replace values
 * wholesale; render and capture code only ever reads snapshots.
 */

#ifndef DUOSTITCH_PLAYBACK_SESSION_H
#define DUOSTITCH_PLAYBACK_SESSION_H

#include <string>

#include "frame_capture.h"
#include "panorama_scene.h"
#include "session_config.h"

class MediaSource;

class PlaybackSession {
public:
    explicit PlaybackSession(const SessionConfig &cfg);

    /* Pass the same source twice for a stacked stream. */
    void setSources(MediaSource *left, MediaSource *right);
    MediaSource  *source(Side side) const;
    TextureLayout layout() const;
    bool hasSources() const { return left_src != nullptr && right_src != nullptr; }

    const CameraIntrinsics &intrinsics(Side side) const;
    const StitchParameters &parameters() const { return params; }
    const ColorCorrection  &color(Side side) const;

    /* Recalibration: validates and swaps in a complete parameter set. */
    bool replaceParameters(const StitchParameters &p, std::string *reason);
    void replaceColor(Side side, const ColorCorrection &cc);
    bool setBlendWidth(float width);

    RenderKey      renderKey() const;
    SyncOptions    syncOptions() const { return cfg.sync; }
    CaptureRequest captureRequest(double time_s) const;

    /* Explicit frame time if configured, else a fraction of `duration_s`. */
    double captureTime(double duration_s) const;

private:
    SessionConfig    cfg;
    StitchParameters params;
    ColorCorrection  left_color, right_color;
    MediaSource     *left_src;
    MediaSource     *right_src;
};

#endif
