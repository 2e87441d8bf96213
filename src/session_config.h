/*
 * Session configuration: lens intrinsics for both cameras, stitch
 * parameters, color state, sync and capture settings, read from one
 * JSON document.  Lens intrinsics are given in pixels and normalised on
 * load.
 */

#ifndef DUOSTITCH_SESSION_CONFIG_H
#define DUOSTITCH_SESSION_CONFIG_H

#include <string>

#include <QByteArray>

#include "color_model.h"
#include "fisheye_model.h"
#include "panorama_scene.h"
#include "stitch_config.h"
#include "stitch_error.h"
#include "stream_sync.h"

struct SessionConfig {
    CameraIntrinsics left, right;
    StitchParameters params;
    ColorCorrection  left_color, right_color;
    SyncOptions      sync;

    bool   has_frame_time     = false;
    double frame_time_s       = 0.0;
    double frame_time_percent = DEFAULT_FRAME_PERCENT;
    int    capture_timeout_ms = CAPTURE_TIMEOUT_MS;
};

bool parse_session_config(const QByteArray &json, SessionConfig *out,
                          StitchError *err);
bool load_session_config(const char *path, SessionConfig *out, StitchError *err);

void print_session_config(const SessionConfig &cfg);

/* Newest *.json in `dir` by name, or "" when there is none. */
std::string find_newest_session(const char *dir);

/* Accepts seconds ("12.5"), MM:SS or HH:MM:SS. */
bool parse_timestamp(const std::string &text, double *seconds);

/* M:SS, or H:MM:SS from one hour on. */
std::string format_timestamp(double seconds);

/* Whole seconds at `percent` of the duration, or a fixed early frame
 * when the duration is unknown. */
double default_capture_time(double duration_s, double percent);

#endif
