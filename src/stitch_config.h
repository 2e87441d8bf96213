/*
 * Compile-time configuration shared by the duostitch library and tools.
 */

#ifndef DUOSTITCH_STITCH_CONFIG_H
#define DUOSTITCH_STITCH_CONFIG_H

/* ========================================================================
 * Plane geometry
 * ======================================================================== */

#define PLANE_WIDTH             1.0f
#define PLANE_ASPECT            (16.0f / 9.0f)
#define PLANE_HEIGHT            (PLANE_WIDTH / PLANE_ASPECT)

/* ========================================================================
 * Viewer camera
 * ======================================================================== */

#define VIEWER_FOV_DEG          75.0f
#define VIEWER_MIN_FOV_DEG      30.0f
#define VIEWER_MAX_FOV_DEG      75.0f
#define VIEWER_NEAR             0.01f
#define VIEWER_FAR              5.0f
#define VIEWER_PAN_SENSITIVITY  0.005f
#define VIEWER_ZOOM_SENSITIVITY 0.05f
#define VIEWER_YAW_RANGE_DEG    140.0f
#define VIEWER_YAW_CENTER_DEG   45.0f
#define VIEWER_PITCH_RANGE_DEG  20.0f
#define VIEWER_PITCH_CENTER_DEG (-10.0f)
#define DEFAULT_AXIS_OFFSET     0.7f

/* ========================================================================
 * Calibration capture
 * ======================================================================== */

#define CAPTURE_WIDTH           1920
#define CAPTURE_HEIGHT          1080
#define CAPTURE_SETTLE_FRAMES   10
#define CAPTURE_SETTLE_DELAY_MS 100
#define CAPTURE_TIMEOUT_MS      5000
#define CAPTURE_CAMERA_DISTANCE 1.0f
#define DEFAULT_FRAME_PERCENT   0.1
#define FALLBACK_FRAME_TIME_S   (100.0 / 30.0)

/* ========================================================================
 * Synchronisation
 * ======================================================================== */

#define FRAME_DRIFT_THRESHOLD_MS 500
#define POLL_DRIFT_THRESHOLD_MS  50

/* ========================================================================
 * Playback / recording
 * ======================================================================== */

#define TIMER_INTERVAL_MS       16
#define FPS_WINDOW              30
#define FPS_PRINT_INTERVAL      2.0
#define RECORD_FPS              30.0
#define LIVE_CAMERA_WIDTH       1920
#define LIVE_CAMERA_HEIGHT      2160

#endif
