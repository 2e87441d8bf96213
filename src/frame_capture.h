/*
 * Calibration frame capture.
 *
 * Produces one undistorted still per camera for the calibration service.
 * The protocol is strictly sequential, left then right, against a single
 * render target:
 *
 *   seek -> [per side] settle N display ticks -> fixed delay ->
 *   final render -> PNG encode
 *
 * Any seek/decode failure, the hard timeout, or cancellation aborts the
 * whole pair; a partial pair is never delivered.
 */

#ifndef DUOSTITCH_FRAME_CAPTURE_H
#define DUOSTITCH_FRAME_CAPTURE_H

#include <functional>
#include <string>
#include <vector>

#include <QMetaObject>

#include <opencv2/core.hpp>

#include "color_model.h"
#include "fisheye_model.h"
#include "frame_scheduler.h"
#include "stitch_config.h"
#include "stitch_error.h"

class MediaSource;

struct SideView {
    CameraIntrinsics intrinsics;
    ColorCorrection  color;
};

struct ExtractedFramePair {
    std::vector<unsigned char> left_image;
    std::vector<unsigned char> right_image;
};

struct CaptureRequest {
    double        time_s = 0.0;
    /* dual layout: the right stream is seeked to time_s + secondary_offset_s */
    double        secondary_offset_s = 0.0;
    TextureLayout layout = TextureLayout::Stacked;
    SideView      left, right;
    int           settle_frames   = CAPTURE_SETTLE_FRAMES;
    int           settle_delay_ms = CAPTURE_SETTLE_DELAY_MS;
    int           timeout_ms      = CAPTURE_TIMEOUT_MS;
};

/* The render target owned by a capture while it runs. */
class CaptureRenderTarget {
public:
    virtual ~CaptureRenderTarget() {}

    /* Renders `side` alone, head-on, filling the target. */
    virtual bool renderSide(Side side, const SideView &view,
                            TextureLayout layout, const cv::Mat &frame) = 0;

    /* Encodes the most recent render as PNG. */
    virtual bool encodePng(std::vector<unsigned char> *out) = 0;
};

class FrameCapture {
public:
    enum class Phase { Idle, Seeking, Settling, Delaying, Encoding };

    using DoneCallback  = std::function<void(StitchError, const ExtractedFramePair &)>;
    using ImageCallback = std::function<void(Side, const std::vector<unsigned char> &)>;

    FrameCapture(FrameScheduler *scheduler, CaptureRenderTarget *target);
    ~FrameCapture();

    FrameCapture(const FrameCapture &) = delete;
    FrameCapture &operator=(const FrameCapture &) = delete;

    /*
     * Starts a capture.  For a stacked stream pass the same source twice.
     * `done` is called exactly once, asynchronously, unless start()
     * returns false: then it has already been called with the reason
     * (InvalidIntrinsics), or a capture was already running.
     */
    bool start(MediaSource *left_source, MediaSource *right_source,
               const CaptureRequest &req, DoneCallback done,
               CancelToken token = CancelToken(),
               ImageCallback on_image = ImageCallback());

    void cancel();

    bool  busy() const { return phase_ != Phase::Idle; }
    Phase phase() const { return phase_; }

private:
    FrameScheduler      *scheduler;
    CaptureRenderTarget *target;

    Phase          phase_;
    CaptureRequest request;
    CancelToken    token;
    DoneCallback   done;
    ImageCallback  on_image;

    std::vector<MediaSource *> seek_order;
    MediaSource *sources[2];
    size_t seek_index;
    Side   side;
    int    settle_count;
    int    pending_handle;
    int    timeout_handle;
    ExtractedFramePair pair;
    std::vector<QMetaObject::Connection> connections;

    double seekTime(size_t index) const;
    void onSeeked(MediaSource *src, bool ok);
    void beginSide(Side s);
    void onSettleTick();
    void onDelayElapsed();
    void onEncode();
    bool renderCurrent();
    bool checkCancelled();

    void finish(StitchError err);
    void teardown();
};

const char *capture_phase_name(FrameCapture::Phase phase);

/* Writes left_frame.png and right_frame.png into `dir`, creating it. */
bool save_frame_pair(const ExtractedFramePair &pair, const std::string &dir);

#endif
