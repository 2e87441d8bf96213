#include "frame_capture.h"

#include <cstdio>
#include <string>
#include <utility>

#include <QDir>
#include <QFile>

#include "media_source.h"

const char *capture_phase_name(FrameCapture::Phase phase)
{
    switch (phase) {
    case FrameCapture::Phase::Idle:     return "idle";
    case FrameCapture::Phase::Seeking:  return "seeking";
    case FrameCapture::Phase::Settling: return "settling";
    case FrameCapture::Phase::Delaying: return "delaying";
    case FrameCapture::Phase::Encoding: return "encoding";
    }
    return "?";
}

FrameCapture::FrameCapture(FrameScheduler *scheduler_in,
                           CaptureRenderTarget *target_in)
    : scheduler(scheduler_in), target(target_in), phase_(Phase::Idle),
      sources{ nullptr, nullptr }, seek_index(0), side(Side::Left),
      settle_count(0), pending_handle(0), timeout_handle(0)
{
}

FrameCapture::~FrameCapture()
{
    teardown();
}

/* ---- start ---- */

bool FrameCapture::start(MediaSource *left_source, MediaSource *right_source,
                         const CaptureRequest &req, DoneCallback done_cb,
                         CancelToken token_in, ImageCallback on_image_cb)
{
    if (busy()) {
        fprintf(stderr, "[capture] already running (%s)\n",
                capture_phase_name(phase_));
        return false;
    }

    std::string reason;
    if (!validate_intrinsics(req.left.intrinsics, &reason) ||
        !validate_intrinsics(req.right.intrinsics, &reason)) {
        fprintf(stderr, "[capture] invalid intrinsics: %s\n", reason.c_str());
        done_cb(StitchError::InvalidIntrinsics, ExtractedFramePair());
        return false;
    }

    request  = req;
    token    = token_in;
    done     = std::move(done_cb);
    on_image = std::move(on_image_cb);
    pair     = ExtractedFramePair();

    sources[0] = left_source;
    sources[1] = right_source;
    seek_order.clear();
    seek_order.push_back(left_source);
    if (right_source != left_source)
        seek_order.push_back(right_source);

    for (MediaSource *src : seek_order) {
        connections.push_back(QObject::connect(
            src, &MediaSource::seeked,
            [this, src](bool ok) { onSeeked(src, ok); }));
        connections.push_back(QObject::connect(
            src, &MediaSource::error,
            [this](StitchError err) {
                fprintf(stderr, "[capture] media error: %s\n",
                        stitch_error_name(err));
                finish(err == StitchError::SeekFailed ? err
                                                      : StitchError::DecodeError);
            }));
    }

    timeout_handle = scheduler->scheduleAfter(request.timeout_ms, [this]() {
        timeout_handle = 0;
        fprintf(stderr, "[capture] timed out after %d ms while %s\n",
                request.timeout_ms, capture_phase_name(phase_));
        finish(StitchError::CaptureTimeout);
    });

    if (seek_order.size() > 1)
        printf("[capture] seeking to %.3f s / %.3f s (dual)\n", seekTime(0),
               seekTime(1));
    else
        printf("[capture] seeking to %.3f s (%s)\n", seekTime(0),
               request.layout == TextureLayout::Stacked ? "stacked" : "dual");
    phase_ = Phase::Seeking;
    seek_index = 0;
    seek_order[0]->seek(seekTime(0));
    return true;
}

void FrameCapture::cancel()
{
    token.cancel();
    if (busy())
        finish(StitchError::Cancelled);
}

/* ---- seek completion ---- */

double FrameCapture::seekTime(size_t index) const
{
    if (index == 0)
        return request.time_s;
    return request.time_s + request.secondary_offset_s;
}

void FrameCapture::onSeeked(MediaSource *src, bool ok)
{
    if (phase_ != Phase::Seeking || src != seek_order[seek_index])
        return;
    if (checkCancelled())
        return;

    if (!ok) {
        fprintf(stderr, "[capture] seek to %.3f s failed on %s\n",
                seekTime(seek_index), src->name().toUtf8().constData());
        finish(StitchError::SeekFailed);
        return;
    }

    if (++seek_index < seek_order.size()) {
        seek_order[seek_index]->seek(seekTime(seek_index));
        return;
    }

    beginSide(Side::Left);
}

/* ---- per-side render / settle / encode ---- */

void FrameCapture::beginSide(Side s)
{
    side = s;
    settle_count = 0;
    phase_ = Phase::Settling;
    printf("[capture] rendering %s camera\n", side_name(side));
    pending_handle = scheduler->requestFrame([this]() { onSettleTick(); });
}

void FrameCapture::onSettleTick()
{
    pending_handle = 0;
    if (checkCancelled() || !renderCurrent())
        return;

    if (++settle_count < request.settle_frames) {
        pending_handle = scheduler->requestFrame([this]() { onSettleTick(); });
        return;
    }

    phase_ = Phase::Delaying;
    pending_handle = scheduler->scheduleAfter(request.settle_delay_ms,
                                              [this]() { onDelayElapsed(); });
}

void FrameCapture::onDelayElapsed()
{
    pending_handle = 0;
    if (checkCancelled() || !renderCurrent())
        return;

    phase_ = Phase::Encoding;
    pending_handle = scheduler->requestFrame([this]() { onEncode(); });
}

void FrameCapture::onEncode()
{
    pending_handle = 0;
    if (checkCancelled())
        return;

    std::vector<unsigned char> png;
    if (!target->encodePng(&png) || png.empty()) {
        fprintf(stderr, "[capture] %s encode failed\n", side_name(side));
        finish(StitchError::DecodeError);
        return;
    }
    printf("[capture] %s frame encoded (%zu bytes)\n", side_name(side), png.size());

    if (on_image)
        on_image(side, png);

    if (side == Side::Left) {
        pair.left_image = std::move(png);
        beginSide(Side::Right);
    } else {
        pair.right_image = std::move(png);
        finish(StitchError::None);
    }
}

bool FrameCapture::renderCurrent()
{
    MediaSource *src = sources[side == Side::Left ? 0 : 1];
    cv::Mat frame = src->currentFrame();
    const SideView &view = side == Side::Left ? request.left : request.right;

    if (frame.empty() || !target->renderSide(side, view, request.layout, frame)) {
        fprintf(stderr, "[capture] %s render failed (%s)\n", side_name(side),
                frame.empty() ? "no decoded frame" : "render target");
        finish(StitchError::DecodeError);
        return false;
    }
    return true;
}

bool FrameCapture::checkCancelled()
{
    if (!token.cancelled())
        return false;
    finish(StitchError::Cancelled);
    return true;
}

/* ---- completion ---- */

void FrameCapture::finish(StitchError err)
{
    if (!busy())
        return;

    teardown();

    DoneCallback cb = std::move(done);
    done = DoneCallback();
    on_image = ImageCallback();

    ExtractedFramePair result;
    if (err == StitchError::None) {
        result = std::move(pair);
        printf("[capture] pair complete\n");
    } else {
        fprintf(stderr, "[capture] aborted: %s\n", stitch_error_name(err));
    }
    pair = ExtractedFramePair();

    if (cb)
        cb(err, result);
}

void FrameCapture::teardown()
{
    if (pending_handle) {
        scheduler->cancel(pending_handle);
        pending_handle = 0;
    }
    if (timeout_handle) {
        scheduler->cancel(timeout_handle);
        timeout_handle = 0;
    }
    for (auto &c : connections)
        QObject::disconnect(c);
    connections.clear();
    phase_ = Phase::Idle;
}

/* ========================================================================
 * Output
 * ======================================================================== */

static bool write_file(const QString &path, const std::vector<unsigned char> &bytes)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        fprintf(stderr, "[capture] cannot write %s\n", path.toUtf8().constData());
        return false;
    }
    qint64 n = f.write((const char *)bytes.data(), (qint64)bytes.size());
    f.close();
    if (n != (qint64)bytes.size()) {
        fprintf(stderr, "[capture] short write to %s\n", path.toUtf8().constData());
        return false;
    }
    printf("[capture] wrote %s (%zu bytes)\n", path.toUtf8().constData(), bytes.size());
    return true;
}

bool save_frame_pair(const ExtractedFramePair &pair, const std::string &dir)
{
    QDir d(QString::fromStdString(dir));
    if (!d.exists() && !d.mkpath(".")) {
        fprintf(stderr, "[capture] cannot create %s\n", dir.c_str());
        return false;
    }
    return write_file(d.filePath("left_frame.png"), pair.left_image) &&
           write_file(d.filePath("right_frame.png"), pair.right_image);
}
