#include "video_file_source.h"

#include <algorithm>
#include <cstdio>

#include <opencv2/imgproc.hpp>

/* Falling further behind than this re-seeks instead of decoding through. */
#define MAX_CATCHUP_S 1.0

VideoFileSource::VideoFileSource(const QString &path_in,
                                 FrameScheduler *scheduler_in, QObject *parent)
    : MediaSource(parent), path(path_in), scheduler(scheduler_in),
      fps_(0.0), frame_count(0), duration_s(0.0), frame_time(0.0),
      clock_base(0.0), resume_time(0.0), clock_start_ms(0), loaded_(false),
      playing(false), loop(true),
      seeking(false), failed(false), seek_target(0.0), presented(0),
      tick_handle(0), seek_handle(0), load_handle(0)
{
}

VideoFileSource::~VideoFileSource()
{
    scheduler->cancel(tick_handle);
    scheduler->cancel(seek_handle);
    scheduler->cancel(load_handle);
}

bool VideoFileSource::open()
{
    std::string p = path.toStdString();
    if (!cap.open(p)) {
        fprintf(stderr, "[media] cannot open %s\n", p.c_str());
        return false;
    }

    fps_ = cap.get(cv::CAP_PROP_FPS);
    if (fps_ <= 0.0)
        fps_ = 30.0;
    frame_count = (int)cap.get(cv::CAP_PROP_FRAME_COUNT);
    duration_s  = frame_count > 0 ? frame_count / fps_ : 0.0;

    printf("[media] %s: %dx%d  %.2f fps  %d frames (%.1f s)\n", p.c_str(),
           (int)cap.get(cv::CAP_PROP_FRAME_WIDTH),
           (int)cap.get(cv::CAP_PROP_FRAME_HEIGHT),
           fps_, frame_count, duration_s);

    load_handle = scheduler->scheduleAfter(0, [this]() {
        load_handle = 0;
        decodeFirst();
    });
    return true;
}

/* ---- decoding ---- */

void VideoFileSource::startClock(double media_time)
{
    clock_base = media_time;
    clock_start_ms = scheduler->elapsedMs();
}

/* Unclamped playback clock; runs past the end so the last read fails. */
double VideoFileSource::clockTime() const
{
    return clock_base + (scheduler->elapsedMs() - clock_start_ms) / 1000.0;
}

bool VideoFileSource::readFrame()
{
    cv::Mat bgr;
    if (!cap.read(bgr) || bgr.empty())
        return false;

    cv::cvtColor(bgr, frame, cv::COLOR_BGR2RGB);
    frame_time = cap.get(cv::CAP_PROP_POS_MSEC) / 1000.0;
    return true;
}

void VideoFileSource::decodeFirst()
{
    if (!readFrame()) {
        fprintf(stderr, "[media] %s: no decodable frame\n",
                path.toUtf8().constData());
        raiseError();
        return;
    }
    loaded_ = true;
    resume_time = frame_time;
    emit loaded();
}

void VideoFileSource::raiseError()
{
    failed = true;
    playing = false;
    emit error(StitchError::DecodeError);
}

double VideoFileSource::currentTime() const
{
    if (seeking)
        return seek_target;
    if (!playing)
        return frame_time;
    double t = clockTime();
    return duration_s > 0.0 ? std::min(t, duration_s) : t;
}

/* ---- seek ---- */

void VideoFileSource::seek(double seconds)
{
    scheduler->cancel(seek_handle);
    if (failed) {
        seek_handle = scheduler->scheduleAfter(0, [this]() {
            seek_handle = 0;
            emit seeked(false);
        });
        return;
    }

    seek_target = std::max(0.0, duration_s > 0.0 ? std::min(seconds, duration_s)
                                                  : seconds);
    seeking = true;
    seek_handle = scheduler->scheduleAfter(0, [this]() {
        seek_handle = 0;
        doSeek();
    });
}

void VideoFileSource::doSeek()
{
    bool ok = cap.set(cv::CAP_PROP_POS_MSEC, seek_target * 1000.0) && readFrame();
    seeking = false;

    if (ok) {
        resume_time = seek_target;
        startClock(seek_target);
    } else {
        fprintf(stderr, "[media] %s: seek to %.3f s failed\n",
                path.toUtf8().constData(), seek_target);
    }
    emit seeked(ok);

    if (ok && playing)
        presentFrame();
}

/* ---- playback ---- */

void VideoFileSource::play()
{
    if (playing || failed || !loaded_)
        return;
    playing = true;
    startClock(resume_time);
    requestTick();
}

void VideoFileSource::pause()
{
    if (!playing)
        return;
    resume_time = currentTime();
    playing = false;
    scheduler->cancel(tick_handle);
    tick_handle = 0;
}

void VideoFileSource::requestTick()
{
    tick_handle = scheduler->requestFrame([this]() {
        tick_handle = 0;
        onTick();
    });
}

void VideoFileSource::presentFrame()
{
    FrameMetadata meta;
    meta.media_time = frame_time;
    meta.current_time = currentTime();
    meta.presented_frames = ++presented;
    emit framePresented(meta);
}

void VideoFileSource::endOfStream()
{
    if (!loop) {
        pause();
        return;
    }
    printf("[media] %s: looping\n", path.toUtf8().constData());
    seek(0.0);
}

void VideoFileSource::onTick()
{
    if (!playing)
        return;

    if (!seeking) {
        double target = clockTime();
        double step = 1.0 / fps_;

        if (target - frame_time > MAX_CATCHUP_S) {
            if (duration_s > 0.0 && target >= duration_s)
                endOfStream();
            else
                seek(target);
        } else if (frame_time + step <= target) {
            bool advanced = false;
            int budget = (int)(MAX_CATCHUP_S * fps_) + 1;
            while (frame_time + step <= target && budget-- > 0) {
                if (!readFrame()) {
                    endOfStream();
                    break;
                }
                advanced = true;
            }
            if (advanced)
                presentFrame();
        }
    }

    if (playing)
        requestTick();
}
