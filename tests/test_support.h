/*
 * Deterministic stand-ins for the display clock, media sources and the
 * capture render target.
 */

#ifndef DUOSTITCH_TEST_SUPPORT_H
#define DUOSTITCH_TEST_SUPPORT_H

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "frame_capture.h"
#include "frame_scheduler.h"
#include "media_source.h"

/* ========================================================================
 * Manual scheduler
 * ======================================================================== */

class ManualFrameScheduler : public FrameScheduler {
public:
    int requestFrame(Task task) override
    {
        int h = ++next;
        frames[h] = std::move(task);
        return h;
    }

    int scheduleAfter(int ms, Task task) override
    {
        int h = ++next;
        delays[h] = Delayed{ now_ms + ms, std::move(task) };
        return h;
    }

    void cancel(int handle) override
    {
        frames.erase(handle);
        delays.erase(handle);
    }

    qint64 elapsedMs() const override { return now_ms; }

    /* Runs the tasks requested before this tick; returns how many ran. */
    int tick()
    {
        std::vector<int> due;
        for (auto &kv : frames)
            due.push_back(kv.first);
        int ran = 0;
        for (int h : due) {
            auto it = frames.find(h);
            if (it == frames.end())
                continue;
            Task t = std::move(it->second);
            frames.erase(it);
            t();
            ran++;
        }
        return ran;
    }

    /* Advances the clock, running delays as they fall due. */
    void advance(int ms)
    {
        int end = now_ms + ms;
        for (;;) {
            auto next_due = delays.end();
            for (auto it = delays.begin(); it != delays.end(); ++it)
                if (it->second.due <= end &&
                    (next_due == delays.end() || it->second.due < next_due->second.due))
                    next_due = it;
            if (next_due == delays.end())
                break;
            now_ms = std::max(now_ms, next_due->second.due);
            Task t = std::move(next_due->second.task);
            delays.erase(next_due);
            t();
        }
        now_ms = end;
    }

    /* Alternates ticks and zero-length delays until nothing is pending
     * or `max_steps` is reached. */
    void drain(int max_steps = 1000)
    {
        for (int i = 0; i < max_steps && (pendingFrames() || dueDelays()); i++) {
            advance(0);
            tick();
        }
    }

    int  now() const { return now_ms; }
    size_t pendingFrames() const { return frames.size(); }
    size_t pendingDelays() const { return delays.size(); }

private:
    struct Delayed {
        int  due;
        Task task;
    };

    int next = 0;
    int now_ms = 0;
    std::map<int, Task> frames;
    std::map<int, Delayed> delays;

    bool dueDelays() const
    {
        for (auto &kv : delays)
            if (kv.second.due <= now_ms)
                return true;
        return false;
    }
};

/* ========================================================================
 * Fake media source
 * ======================================================================== */

class FakeMediaSource : public MediaSource {
public:
    explicit FakeMediaSource(const QString &name_in, bool frame_callbacks = true)
        : name_(name_in), callbacks(frame_callbacks),
          frame_(8, 8, CV_8UC3, cv::Scalar(40, 80, 120))
    {
    }

    QString name() const override { return name_; }
    bool    isLoaded() const override { return loaded_; }
    double  duration() const override { return duration_s; }
    double  currentTime() const override { return time_s; }
    bool    supportsFrameCallbacks() const override { return callbacks; }

    void seek(double seconds) override
    {
        seeks.push_back(seconds);
        pending_seek = true;
        if (auto_complete)
            completeSeek(true);
    }
    void play() override { playing = true; }
    void pause() override { playing = false; }
    bool isPlaying() const override { return playing; }

    cv::Mat currentFrame() const override { return frame_; }

    /* ---- test controls ---- */

    void setLoaded()
    {
        loaded_ = true;
        emit loaded();
    }

    void completeSeek(bool ok)
    {
        pending_seek = false;
        if (ok)
            time_s = seeks.back();
        emit seeked(ok);
    }

    void present(double media_time)
    {
        time_s = media_time;
        FrameMetadata meta;
        meta.media_time = media_time;
        meta.current_time = media_time;
        meta.presented_frames = ++presented;
        emit framePresented(meta);
    }

    void fail(StitchError err) { emit error(err); }

    QString name_;
    bool    callbacks;
    cv::Mat frame_;
    bool    loaded_ = false;
    bool    playing = false;
    bool    auto_complete = false;
    bool    pending_seek = false;
    double  duration_s = 60.0;
    double  time_s = 0.0;
    uint64_t presented = 0;
    std::vector<double> seeks;
};

/* ========================================================================
 * Fake render target
 * ======================================================================== */

class FakeRenderTarget : public CaptureRenderTarget {
public:
    bool renderSide(Side side, const SideView &, TextureLayout layout,
                    const cv::Mat &frame) override
    {
        if (frame.empty() || fail_render)
            return false;
        events.push_back(std::string("render:") + side_name(side));
        last_side = side;
        last_layout = layout;
        return true;
    }

    bool encodePng(std::vector<unsigned char> *out) override
    {
        if (fail_encode)
            return false;
        events.push_back(std::string("encode:") + side_name(last_side));
        std::string tag = side_name(last_side);
        out->assign(tag.begin(), tag.end());
        return true;
    }

    int count(const std::string &event) const
    {
        int n = 0;
        for (const std::string &e : events)
            if (e == event)
                n++;
        return n;
    }

    std::vector<std::string> events;
    Side          last_side = Side::Left;
    TextureLayout last_layout = TextureLayout::Stacked;
    bool fail_render = false;
    bool fail_encode = false;
};

#endif
