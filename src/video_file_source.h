/*
 * On-demand media file decoded with cv::VideoCapture.  Playback is
 * paced by the display ticks of a FrameScheduler against a wall clock;
 * every tick that advances to a new frame presents it through
 * framePresented().
 */

#ifndef DUOSTITCH_VIDEO_FILE_SOURCE_H
#define DUOSTITCH_VIDEO_FILE_SOURCE_H

#include <opencv2/videoio.hpp>

#include "frame_scheduler.h"
#include "media_source.h"

class VideoFileSource : public MediaSource {
    Q_OBJECT

public:
    VideoFileSource(const QString &path, FrameScheduler *scheduler,
                    QObject *parent = nullptr);
    ~VideoFileSource();

    /* Opens the file; loaded() or error() follows asynchronously. */
    bool open();

    void setLoop(bool on) { loop = on; }

    QString name() const override { return path; }
    bool    isLoaded() const override { return loaded_; }
    double  duration() const override { return duration_s; }
    double  currentTime() const override;
    bool    supportsFrameCallbacks() const override { return true; }

    void seek(double seconds) override;
    void play() override;
    void pause() override;
    bool isPlaying() const override { return playing; }

    cv::Mat currentFrame() const override { return frame; }

private:
    QString          path;
    FrameScheduler  *scheduler;
    cv::VideoCapture cap;
    cv::Mat          frame;

    double fps_;
    int    frame_count;
    double duration_s;
    double frame_time;          /* media time of `frame` */
    double clock_base;          /* media time at clock_start_ms */
    double resume_time;         /* clock position play() resumes from */
    qint64 clock_start_ms;

    bool loaded_, playing, loop, seeking, failed;
    double   seek_target;
    uint64_t presented;
    int tick_handle, seek_handle, load_handle;

    void startClock(double media_time);
    double clockTime() const;
    bool readFrame();
    void decodeFirst();
    void doSeek();
    void onTick();
    void endOfStream();
    void requestTick();
    void presentFrame();
    void raiseError();
};

#endif
