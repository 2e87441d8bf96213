/*
 * Abstract decodable media source.
 *
 * All operations are non-blocking; completion is reported through Qt
 * signals on the thread that owns the source:
 *   loaded()          first frame available (emitted once)
 *   seeked(ok)        a seek() finished, ok == false on failure
 *   framePresented()  a new frame was presented (only when
 *                     supportsFrameCallbacks() is true)
 *   error()           decode failure; the source is unusable afterwards
 */

#ifndef DUOSTITCH_MEDIA_SOURCE_H
#define DUOSTITCH_MEDIA_SOURCE_H

#include <cstdint>

#include <QObject>
#include <QString>

#include <opencv2/core.hpp>

#include "stitch_error.h"

struct FrameMetadata {
    double   media_time = 0.0;          /* presentation timestamp, seconds */
    double   current_time = 0.0;        /* playback position when delivered */
    uint64_t presented_frames = 0;
};

class MediaSource : public QObject {
    Q_OBJECT

public:
    explicit MediaSource(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~MediaSource() {}

    virtual QString name() const = 0;
    virtual bool    isLoaded() const = 0;
    virtual double  duration() const = 0;
    virtual double  currentTime() const = 0;
    virtual bool    supportsFrameCallbacks() const = 0;

    virtual void seek(double seconds) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual bool isPlaying() const = 0;

    /* Latest decoded frame, 8-bit RGB.  Empty before loaded(). */
    virtual cv::Mat currentFrame() const = 0;

signals:
    void loaded();
    void seeked(bool ok);
    void framePresented(const FrameMetadata &meta);
    void error(StitchError err);
};

#endif
