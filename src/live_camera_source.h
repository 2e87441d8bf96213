/*
 * Live libcamera stream exposed as a MediaSource.
 *
 * Completed requests are copied out on the libcamera thread and picked
 * up on the next scheduler tick.  A live stream has no timeline: seeks
 * always fail, duration() is 0 and currentTime() is the sensor
 * timestamp of the shown frame relative to the first one.
 */

#ifndef DUOSTITCH_LIVE_CAMERA_SOURCE_H
#define DUOSTITCH_LIVE_CAMERA_SOURCE_H

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <libcamera/libcamera.h>

#include "frame_scheduler.h"
#include "media_source.h"

class LiveCameraSource : public MediaSource {
    Q_OBJECT

public:
    LiveCameraSource(std::shared_ptr<libcamera::CameraManager> cm,
                     int camera_idx, int width, int height,
                     FrameScheduler *scheduler, QObject *parent = nullptr);
    ~LiveCameraSource();

    /* Acquires, configures and starts the camera. */
    bool open();
    void close();

    QString name() const override;
    bool    isLoaded() const override { return loaded_; }
    double  duration() const override { return 0.0; }
    double  currentTime() const override;
    bool    supportsFrameCallbacks() const override { return false; }

    void seek(double seconds) override;
    void play() override;
    void pause() override;
    bool isPlaying() const override { return playing; }

    cv::Mat currentFrame() const override { return frame; }

private:
    struct MappedBuffer {
        void   *data;
        size_t  length;
    };

    std::shared_ptr<libcamera::CameraManager>         cm;
    std::shared_ptr<libcamera::Camera>                camera;
    std::unique_ptr<libcamera::CameraConfiguration>   config;
    std::unique_ptr<libcamera::FrameBufferAllocator>  allocator;
    libcamera::Stream                                *stream;
    std::vector<std::unique_ptr<libcamera::Request>>  requests;
    std::map<const libcamera::FrameBuffer *, MappedBuffer> mappings;

    int          camera_idx;
    int          width, height;
    unsigned int stride;

    FrameScheduler *scheduler;
    int tick_handle, seek_handle;

    std::mutex frame_mutex;
    cv::Mat    pending;             /* written on the libcamera thread */
    int64_t    pending_ns;
    bool       new_frame;

    cv::Mat    frame;
    int64_t    first_ns, frame_ns;
    bool loaded_, playing, started;

    bool configureStream();
    bool mapBuffers();
    bool startStreaming();
    void processRequest(libcamera::Request *request);
    void requestTick();
    void onTick();
};

#endif
