#include "live_camera_source.h"

#include <cstdio>

#include <sys/mman.h>

#include <opencv2/imgproc.hpp>

LiveCameraSource::LiveCameraSource(std::shared_ptr<libcamera::CameraManager> cm_in,
                                   int idx, int w, int h,
                                   FrameScheduler *scheduler_in, QObject *parent)
    : MediaSource(parent), cm(cm_in), stream(nullptr), camera_idx(idx),
      width(w), height(h), stride(0), scheduler(scheduler_in),
      tick_handle(0), seek_handle(0), pending_ns(0), new_frame(false),
      first_ns(0), frame_ns(0), loaded_(false), playing(false), started(false)
{
}

LiveCameraSource::~LiveCameraSource()
{
    close();
}

QString LiveCameraSource::name() const
{
    return QString("camera%1").arg(camera_idx);
}

/* ---- libcamera setup ---- */

bool LiveCameraSource::open()
{
    auto cameras = cm->cameras();
    if (camera_idx >= (int)cameras.size()) {
        fprintf(stderr, "[camera] camera %d not found (%zu available)\n",
                camera_idx, cameras.size());
        return false;
    }

    camera = cm->get(cameras[camera_idx]->id());
    if (!camera || camera->acquire()) {
        fprintf(stderr, "[camera] failed to acquire camera %d\n", camera_idx);
        camera.reset();
        return false;
    }

    const char *stage = nullptr;
    if (!configureStream())
        stage = "configuration";
    else if (!mapBuffers())
        stage = "buffer setup";
    else if (!startStreaming())
        stage = "start";

    if (stage) {
        fprintf(stderr, "[camera] camera %d: %s failed\n", camera_idx, stage);
        close();
        return false;
    }

    printf("[camera] %d: %dx%d BGR888 (stride %u)\n",
           camera_idx, width, height, stride);
    requestTick();
    return true;
}

bool LiveCameraSource::configureStream()
{
    config = camera->generateConfiguration({ libcamera::StreamRole::VideoRecording });
    if (!config || config->empty())
        return false;

    /* BGR888 is R,G,B in memory (DRM fourcc), so frames arrive as RGB. */
    libcamera::StreamConfiguration &sc = config->at(0);
    sc.size        = libcamera::Size(width, height);
    sc.pixelFormat = libcamera::formats::BGR888;

    if (config->validate() == libcamera::CameraConfiguration::Invalid ||
        camera->configure(config.get()) != 0)
        return false;
    if (sc.pixelFormat != libcamera::formats::BGR888) {
        fprintf(stderr, "[camera] camera %d cannot deliver BGR888 (got %s)\n",
                camera_idx, sc.pixelFormat.toString().c_str());
        return false;
    }

    stream = sc.stream();
    width  = sc.size.width;
    height = sc.size.height;
    stride = sc.stride;
    return true;
}

/* One request per buffer, each buffer mapped for CPU reads. */
bool LiveCameraSource::mapBuffers()
{
    allocator = std::make_unique<libcamera::FrameBufferAllocator>(camera);
    if (allocator->allocate(stream) < 0)
        return false;

    for (const auto &buf : allocator->buffers(stream)) {
        const libcamera::FrameBuffer::Plane &plane = buf->planes()[0];
        void *mem = mmap(NULL, plane.length, PROT_READ, MAP_SHARED,
                         plane.fd.get(), 0);
        if (mem == MAP_FAILED) {
            perror("[camera] mmap");
            return false;
        }
        mappings[buf.get()] = { mem, plane.length };

        auto req = camera->createRequest();
        if (!req || req->addBuffer(stream, buf.get()) != 0)
            return false;
        requests.push_back(std::move(req));
    }
    return true;
}

bool LiveCameraSource::startStreaming()
{
    camera->requestCompleted.connect(this, &LiveCameraSource::processRequest);
    if (camera->start() != 0)
        return false;
    started = true;

    for (auto &req : requests) {
        if (camera->queueRequest(req.get()) != 0)
            return false;
    }
    return true;
}

void LiveCameraSource::close()
{
    scheduler->cancel(tick_handle);
    scheduler->cancel(seek_handle);
    tick_handle = seek_handle = 0;
    playing = false;

    if (!camera)
        return;
    if (started) {
        camera->stop();
        started = false;
    }
    camera->requestCompleted.disconnect(this);
    for (auto &[fb, mb] : mappings)
        munmap(mb.data, mb.length);
    mappings.clear();
    requests.clear();
    allocator.reset();
    config.reset();
    camera->release();
    camera.reset();
}

/* Runs on the libcamera thread. */
void LiveCameraSource::processRequest(libcamera::Request *request)
{
    if (request->status() == libcamera::Request::RequestCancelled)
        return;

    const libcamera::FrameBuffer *fb = request->findBuffer(stream);
    if (fb) {
        auto it = mappings.find(fb);
        if (it != mappings.end()) {
            auto ts = request->metadata().get(libcamera::controls::SensorTimestamp);
            std::lock_guard<std::mutex> lock(frame_mutex);
            cv::Mat tmp(height, width, CV_8UC3, it->second.data, (size_t)stride);
            tmp.copyTo(pending);
            pending_ns = ts ? *ts : (int64_t)fb->metadata().timestamp;
            new_frame = true;
        }
    }

    request->reuse(libcamera::Request::ReuseBuffers);
    camera->queueRequest(request);
}

/* ---- playback ---- */

double LiveCameraSource::currentTime() const
{
    return loaded_ ? (frame_ns - first_ns) / 1e9 : 0.0;
}

void LiveCameraSource::seek(double seconds)
{
    fprintf(stderr, "[camera] %d: cannot seek live stream to %.3f s\n",
            camera_idx, seconds);
    scheduler->cancel(seek_handle);
    seek_handle = scheduler->scheduleAfter(0, [this]() {
        seek_handle = 0;
        emit seeked(false);
    });
}

void LiveCameraSource::play()
{
    playing = true;
}

void LiveCameraSource::pause()
{
    playing = false;
}

void LiveCameraSource::requestTick()
{
    tick_handle = scheduler->requestFrame([this]() {
        tick_handle = 0;
        onTick();
    });
}

void LiveCameraSource::onTick()
{
    {
        std::lock_guard<std::mutex> lock(frame_mutex);
        if (new_frame && (playing || !loaded_)) {
            pending.copyTo(frame);
            frame_ns = pending_ns;
            new_frame = false;
        }
    }

    if (!loaded_ && !frame.empty()) {
        loaded_ = true;
        first_ns = frame_ns;
        emit loaded();
    }

    if (camera)
        requestTick();
}
