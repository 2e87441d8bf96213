/*
 * stitch_viewer: continuous playback and composition of a dual-fisheye
 * recording (one stacked file or two per-camera files) or of live
 * libcamera cameras.
 *
 * Usage: stitch_viewer [session.json] <video> [right-video]
 *        stitch_viewer [session.json] --live
 */

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <QApplication>
#include <QSurfaceFormat>

#include <libcamera/libcamera.h>

#include "frame_capture.h"
#include "frame_scheduler.h"
#include "live_camera_source.h"
#include "offscreen_capture_target.h"
#include "panorama_widget.h"
#include "playback_session.h"
#include "session_config.h"
#include "stream_sync.h"
#include "video_file_source.h"

static void usage(const char *argv0)
{
    fprintf(stderr,
            "Usage: %s [session.json] <video> [right-video]\n"
            "       %s [session.json] --live\n",
            argv0, argv0);
}

static bool ends_with(const std::string &s, const char *suffix)
{
    size_t n = strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

static void print_banner(const SessionConfig &cfg, const std::vector<std::string> &videos,
                         bool live)
{
    printf("\n============================================================\n");
    printf("DUAL FISHEYE STITCH VIEWER\n");
    printf("============================================================\n");
    if (live) {
        printf("Input:            live cameras\n");
    } else {
        for (size_t i = 0; i < videos.size(); i++)
            printf("Input %zu:          %s\n", i, videos[i].c_str());
        printf("Layout:           %s\n", videos.size() == 1 ? "stacked" : "dual");
    }
    print_session_config(cfg);
    printf("============================================================\n");
}

int main(int argc, char *argv[])
{
    /* Request OpenGL ES 3.1 context shared with the capture target */
    QSurfaceFormat fmt;
    fmt.setRenderableType(QSurfaceFormat::OpenGLES);
    fmt.setVersion(3, 1);
    fmt.setDepthBufferSize(24);
    fmt.setSwapBehavior(QSurfaceFormat::DoubleBuffer);
    QSurfaceFormat::setDefaultFormat(fmt);
    QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);

    QApplication app(argc, argv);

    /* ---- arguments ---- */
    bool live = false;
    std::string session_path;
    std::vector<std::string> videos;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--live")
            live = true;
        else if (session_path.empty() && videos.empty() && ends_with(arg, ".json"))
            session_path = arg;
        else
            videos.push_back(arg);
    }
    if ((live && !videos.empty()) || (!live && (videos.empty() || videos.size() > 2))) {
        usage(argv[0]);
        return 1;
    }

    if (session_path.empty()) {
        session_path = find_newest_session("sessions");
        if (session_path.empty()) {
            fprintf(stderr, "No session file given and none found in sessions/\n");
            usage(argv[0]);
            return 1;
        }
        printf("Auto-selected session: %s\n", session_path.c_str());
    }

    SessionConfig cfg;
    StitchError err;
    if (!load_session_config(session_path.c_str(), &cfg, &err)) {
        fprintf(stderr, "Failed to load session %s: %s\n",
                session_path.c_str(), stitch_error_name(err));
        return 1;
    }
    print_banner(cfg, videos, live);

    TimerFrameScheduler scheduler(TIMER_INTERVAL_MS);
    PlaybackSession session(cfg);

    /* ---- media sources ---- */
    std::shared_ptr<libcamera::CameraManager> cm;
    std::vector<std::unique_ptr<MediaSource>> sources;

    if (live) {
        cm = std::make_shared<libcamera::CameraManager>();
        if (cm->start()) {
            fprintf(stderr, "Failed to start camera manager\n");
            return 1;
        }
        size_t n = cm->cameras().size();
        printf("Found %zu camera(s)\n", n);
        if (n == 0) {
            cm->stop();
            return 1;
        }

        /* Two cameras give a dual layout, one camera a stacked frame */
        int count = n >= 2 ? 2 : 1;
        int h = count == 2 ? LIVE_CAMERA_HEIGHT / 2 : LIVE_CAMERA_HEIGHT;
        for (int i = 0; i < count; i++) {
            auto cam = std::make_unique<LiveCameraSource>(cm, i, LIVE_CAMERA_WIDTH,
                                                          h, &scheduler);
            if (!cam->open()) {
                sources.clear();
                cm->stop();
                return 1;
            }
            sources.push_back(std::move(cam));
        }
    } else {
        for (const std::string &v : videos) {
            auto src = std::make_unique<VideoFileSource>(QString::fromStdString(v),
                                                         &scheduler);
            if (!src->open())
                return 1;
            sources.push_back(std::move(src));
        }
    }

    MediaSource *left  = sources[0].get();
    MediaSource *right = sources.size() > 1 ? sources[1].get() : left;
    session.setSources(left, right);

    int exit_code = 0;
    auto on_media_error = [&](StitchError e) {
        fprintf(stderr, "Media error: %s\n", stitch_error_name(e));
        exit_code = 2;
        app.exit(exit_code);
    };
    for (auto &src : sources)
        QObject::connect(src.get(), &MediaSource::error, &app, on_media_error);

    /* ---- start playback ---- */
    std::unique_ptr<StreamSync> sync;
    bool awaiting_play = false;
    auto start_sync = [&]() {
        sync = std::make_unique<StreamSync>(left, right, &scheduler,
                                            session.syncOptions());
        sync->setErrorCallback(on_media_error);
        awaiting_play = true;
        sync->start();
    };

    if (left != right && !live) {
        /* Both files play once the secondary sits at its offset */
        QObject::connect(right, &MediaSource::seeked, &app, [&](bool ok) {
            if (!ok || !awaiting_play)
                return;
            awaiting_play = false;
            left->play();
            right->play();
        });
        start_sync();
    } else {
        for (auto &src : sources) {
            MediaSource *s = src.get();
            QObject::connect(s, &MediaSource::loaded, &app, [s]() { s->play(); });
        }
    }

    /* ---- viewer and calibration capture ---- */
    PanoramaWidget win(&session);
    OffscreenCaptureTarget target;
    std::unique_ptr<FrameCapture> capture;

    QObject::connect(&win, &PanoramaWidget::captureRequested, &app, [&]() {
        if (live) {
            fprintf(stderr, "[capture] live cameras cannot seek; capture needs a file\n");
            return;
        }
        if (!capture) {
            if (!target.initialize()) {
                fprintf(stderr, "Capture target unavailable\n");
                return;
            }
            capture = std::make_unique<FrameCapture>(&scheduler, &target);
        }
        if (capture->busy())
            return;

        if (sync)
            sync->stop();
        for (auto &src : sources)
            src->pause();
        win.setSuspended(true);

        double t = left->currentTime();
        printf("[capture] capturing at %s\n", format_timestamp(t).c_str());

        auto done = [&](StitchError e, const ExtractedFramePair &pair) {
            if (e == StitchError::None)
                save_frame_pair(pair, ".");
            else
                fprintf(stderr, "[capture] failed: %s\n", stitch_error_name(e));
            win.setSuspended(false);

            if (sync) {
                start_sync();
            } else {
                for (auto &src : sources)
                    src->play();
            }
        };
        capture->start(left, right, session.captureRequest(t), done);
    });

    win.resize(1280, 720);
    win.show();
    int rc = app.exec();

    capture.reset();
    sync.reset();
    sources.clear();
    if (cm)
        cm->stop();
    return exit_code ? exit_code : rc;
}
