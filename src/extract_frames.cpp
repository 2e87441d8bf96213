/*
 * extract_frames: one-shot calibration capture.  Seeks the recording to
 * the capture time, renders each undistorted, color-corrected side
 * head-on and writes left_frame.png and right_frame.png.
 *
 * Usage: extract_frames <session.json> <video> [time] [out-dir]
 *                       [--right <right-video>] [--cpu]
 *
 * `time` is seconds, MM:SS or HH:MM:SS.  Without it the session's
 * capture settings choose the frame.
 */

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <QCoreApplication>
#include <QGuiApplication>

#include "frame_capture.h"
#include "frame_scheduler.h"
#include "offscreen_capture_target.h"
#include "playback_session.h"
#include "remap_capture_target.h"
#include "session_config.h"
#include "video_file_source.h"

static void usage(const char *argv0)
{
    fprintf(stderr,
            "Usage: %s <session.json> <video> [time] [out-dir] "
            "[--right <right-video>] [--cpu]\n", argv0);
}

int main(int argc, char *argv[])
{
    /* ---- arguments ---- */
    bool use_cpu = false;
    std::string right_video;
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--cpu") {
            use_cpu = true;
        } else if (arg == "--right") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 1;
            }
            right_video = argv[++i];
        } else {
            args.push_back(arg);
        }
    }
    if (args.size() < 2 || args.size() > 4) {
        usage(argv[0]);
        return 1;
    }

    std::unique_ptr<QCoreApplication> app;
    if (use_cpu)
        app = std::make_unique<QCoreApplication>(argc, argv);
    else
        app = std::make_unique<QGuiApplication>(argc, argv);

    SessionConfig cfg;
    StitchError err;
    if (!load_session_config(args[0].c_str(), &cfg, &err)) {
        fprintf(stderr, "Failed to load session %s: %s\n",
                args[0].c_str(), stitch_error_name(err));
        return 1;
    }

    bool has_time = args.size() >= 3;
    double time_s = 0.0;
    if (has_time && !parse_timestamp(args[2], &time_s)) {
        fprintf(stderr, "Invalid time \"%s\" (use seconds, MM:SS or HH:MM:SS)\n",
                args[2].c_str());
        return 1;
    }
    std::string out_dir = args.size() >= 4 ? args[3] : ".";

    printf("\n============================================================\n");
    printf("CALIBRATION FRAME EXTRACTION\n");
    printf("============================================================\n");
    printf("Session:          %s\n", args[0].c_str());
    printf("Video:            %s\n", args[1].c_str());
    if (!right_video.empty())
        printf("Right video:      %s\n", right_video.c_str());
    printf("Output:           %s\n", out_dir.c_str());
    printf("Renderer:         %s\n", use_cpu ? "CPU remap" : "OpenGL ES offscreen");
    print_session_config(cfg);
    printf("============================================================\n");

    /* ---- render target ---- */
    std::unique_ptr<CaptureRenderTarget> target;
    if (use_cpu) {
        target = std::make_unique<RemapCaptureTarget>();
    } else {
        auto gl = std::make_unique<OffscreenCaptureTarget>();
        if (!gl->initialize()) {
            fprintf(stderr, "OpenGL ES unavailable, rerun with --cpu\n");
            return 1;
        }
        target = std::move(gl);
    }

    /* ---- media ---- */
    TimerFrameScheduler scheduler(TIMER_INTERVAL_MS);
    PlaybackSession session(cfg);

    std::vector<std::unique_ptr<VideoFileSource>> sources;
    sources.push_back(std::make_unique<VideoFileSource>(
        QString::fromStdString(args[1]), &scheduler));
    if (!right_video.empty())
        sources.push_back(std::make_unique<VideoFileSource>(
            QString::fromStdString(right_video), &scheduler));
    for (auto &src : sources) {
        src->setLoop(false);
        if (!src->open())
            return 2;
    }

    MediaSource *left  = sources[0].get();
    MediaSource *right = sources.size() > 1 ? sources[1].get() : left;
    session.setSources(left, right);

    FrameCapture capture(&scheduler, target.get());
    int exit_code = 0;
    int pending_loads = (int)sources.size();

    auto run_capture = [&]() {
        double t = has_time ? time_s : session.captureTime(left->duration());
        printf("[capture] target time %s (%.3f s)\n", format_timestamp(t).c_str(), t);

        auto done = [&](StitchError e, const ExtractedFramePair &pair) {
            if (e != StitchError::None) {
                fprintf(stderr, "Capture failed: %s%s\n", stitch_error_name(e),
                        is_decode_failure(e) ? " (decode failure)" : "");
                exit_code = e == StitchError::InvalidIntrinsics ? 1 : 3;
            } else if (!save_frame_pair(pair, out_dir)) {
                exit_code = 4;
            }
            app->exit(exit_code);
        };
        if (!capture.start(left, right, session.captureRequest(t), done)) {
            if (exit_code == 0)
                exit_code = 3;
            app->exit(exit_code);
        }
    };

    for (auto &src : sources) {
        QObject::connect(src.get(), &MediaSource::loaded, app.get(), [&]() {
            if (--pending_loads == 0)
                run_capture();
        });
        QObject::connect(src.get(), &MediaSource::error, app.get(), [&](StitchError e) {
            if (capture.busy())
                return;
            fprintf(stderr, "Media error: %s\n", stitch_error_name(e));
            exit_code = 2;
            app->exit(exit_code);
        });
    }

    int rc = app->exec();
    return exit_code ? exit_code : rc;
}
