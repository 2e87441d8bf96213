#include "panorama_widget.h"

#include <algorithm>
#include <cstdio>

#include <QFont>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QTimer>
#include <QWheelEvent>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "media_source.h"
#include "playback_session.h"

static const float BLEND_STEPS[] = { 0.0f, 0.05f, 0.1f, 0.2f };
#define AXIS_OFFSET_STEP 0.01f
#define INTERSECT_STEP   0.005f

/* ---- constructor ---- */

PanoramaWidget::PanoramaWidget(PlaybackSession *session_in, QWidget *parent)
    : QOpenGLWidget(parent), session(session_in), timer(nullptr),
      suspended_(false), record_path("panorama.mp4"), current_fps(0.0)
{
    setWindowTitle("Duo Stitch");
    setFocusPolicy(Qt::StrongFocus);

    std::string reason;
    if (!composer.setIntrinsics(session->intrinsics(Side::Left),
                                session->intrinsics(Side::Right), &reason))
        fprintf(stderr, "[viewer] intrinsics rejected: %s\n", reason.c_str());

    camera.setAxisOffset(session->parameters().camera_axis_offset);

    printf("\nControls:\n");
    printf("  ESC    - Exit\n");
    printf("  Drag   - Look around\n");
    printf("  Wheel  - Zoom\n");
    printf("  +/-    - Camera axis offset +/- %.2f\n", AXIS_OFFSET_STEP);
    printf("  [/]    - Intersect -/+ %.3f\n", INTERSECT_STEP);
    printf("  B      - Cycle seam blend width\n");
    printf("  R      - Start/stop recording\n");
    printf("  C      - Capture calibration frames\n");
    printf("  Space  - Pause/resume\n");
    printf("============================================================\n\n");

    last_fps_print = std::chrono::steady_clock::now();
}

PanoramaWidget::~PanoramaWidget()
{
    if (recorder.active())
        recorder.stop();
    makeCurrent();
    renderer.release();
    doneCurrent();
}

/* ---- GL lifecycle ---- */

void PanoramaWidget::initializeGL()
{
    if (!renderer.initialize()) {
        fprintf(stderr, "[viewer] renderer initialisation failed\n");
        return;
    }

    timer = new QTimer(this);
    connect(timer, &QTimer::timeout, this, QOverload<>::of(&QWidget::update));
    timer->start(TIMER_INTERVAL_MS);
}

void PanoramaWidget::resizeGL(int w, int h)
{
    glViewport(0, 0, w, h);
}

void PanoramaWidget::setSuspended(bool on)
{
    suspended_ = on;
    if (!timer)
        return;
    if (on)
        timer->stop();
    else
        timer->start(TIMER_INTERVAL_MS);
    printf("[viewer] %s\n", on ? "suspended for capture" : "resumed");
}

/* ---- controls ---- */

void PanoramaWidget::adjustParameters(float axis_delta, float intersect_delta)
{
    StitchParameters p = session->parameters();
    p.camera_axis_offset += axis_delta;
    p.intersect = std::clamp(p.intersect + intersect_delta, 0.0f, 1.0f);

    std::string reason;
    if (!session->replaceParameters(p, &reason)) {
        fprintf(stderr, "[viewer] parameters rejected: %s\n", reason.c_str());
        return;
    }
    camera.setAxisOffset(p.camera_axis_offset);
    printf("axis offset = %.3f  intersect = %.4f\n",
           p.camera_axis_offset, p.intersect);
}

void PanoramaWidget::cycleBlendWidth()
{
    const int n = (int)(sizeof(BLEND_STEPS) / sizeof(BLEND_STEPS[0]));
    float cur = session->parameters().blend_width;
    int idx = 0;
    for (int i = 0; i < n; i++)
        if (BLEND_STEPS[i] <= cur)
            idx = i;
    float next = BLEND_STEPS[(idx + 1) % n];
    if (session->setBlendWidth(next))
        printf("blend width = %.2f\n", next);
}

void PanoramaWidget::toggleRecording()
{
    if (recorder.active()) {
        if (!recorder.stop())
            fprintf(stderr, "[viewer] recording discarded\n");
        return;
    }
    cv::Size size(width() * devicePixelRatio(), height() * devicePixelRatio());
    if (!recorder.start(record_path, RECORD_FPS, size))
        fprintf(stderr, "[viewer] cannot start recording\n");
}

void PanoramaWidget::togglePause()
{
    MediaSource *sources[] = { session->source(Side::Left),
                               session->source(Side::Right) };
    bool pause = sources[0] && sources[0]->isPlaying();
    for (int i = 0; i < 2; i++) {
        if (!sources[i] || (i == 1 && sources[1] == sources[0]))
            continue;
        if (pause)
            sources[i]->pause();
        else
            sources[i]->play();
    }
    printf("%s\n", pause ? "paused" : "playing");
}

void PanoramaWidget::keyPressEvent(QKeyEvent *e)
{
    switch (e->key()) {
    case Qt::Key_Escape:
        close();
        return;
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        adjustParameters(AXIS_OFFSET_STEP, 0.0f);
        return;
    case Qt::Key_Minus:
        adjustParameters(-AXIS_OFFSET_STEP, 0.0f);
        return;
    case Qt::Key_BracketRight:
        adjustParameters(0.0f, INTERSECT_STEP);
        return;
    case Qt::Key_BracketLeft:
        adjustParameters(0.0f, -INTERSECT_STEP);
        return;
    case Qt::Key_B:
        cycleBlendWidth();
        return;
    case Qt::Key_R:
        toggleRecording();
        return;
    case Qt::Key_C:
        if (!suspended_)
            emit captureRequested();
        return;
    case Qt::Key_Space:
        togglePause();
        return;
    default:
        break;
    }
    QOpenGLWidget::keyPressEvent(e);
}

void PanoramaWidget::mousePressEvent(QMouseEvent *e)
{
    last_mouse = e->pos();
}

void PanoramaWidget::mouseMoveEvent(QMouseEvent *e)
{
    if (!(e->buttons() & Qt::LeftButton))
        return;
    QPoint d = e->pos() - last_mouse;
    last_mouse = e->pos();
    camera.drag((float)d.x(), (float)d.y());
}

void PanoramaWidget::wheelEvent(QWheelEvent *e)
{
    camera.zoom(-(float)e->angleDelta().y());
}

/* ---- per-frame work ---- */

void PanoramaWidget::uploadFrames()
{
    MediaSource *left  = session->source(Side::Left);
    MediaSource *right = session->source(Side::Right);
    if (!left || !right)
        return;

    cv::Mat f = left->currentFrame();
    if (!f.empty())
        renderer.uploadFrame(0, f);
    if (right != left) {
        f = right->currentFrame();
        if (!f.empty())
            renderer.uploadFrame(1, f);
    }
}

/* Reads back the composed planes before the overlay is painted. */
void PanoramaWidget::recordFrame()
{
    int w = width() * devicePixelRatio();
    int h = height() * devicePixelRatio();

    cv::Mat rgba(h, w, CV_8UC4);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(0, 0, w, h, GL_RGBA, GL_UNSIGNED_BYTE, rgba.data);

    cv::Mat rgb;
    cv::cvtColor(rgba, rgb, cv::COLOR_RGBA2RGB);
    cv::flip(rgb, rgb, 0);
    if (!recorder.addFrame(rgb)) {
        fprintf(stderr, "[viewer] window size changed, stopping recording\n");
        recorder.stop();
    }
}

void PanoramaWidget::paintGL()
{
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    if (suspended_ || !renderer.ready() || !session->hasSources())
        return;

    if (composer.update(session->renderKey()))
        camera.setAxisOffset(session->parameters().camera_axis_offset);

    uploadFrames();

    TextureLayout layout = session->layout();
    bool have_frames = renderer.hasFrame(0) &&
                       (layout == TextureLayout::Stacked || renderer.hasFrame(1));
    if (!have_frames)
        return;

    float aspect = height() > 0 ? (float)width() / height() : 1.0f;
    CameraPose cam = camera.pose(aspect);
    cv::Matx44f view_proj =
        perspective_matrix(cam.fov_deg, cam.aspect, cam.near_z, cam.far_z) *
        camera_view_matrix(cam);

    glViewport(0, 0, width() * devicePixelRatio(), height() * devicePixelRatio());
    if (!renderer.drawScene(composer, layout, view_proj))
        return;

    if (recorder.active())
        recordFrame();

    drawOverlay();
}

void PanoramaWidget::drawOverlay()
{
    auto now = std::chrono::steady_clock::now();
    frame_times.push_back(now);
    while ((int)frame_times.size() > FPS_WINDOW)
        frame_times.pop_front();

    if (frame_times.size() >= 2) {
        double elapsed = std::chrono::duration<double>(
            frame_times.back() - frame_times.front()).count();
        current_fps = (double)(frame_times.size() - 1) / elapsed;
    }

    const StitchParameters &p = session->parameters();
    MediaSource *left = session->source(Side::Left);

    char info[256];
    snprintf(info, sizeof(info),
             "FPS: %.1f | t=%.2f s | offset=%.3f intersect=%.4f blend=%.2f%s",
             current_fps, left->currentTime(), p.camera_axis_offset,
             p.intersect, p.blend_width, recorder.active() ? " | REC" : "");

    QPainter painter(this);
    QFont font("monospace", 14);
    font.setBold(true);
    painter.setFont(font);
    painter.setPen(Qt::black);
    painter.drawText(12, 32, info);
    painter.setPen(Qt::white);
    painter.drawText(10, 30, info);
    painter.end();

    double since_print = std::chrono::duration<double>(now - last_fps_print).count();
    if (since_print >= FPS_PRINT_INTERVAL) {
        printf("FPS: %.1f  |  t=%.2f s  offset=%.3f  intersect=%.4f  blend=%.2f  gen=%llu\n",
               current_fps, left->currentTime(), p.camera_axis_offset,
               p.intersect, p.blend_width,
               (unsigned long long)composer.generation());
        last_fps_print = now;
    }
}
