/*
 * On-screen panorama viewer: draws the composer's planes for the
 * session's current frames and handles the interactive controls.
 */

#ifndef DUOSTITCH_PANORAMA_WIDGET_H
#define DUOSTITCH_PANORAMA_WIDGET_H

#include <chrono>
#include <deque>
#include <string>

#include <QOpenGLWidget>
#include <QPoint>

#include "panorama_recorder.h"
#include "panorama_renderer.h"
#include "panorama_scene.h"

class PlaybackSession;
class QTimer;

class PanoramaWidget : public QOpenGLWidget {
    Q_OBJECT

public:
    explicit PanoramaWidget(PlaybackSession *session, QWidget *parent = nullptr);
    ~PanoramaWidget();

    /* Hands the render target to a capture; the viewer stops drawing. */
    void setSuspended(bool on);
    bool suspended() const { return suspended_; }

    void setRecordPath(const std::string &path) { record_path = path; }

signals:
    void captureRequested();

protected:
    void initializeGL() override;
    void paintGL() override;
    void resizeGL(int w, int h) override;
    void keyPressEvent(QKeyEvent *e) override;
    void mousePressEvent(QMouseEvent *e) override;
    void mouseMoveEvent(QMouseEvent *e) override;
    void wheelEvent(QWheelEvent *e) override;

private:
    PlaybackSession *session;
    PanoramaComposer composer;
    PanoramaRenderer renderer;
    ViewerCamera     camera;

    QTimer *timer;
    bool    suspended_;
    QPoint  last_mouse;

    PanoramaRecorder recorder;
    std::string      record_path;

    /* FPS tracking */
    std::deque<std::chrono::steady_clock::time_point> frame_times;
    std::chrono::steady_clock::time_point last_fps_print;
    double current_fps;

    void adjustParameters(float axis_delta, float intersect_delta);
    void cycleBlendWidth();
    void toggleRecording();
    void togglePause();
    void uploadFrames();
    void recordFrame();
    void drawOverlay();
};

#endif
