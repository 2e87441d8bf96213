/*
 * GL capture target: renders into a 1920x1080 framebuffer object on a
 * private offscreen context, using the same fisheye programs as the
 * on-screen viewer.  Requires a QGuiApplication.
 */

#ifndef DUOSTITCH_OFFSCREEN_CAPTURE_TARGET_H
#define DUOSTITCH_OFFSCREEN_CAPTURE_TARGET_H

#include <memory>

#include "frame_capture.h"
#include "panorama_renderer.h"

class QOffscreenSurface;
class QOpenGLContext;
class QOpenGLFramebufferObject;

class OffscreenCaptureTarget : public CaptureRenderTarget {
public:
    explicit OffscreenCaptureTarget(int width = CAPTURE_WIDTH,
                                    int height = CAPTURE_HEIGHT);
    ~OffscreenCaptureTarget();

    bool initialize();

    bool renderSide(Side side, const SideView &view, TextureLayout layout,
                    const cv::Mat &frame) override;
    bool encodePng(std::vector<unsigned char> *out) override;

private:
    int width, height;
    std::unique_ptr<QOffscreenSurface>        surface;
    std::unique_ptr<QOpenGLContext>           context;
    std::unique_ptr<QOpenGLFramebufferObject> fbo;
    PanoramaRenderer renderer;
    bool has_render;
};

#endif
