#include "offscreen_capture_target.h"

#include <cstdio>

#include <QBuffer>
#include <QImage>
#include <QOffscreenSurface>
#include <QOpenGLContext>
#include <QOpenGLFramebufferObject>
#include <QSurfaceFormat>

OffscreenCaptureTarget::OffscreenCaptureTarget(int w, int h)
    : width(w), height(h), has_render(false)
{
}

OffscreenCaptureTarget::~OffscreenCaptureTarget()
{
    if (context && context->makeCurrent(surface.get())) {
        renderer.release();
        fbo.reset();
        context->doneCurrent();
    }
}

bool OffscreenCaptureTarget::initialize()
{
    QSurfaceFormat fmt = QSurfaceFormat::defaultFormat();
    fmt.setRenderableType(QSurfaceFormat::OpenGLES);
    fmt.setVersion(3, 1);

    surface = std::make_unique<QOffscreenSurface>();
    surface->setFormat(fmt);
    surface->create();

    context = std::make_unique<QOpenGLContext>();
    context->setFormat(fmt);
    context->setShareContext(QOpenGLContext::globalShareContext());
    if (!context->create() || !context->makeCurrent(surface.get())) {
        fprintf(stderr, "[offscreen] cannot create an OpenGL ES context\n");
        return false;
    }

    QOpenGLFramebufferObjectFormat fbo_fmt;
    fbo_fmt.setAttachment(QOpenGLFramebufferObject::Depth);
    fbo = std::make_unique<QOpenGLFramebufferObject>(width, height, fbo_fmt);
    if (!fbo->isValid()) {
        fprintf(stderr, "[offscreen] framebuffer %dx%d incomplete\n", width, height);
        context->doneCurrent();
        return false;
    }

    bool ok = renderer.initialize();
    context->doneCurrent();
    if (ok)
        printf("[offscreen] capture target %dx%d ready\n", width, height);
    return ok;
}

bool OffscreenCaptureTarget::renderSide(Side side, const SideView &view,
                                        TextureLayout layout, const cv::Mat &frame)
{
    if (!renderer.ready() || !context->makeCurrent(surface.get()))
        return false;

    int slot = (layout == TextureLayout::Dual && side == Side::Right) ? 1 : 0;

    fbo->bind();
    glViewport(0, 0, width, height);
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    CameraPose cam = capture_camera_pose();
    cv::Matx44f view_proj =
        perspective_matrix(cam.fov_deg, cam.aspect, cam.near_z, cam.far_z) *
        camera_view_matrix(cam);

    bool ok = renderer.uploadFrame(slot, frame) &&
              renderer.drawPlane(side, view.intrinsics, view.color, layout,
                                 capture_plane_pose(), view_proj);
    glFinish();
    fbo->release();
    context->doneCurrent();

    has_render = ok;
    return ok;
}

bool OffscreenCaptureTarget::encodePng(std::vector<unsigned char> *out)
{
    if (!has_render || !context->makeCurrent(surface.get()))
        return false;

    QImage img = fbo->toImage().convertToFormat(QImage::Format_RGB888);
    context->doneCurrent();

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if (!img.save(&buffer, "PNG", 100))
        return false;

    out->assign(bytes.constBegin(), bytes.constEnd());
    return true;
}
