/*
 * GLES renderer for the fisheye planes.  Must be used with a current
 * OpenGL ES 3.1 context; the owner calls initialize() once the context
 * exists and release() before it goes away.
 */

#ifndef DUOSTITCH_PANORAMA_RENDERER_H
#define DUOSTITCH_PANORAMA_RENDERER_H

#include <utility>
#include <vector>

#include <GLES3/gl31.h>

#include <opencv2/core.hpp>

#include "fisheye_shaders.h"
#include "panorama_scene.h"

class PanoramaRenderer {
public:
    PanoramaRenderer();
    ~PanoramaRenderer();

    bool initialize();
    void release();
    bool ready() const { return gl_ready; }

    /* Slot 0 holds the stacked frame or the left frame, slot 1 the right. */
    bool uploadFrame(int slot, const cv::Mat &rgb);
    bool hasFrame(int slot) const { return textures[slot] != 0; }

    /* Draws the composer's draw list in order. */
    bool drawScene(const PanoramaComposer &composer, TextureLayout layout,
                   const cv::Matx44f &view_proj);

    /* Draws one plane alone, opaque. */
    bool drawPlane(Side side, const CameraIntrinsics &in,
                   const ColorCorrection &color, TextureLayout layout,
                   const PlanePose &pose, const cv::Matx44f &view_proj);

private:
    bool   gl_ready;
    GLuint plane_vao, plane_vbo;
    GLuint textures[2];
    cv::Size texture_sizes[2];
    std::vector<std::pair<ShaderVariant, GLuint>> programs;

    GLuint programFor(const ShaderVariant &v);
    bool draw(const ShaderVariant &v, const CameraIntrinsics &in,
              const ColorCorrection &color, const PlanePose &pose,
              const cv::Matx44f &view_proj, float seam, float blend_width);
};

#endif
