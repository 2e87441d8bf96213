/*
 * Panorama scene composition.
 *
 * Two planes, one per camera, arranged by the five stitch scalars.  The
 * composer keeps an immutable snapshot of everything that affects the
 * rendered geometry (RenderKey) and rebuilds its draw list whenever a
 * different snapshot is adopted.
 *
 * Coordinates follow the usual GL conventions: right-handed, y up,
 * cameras look down -z before rotation.  Plane rotations are Euler XYZ.
 */

#ifndef DUOSTITCH_PANORAMA_SCENE_H
#define DUOSTITCH_PANORAMA_SCENE_H

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "color_model.h"
#include "fisheye_model.h"
#include "stitch_config.h"

struct StitchParameters {
    float camera_axis_offset = DEFAULT_AXIS_OFFSET;
    float intersect   = 0.5f;
    float x_ty        = 0.0f;
    float x_rz        = 0.0f;
    float z_rx        = 0.0f;
    float blend_width = 0.0f;
};

bool operator==(const StitchParameters &a, const StitchParameters &b);
bool operator!=(const StitchParameters &a, const StitchParameters &b);

bool validate_stitch_parameters(const StitchParameters &p, std::string *reason);

struct PlanePose {
    cv::Vec3f position;
    cv::Vec3f rotation;     /* Euler XYZ, radians */
    float     width;
    float     height;
};

struct CameraPose {
    cv::Vec3f position;
    float yaw;              /* about world Y, radians */
    float pitch;            /* about local X, radians */
    float fov_deg;          /* vertical */
    float aspect;
    float near_z, far_z;
};

PlanePose plane_pose(Side side, const StitchParameters &p);

/* Plane u at which the right plane meets the left one. */
float seam_u(const StitchParameters &p);

/* Head-on geometry of the calibration capture: plane at the origin,
 * camera at distance 1 whose frustum exactly fits the plane. */
PlanePose  capture_plane_pose();
CameraPose capture_camera_pose();

cv::Matx44f euler_xyz_matrix(const cv::Vec3f &rotation);
cv::Matx44f plane_model_matrix(const PlanePose &pose);
cv::Matx44f camera_view_matrix(const CameraPose &cam);
cv::Matx44f perspective_matrix(float fov_deg, float aspect,
                               float near_z, float far_z);

/* ========================================================================
 * Composer
 * ======================================================================== */

struct RenderKey {
    StitchParameters params;
    ColorCorrection  left_color;
    ColorCorrection  right_color;
};

bool operator==(const RenderKey &a, const RenderKey &b);

struct DrawCommand {
    Side      side;
    PlanePose pose;
    bool      depth_write;
    bool      blend;
    float     seam_u;
    float     blend_width;
    ColorCorrection color;
};

class PanoramaComposer {
public:
    PanoramaComposer();

    bool setIntrinsics(const CameraIntrinsics &left,
                       const CameraIntrinsics &right, std::string *reason);
    bool hasIntrinsics() const { return has_intrinsics; }
    const CameraIntrinsics &intrinsics(Side side) const;

    /* Adopts `key` as the current snapshot.  Returns true and rebuilds
     * the draw list when it differs from the previous one. */
    bool update(const RenderKey &key);

    const RenderKey &key() const { return current; }
    uint64_t generation() const { return gen; }

    /* Left plane first (opaque base layer), right plane second. */
    const std::vector<DrawCommand> &drawList() const { return draws; }

private:
    CameraIntrinsics left_in, right_in;
    bool has_intrinsics;
    RenderKey current;
    uint64_t gen;
    std::vector<DrawCommand> draws;

    void rebuild();
};

/* ========================================================================
 * Interactive viewer camera
 * ======================================================================== */

class ViewerCamera {
public:
    ViewerCamera();

    void setAxisOffset(float offset);
    void drag(float dx_px, float dy_px);
    void zoom(float delta);

    float yaw() const { return yaw_; }
    float pitch() const { return pitch_; }
    float fov() const { return fov_; }

    CameraPose pose(float aspect) const;

private:
    float offset_;
    float yaw_, pitch_;
    float fov_;
};

#endif
