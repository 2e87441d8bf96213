#include "panorama_scene.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

static const float DEG2RAD = (float)(M_PI / 180.0);

bool operator==(const StitchParameters &a, const StitchParameters &b)
{
    return a.camera_axis_offset == b.camera_axis_offset &&
           a.intersect == b.intersect && a.x_ty == b.x_ty &&
           a.x_rz == b.x_rz && a.z_rx == b.z_rx &&
           a.blend_width == b.blend_width;
}

bool operator!=(const StitchParameters &a, const StitchParameters &b)
{
    return !(a == b);
}

bool validate_stitch_parameters(const StitchParameters &p, std::string *reason)
{
    const float v[] = { p.camera_axis_offset, p.intersect, p.x_ty,
                        p.x_rz, p.z_rx, p.blend_width };
    for (float x : v) {
        if (!std::isfinite(x)) {
            if (reason) *reason = "stitch parameters must be finite";
            return false;
        }
    }
    if (p.intersect < 0.0f || p.intersect > 1.0f) {
        if (reason) *reason = "intersect must be within [0,1]";
        return false;
    }
    if (p.blend_width < 0.0f) {
        if (reason) *reason = "blend width must not be negative";
        return false;
    }
    return true;
}

/* ========================================================================
 * Poses
 * ======================================================================== */

PlanePose plane_pose(Side side, const StitchParameters &p)
{
    float shift = (PLANE_WIDTH / 2.0f) * (1.0f - p.intersect);

    PlanePose pose;
    pose.width  = PLANE_WIDTH;
    pose.height = PLANE_HEIGHT;
    if (side == Side::Left) {
        pose.position = cv::Vec3f(0.0f, 0.0f, shift);
        pose.rotation = cv::Vec3f(p.z_rx, 90.0f * DEG2RAD, 0.0f);
    } else {
        pose.position = cv::Vec3f(shift, p.x_ty, 0.0f);
        pose.rotation = cv::Vec3f(0.0f, 0.0f, p.x_rz);
    }
    return pose;
}

float seam_u(const StitchParameters &p)
{
    return 0.5f * p.intersect;
}

PlanePose capture_plane_pose()
{
    PlanePose pose;
    pose.position = cv::Vec3f(0.0f, 0.0f, 0.0f);
    pose.rotation = cv::Vec3f(0.0f, 0.0f, 0.0f);
    pose.width  = PLANE_WIDTH;
    pose.height = PLANE_HEIGHT;
    return pose;
}

CameraPose capture_camera_pose()
{
    CameraPose cam;
    cam.position = cv::Vec3f(0.0f, 0.0f, CAPTURE_CAMERA_DISTANCE);
    cam.yaw   = 0.0f;
    cam.pitch = 0.0f;
    cam.fov_deg = 2.0f * std::atan((PLANE_HEIGHT / 2.0f) / CAPTURE_CAMERA_DISTANCE)
                  / DEG2RAD;
    cam.aspect = PLANE_ASPECT;
    cam.near_z = 0.1f;
    cam.far_z  = 10.0f;
    return cam;
}

/* ========================================================================
 * Matrices
 * ======================================================================== */

static cv::Matx44f rotation_x(float a)
{
    float c = std::cos(a), s = std::sin(a);
    return cv::Matx44f(1, 0,  0, 0,
                       0, c, -s, 0,
                       0, s,  c, 0,
                       0, 0,  0, 1);
}

static cv::Matx44f rotation_y(float a)
{
    float c = std::cos(a), s = std::sin(a);
    return cv::Matx44f( c, 0, s, 0,
                        0, 1, 0, 0,
                       -s, 0, c, 0,
                        0, 0, 0, 1);
}

static cv::Matx44f rotation_z(float a)
{
    float c = std::cos(a), s = std::sin(a);
    return cv::Matx44f(c, -s, 0, 0,
                       s,  c, 0, 0,
                       0,  0, 1, 0,
                       0,  0, 0, 1);
}

static cv::Matx44f translation(const cv::Vec3f &t)
{
    return cv::Matx44f(1, 0, 0, t[0],
                       0, 1, 0, t[1],
                       0, 0, 1, t[2],
                       0, 0, 0, 1);
}

cv::Matx44f euler_xyz_matrix(const cv::Vec3f &r)
{
    return rotation_x(r[0]) * rotation_y(r[1]) * rotation_z(r[2]);
}

cv::Matx44f plane_model_matrix(const PlanePose &pose)
{
    return translation(pose.position) * euler_xyz_matrix(pose.rotation);
}

cv::Matx44f camera_view_matrix(const CameraPose &cam)
{
    return rotation_x(-cam.pitch) * rotation_y(-cam.yaw) *
           translation(-cam.position);
}

cv::Matx44f perspective_matrix(float fov_deg, float aspect,
                               float near_z, float far_z)
{
    float f = 1.0f / std::tan(fov_deg * DEG2RAD / 2.0f);
    return cv::Matx44f(f / aspect, 0, 0, 0,
                       0, f, 0, 0,
                       0, 0, (far_z + near_z) / (near_z - far_z),
                             2.0f * far_z * near_z / (near_z - far_z),
                       0, 0, -1, 0);
}

/* ========================================================================
 * PanoramaComposer
 * ======================================================================== */

bool operator==(const RenderKey &a, const RenderKey &b)
{
    return a.params == b.params && a.left_color == b.left_color &&
           a.right_color == b.right_color;
}

PanoramaComposer::PanoramaComposer()
    : has_intrinsics(false), gen(0)
{
    rebuild();
}

bool PanoramaComposer::setIntrinsics(const CameraIntrinsics &left,
                                     const CameraIntrinsics &right,
                                     std::string *reason)
{
    std::string why;
    if (!validate_intrinsics(left, &why)) {
        if (reason) *reason = "left: " + why;
        return false;
    }
    if (!validate_intrinsics(right, &why)) {
        if (reason) *reason = "right: " + why;
        return false;
    }
    left_in  = left;
    right_in = right;
    has_intrinsics = true;
    rebuild();
    return true;
}

const CameraIntrinsics &PanoramaComposer::intrinsics(Side side) const
{
    return side == Side::Left ? left_in : right_in;
}

bool PanoramaComposer::update(const RenderKey &key)
{
    if (key == current)
        return false;
    current = key;
    rebuild();

    const StitchParameters &p = current.params;
    printf("[scene] layout #%llu: offset=%.3f intersect=%.4f xTy=%.4f "
           "xRz=%.4f zRx=%.4f blend=%.3f\n",
           (unsigned long long)gen, p.camera_axis_offset, p.intersect,
           p.x_ty, p.x_rz, p.z_rx, p.blend_width);
    return true;
}

void PanoramaComposer::rebuild()
{
    const StitchParameters &p = current.params;
    bool blend = p.blend_width > 0.0f;

    draws.clear();

    DrawCommand left;
    left.side        = Side::Left;
    left.pose        = plane_pose(Side::Left, p);
    left.depth_write = true;
    left.blend       = false;
    left.seam_u      = 0.0f;
    left.blend_width = 0.0f;
    left.color       = current.left_color;
    draws.push_back(left);

    DrawCommand right;
    right.side        = Side::Right;
    right.pose        = plane_pose(Side::Right, p);
    right.depth_write = !blend;
    right.blend       = blend;
    right.seam_u      = seam_u(p);
    right.blend_width = p.blend_width;
    right.color       = current.right_color;
    draws.push_back(right);

    gen++;
}

/* ========================================================================
 * ViewerCamera
 * ======================================================================== */

ViewerCamera::ViewerCamera()
    : offset_(DEFAULT_AXIS_OFFSET), yaw_(0.0f), pitch_(0.0f),
      fov_(VIEWER_FOV_DEG)
{
}

void ViewerCamera::setAxisOffset(float offset)
{
    offset_ = offset;
}

void ViewerCamera::drag(float dx_px, float dy_px)
{
    const float min_yaw   = (VIEWER_YAW_CENTER_DEG - VIEWER_YAW_RANGE_DEG / 2.0f) * DEG2RAD;
    const float max_yaw   = (VIEWER_YAW_CENTER_DEG + VIEWER_YAW_RANGE_DEG / 2.0f) * DEG2RAD;
    const float min_pitch = (VIEWER_PITCH_CENTER_DEG - VIEWER_PITCH_RANGE_DEG / 2.0f) * DEG2RAD;
    const float max_pitch = (VIEWER_PITCH_CENTER_DEG + VIEWER_PITCH_RANGE_DEG / 2.0f) * DEG2RAD;

    /* pitch is inverted: dragging down tilts the view up */
    yaw_   = std::clamp(yaw_ + dx_px * VIEWER_PAN_SENSITIVITY, min_yaw, max_yaw);
    pitch_ = std::clamp(pitch_ + dy_px * VIEWER_PAN_SENSITIVITY, min_pitch, max_pitch);
}

void ViewerCamera::zoom(float delta)
{
    fov_ = std::clamp(fov_ + delta * VIEWER_ZOOM_SENSITIVITY,
                      VIEWER_MIN_FOV_DEG, VIEWER_MAX_FOV_DEG);
}

CameraPose ViewerCamera::pose(float aspect) const
{
    CameraPose cam;
    cam.position = cv::Vec3f(offset_, 0.0f, offset_);
    cam.yaw     = yaw_;
    cam.pitch   = pitch_;
    cam.fov_deg = fov_;
    cam.aspect  = aspect;
    cam.near_z  = VIEWER_NEAR;
    cam.far_z   = VIEWER_FAR;
    return cam;
}
