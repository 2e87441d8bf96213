/*
 * Fisheye lens model: intrinsics, the theta -> theta_d distortion
 * polynomial, and the mapping from a point on a panorama plane to a
 * sampling coordinate in the packed source texture.
 *
 * Coordinate conventions:
 *   plane uv     [0,1]^2, origin at the plane's top-left corner
 *   texture uv   [0,1]^2, origin at the first image row
 *
 * In the stacked layout both cameras share one frame: the right camera
 * occupies the upper half (v in [0,0.5]), the left camera the lower
 * half (v in [0.5,1]).  In the dual layout every side has its own frame.
 */

#ifndef DUOSTITCH_FISHEYE_MODEL_H
#define DUOSTITCH_FISHEYE_MODEL_H

#include <string>
#include <vector>

#include <opencv2/core.hpp>

enum class Side { Left, Right };

enum class TextureLayout { Stacked, Dual };

template <Side S> struct SideTraits;

template <> struct SideTraits<Side::Left> {
    static constexpr float v_offset = 0.5f;
    static constexpr const char *name = "left";
};

template <> struct SideTraits<Side::Right> {
    static constexpr float v_offset = 0.0f;
    static constexpr const char *name = "right";
};

const char *side_name(Side side);

/* Lens profile as delivered by the calibration/profile service, in pixels. */
struct LensProfile {
    int    width  = 0;
    int    height = 0;
    double fx = 0.0, fy = 0.0;
    double cx = 0.0, cy = 0.0;
    std::vector<double> distortion;
};

/* Intrinsics in plane-normalised units, consumed read-only by the model. */
struct CameraIntrinsics {
    int   width  = 0;
    int   height = 0;
    float fx = 0.0f, fy = 0.0f;
    float cx = 0.0f, cy = 0.0f;
    float d[4] = { 0.0f, 0.0f, 0.0f, 0.0f };
};

bool validate_lens_profile(const LensProfile &profile, std::string *reason);
bool validate_intrinsics(const CameraIntrinsics &in, std::string *reason);

/* Validates `profile` and divides focal lengths and principal point by
 * the frame size.  `out` is untouched on failure. */
bool normalize_intrinsics(const LensProfile &profile, CameraIntrinsics *out,
                          std::string *reason);

/* theta_d / theta for a normalised radius r; exactly 1 for r == 0. */
float distortion_scale(float r, const float d[4]);

/* The plane shows the lens centre at 2x: uv * 2 - 0.5. */
cv::Point2f expand_plane_uv(const cv::Point2f &uv);

/* Maps an expanded plane point to lens-normalised source space. */
cv::Point2f undistort_point(const cv::Point2f &p, const CameraIntrinsics &in);

/*
 * Maps plane uv to the texture coordinate sampled for side S.  Returns
 * false when the coordinate falls outside that side's active region;
 * such fragments are fully transparent.
 */
template <Side S>
bool plane_to_texture(const cv::Point2f &uv, const CameraIntrinsics &in,
                      TextureLayout layout, cv::Point2f *tex)
{
    cv::Point2f lens = undistort_point(expand_plane_uv(uv), in);

    float v  = lens.y;
    float lo = 0.0f, hi = 1.0f;
    if (layout == TextureLayout::Stacked) {
        v  = lens.y * 0.5f + SideTraits<S>::v_offset;
        lo = SideTraits<S>::v_offset;
        hi = lo + 0.5f;
    }

    *tex = cv::Point2f(lens.x, v);
    return lens.x >= 0.0f && lens.x <= 1.0f && v >= lo && v <= hi;
}

bool plane_to_texture(Side side, const cv::Point2f &uv,
                      const CameraIntrinsics &in, TextureLayout layout,
                      cv::Point2f *tex);

/*
 * Builds cv::remap tables that render side S of a `tex_size` source
 * onto an `out_size` plane viewed head-on.  Pixels outside the active
 * region map to (-1,-1) and are flagged 0 in `mask`.
 */
void build_sample_maps(Side side, const CameraIntrinsics &in,
                       TextureLayout layout, cv::Size out_size,
                       cv::Size tex_size, cv::Mat *map_x, cv::Mat *map_y,
                       cv::Mat *mask);

#endif
