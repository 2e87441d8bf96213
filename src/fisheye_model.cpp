#include "fisheye_model.h"

#include <cmath>
#include <cstdio>

const char *side_name(Side side)
{
    return side == Side::Left ? SideTraits<Side::Left>::name
                              : SideTraits<Side::Right>::name;
}

/* ========================================================================
 * Intrinsics
 * ======================================================================== */

static bool fail(std::string *reason, const char *msg)
{
    if (reason)
        *reason = msg;
    return false;
}

bool validate_lens_profile(const LensProfile &p, std::string *reason)
{
    if (p.width <= 0 || p.height <= 0)
        return fail(reason, "image size must be positive");
    if (!(p.fx > 0.0) || !(p.fy > 0.0) ||
        !std::isfinite(p.fx) || !std::isfinite(p.fy))
        return fail(reason, "focal lengths must be positive");
    if (!std::isfinite(p.cx) || !std::isfinite(p.cy))
        return fail(reason, "principal point must be finite");
    if (p.distortion.size() != 4)
        return fail(reason, "expected exactly 4 distortion coefficients");
    for (double k : p.distortion)
        if (!std::isfinite(k))
            return fail(reason, "distortion coefficients must be finite");
    return true;
}

bool validate_intrinsics(const CameraIntrinsics &in, std::string *reason)
{
    if (in.width <= 0 || in.height <= 0)
        return fail(reason, "image size must be positive");
    if (!(in.fx > 0.0f) || !(in.fy > 0.0f) ||
        !std::isfinite(in.fx) || !std::isfinite(in.fy))
        return fail(reason, "focal lengths must be positive");
    if (!std::isfinite(in.cx) || !std::isfinite(in.cy))
        return fail(reason, "principal point must be finite");
    for (float k : in.d)
        if (!std::isfinite(k))
            return fail(reason, "distortion coefficients must be finite");
    return true;
}

bool normalize_intrinsics(const LensProfile &p, CameraIntrinsics *out,
                          std::string *reason)
{
    if (!validate_lens_profile(p, reason))
        return false;

    CameraIntrinsics in;
    in.width  = p.width;
    in.height = p.height;
    in.fx = (float)(p.fx / p.width);
    in.fy = (float)(p.fy / p.height);
    in.cx = (float)(p.cx / p.width);
    in.cy = (float)(p.cy / p.height);
    for (int i = 0; i < 4; i++)
        in.d[i] = (float)p.distortion[i];

    *out = in;
    return true;
}

/* ========================================================================
 * Distortion
 * ======================================================================== */

float distortion_scale(float r, const float d[4])
{
    if (r <= 0.0f)
        return 1.0f;

    /* theta_d / theta = 1 + k1 t^2 + k2 t^4 + k3 t^6 + k4 t^8 */
    float theta = std::atan(r);
    float t2 = theta * theta;
    return 1.0f + t2 * (d[0] + t2 * (d[1] + t2 * (d[2] + t2 * d[3])));
}

cv::Point2f expand_plane_uv(const cv::Point2f &uv)
{
    return cv::Point2f(uv.x * 2.0f - 0.5f, uv.y * 2.0f - 0.5f);
}

cv::Point2f undistort_point(const cv::Point2f &p, const CameraIntrinsics &in)
{
    float x = (p.x - in.cx) / in.fx;
    float y = (p.y - in.cy) / in.fy;
    float s = distortion_scale(std::sqrt(x * x + y * y), in.d);
    return cv::Point2f(in.fx * (x * s) + in.cx, in.fy * (y * s) + in.cy);
}

bool plane_to_texture(Side side, const cv::Point2f &uv,
                      const CameraIntrinsics &in, TextureLayout layout,
                      cv::Point2f *tex)
{
    if (side == Side::Left)
        return plane_to_texture<Side::Left>(uv, in, layout, tex);
    return plane_to_texture<Side::Right>(uv, in, layout, tex);
}

/* ========================================================================
 * Remap tables
 * ======================================================================== */

template <Side S>
static void fill_sample_maps(const CameraIntrinsics &in, TextureLayout layout,
                             cv::Size out_size, cv::Size tex_size,
                             cv::Mat &map_x, cv::Mat &map_y, cv::Mat &mask)
{
    for (int row = 0; row < out_size.height; row++) {
        float *mx = map_x.ptr<float>(row);
        float *my = map_y.ptr<float>(row);
        uchar *mk = mask.ptr<uchar>(row);
        float v = (row + 0.5f) / out_size.height;

        for (int col = 0; col < out_size.width; col++) {
            cv::Point2f uv((col + 0.5f) / out_size.width, v);
            cv::Point2f tex;
            if (plane_to_texture<S>(uv, in, layout, &tex)) {
                mx[col] = tex.x * tex_size.width  - 0.5f;
                my[col] = tex.y * tex_size.height - 0.5f;
                mk[col] = 255;
            } else {
                mx[col] = -1.0f;
                my[col] = -1.0f;
                mk[col] = 0;
            }
        }
    }
}

void build_sample_maps(Side side, const CameraIntrinsics &in,
                       TextureLayout layout, cv::Size out_size,
                       cv::Size tex_size, cv::Mat *map_x, cv::Mat *map_y,
                       cv::Mat *mask)
{
    map_x->create(out_size, CV_32FC1);
    map_y->create(out_size, CV_32FC1);
    mask->create(out_size, CV_8UC1);

    if (side == Side::Left)
        fill_sample_maps<Side::Left>(in, layout, out_size, tex_size,
                                     *map_x, *map_y, *mask);
    else
        fill_sample_maps<Side::Right>(in, layout, out_size, tex_size,
                                      *map_x, *map_y, *mask);

    printf("[model] %s sample maps: %dx%d from %dx%d (%s)\n",
           side_name(side), out_size.width, out_size.height,
           tex_size.width, tex_size.height,
           layout == TextureLayout::Stacked ? "stacked" : "dual");
}
