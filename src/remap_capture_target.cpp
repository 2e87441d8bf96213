#include "remap_capture_target.h"

#include <cstdio>
#include <cstring>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

static bool same_intrinsics(const CameraIntrinsics &a, const CameraIntrinsics &b)
{
    return a.width == b.width && a.height == b.height &&
           a.fx == b.fx && a.fy == b.fy && a.cx == b.cx && a.cy == b.cy &&
           std::memcmp(a.d, b.d, sizeof(a.d)) == 0;
}

RemapCaptureTarget::RemapCaptureTarget(cv::Size size)
    : out_size(size)
{
}

const RemapCaptureTarget::MapCache &
RemapCaptureTarget::mapsFor(Side side, const CameraIntrinsics &in,
                            TextureLayout layout, cv::Size tex_size)
{
    if (!cache.valid || cache.side != side || cache.layout != layout ||
        cache.tex_size != tex_size || !same_intrinsics(cache.intrinsics, in)) {
        build_sample_maps(side, in, layout, out_size, tex_size,
                          &cache.map_x, &cache.map_y, &cache.mask);
        cache.valid      = true;
        cache.side       = side;
        cache.layout     = layout;
        cache.intrinsics = in;
        cache.tex_size   = tex_size;
    }
    return cache;
}

bool RemapCaptureTarget::renderSide(Side side, const SideView &view,
                                    TextureLayout layout, const cv::Mat &frame)
{
    if (frame.empty() || frame.type() != CV_8UC3) {
        fprintf(stderr, "[remap] expected an 8-bit RGB frame\n");
        return false;
    }

    const MapCache &maps = mapsFor(side, view.intrinsics, layout, frame.size());

    cv::Mat rgb;
    cv::remap(frame, rgb, maps.map_x, maps.map_y, cv::INTER_LINEAR,
              cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));

    cv::Mat channels[4];
    cv::split(rgb, channels);
    channels[3] = maps.mask;
    cv::merge(channels, 4, rendered);

    return apply_color_correction(rendered, view.color);
}

bool RemapCaptureTarget::encodePng(std::vector<unsigned char> *out)
{
    if (rendered.empty())
        return false;

    /* opaque output, like the GL target: black outside the lens */
    cv::Mat bgr;
    cv::cvtColor(rendered, bgr, cv::COLOR_RGBA2BGR);
    return cv::imencode(".png", bgr, *out);
}
