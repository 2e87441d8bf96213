/*
 * CPU capture target.  The head-on capture camera frames the plane
 * exactly, so each output pixel maps linearly to plane uv and the GL
 * render reduces to a cv::remap through precomputed sample maps.
 */

#ifndef DUOSTITCH_REMAP_CAPTURE_TARGET_H
#define DUOSTITCH_REMAP_CAPTURE_TARGET_H

#include "frame_capture.h"

class RemapCaptureTarget : public CaptureRenderTarget {
public:
    explicit RemapCaptureTarget(cv::Size size = cv::Size(CAPTURE_WIDTH, CAPTURE_HEIGHT));

    bool renderSide(Side side, const SideView &view, TextureLayout layout,
                    const cv::Mat &frame) override;
    bool encodePng(std::vector<unsigned char> *out) override;

    /* Last render, 8-bit RGBA. */
    const cv::Mat &image() const { return rendered; }

private:
    struct MapCache {
        bool             valid = false;
        Side             side = Side::Left;
        TextureLayout    layout = TextureLayout::Stacked;
        CameraIntrinsics intrinsics;
        cv::Size         tex_size;
        cv::Mat          map_x, map_y, mask;
    };

    cv::Size out_size;
    MapCache cache;
    cv::Mat  rendered;

    const MapCache &mapsFor(Side side, const CameraIntrinsics &in,
                            TextureLayout layout, cv::Size tex_size);
};

#endif
