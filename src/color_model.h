/*
 * Per-camera color correction.
 *
 * Two stages, applied in order and each skipped when at identity:
 *   1. LAB transfer: lab' = lab * lab_scale + lab_offset, in the 0-255
 *      Lab convention used by OpenCV for 8-bit images
 *      (L * 255 / 100, a + 128, b + 128).
 *   2. Legacy grading: RGB gain, temperature, brightness, contrast
 *      around mid-gray, HSL saturation.
 *
 * All colors are RGB in [0,1].
 */

#ifndef DUOSTITCH_COLOR_MODEL_H
#define DUOSTITCH_COLOR_MODEL_H

#include <opencv2/core.hpp>

struct ColorCorrection {
    /* legacy */
    float brightness = 0.0f;        /* [-0.5, 0.5] */
    float contrast   = 1.0f;        /* [0.5, 1.5]  */
    float saturation = 1.0f;        /* [0, 2]      */
    float color_balance[3] = { 1.0f, 1.0f, 1.0f };
    float temperature = 0.0f;       /* [-1, 1]     */

    /* LAB transfer */
    float lab_scale[3]  = { 1.0f, 1.0f, 1.0f };
    float lab_offset[3] = { 0.0f, 0.0f, 0.0f };
};

bool operator==(const ColorCorrection &a, const ColorCorrection &b);
bool operator!=(const ColorCorrection &a, const ColorCorrection &b);

bool lab_is_identity(const ColorCorrection &cc);
bool legacy_is_identity(const ColorCorrection &cc);

/* Clamps the legacy fields into their documented ranges. */
void clamp_color_correction(ColorCorrection *cc);

cv::Vec3f rgb_to_lab(const cv::Vec3f &rgb);
cv::Vec3f lab_to_rgb(const cv::Vec3f &lab);
cv::Vec3f rgb_to_hsl(const cv::Vec3f &rgb);
cv::Vec3f hsl_to_rgb(const cv::Vec3f &hsl);

cv::Vec3f apply_lab_transfer(const cv::Vec3f &rgb, const ColorCorrection &cc);
cv::Vec3f apply_legacy_grading(const cv::Vec3f &rgb, const ColorCorrection &cc);
cv::Vec3f apply_color_correction(const cv::Vec3f &rgb, const ColorCorrection &cc);

/* In-place correction of an 8-bit RGB or RGBA image; alpha is kept.
 * Returns false for any other pixel format. */
bool apply_color_correction(cv::Mat &image, const ColorCorrection &cc);

#endif
