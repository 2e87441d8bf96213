#include "color_model.h"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

bool operator==(const ColorCorrection &a, const ColorCorrection &b)
{
    if (a.brightness != b.brightness || a.contrast != b.contrast ||
        a.saturation != b.saturation || a.temperature != b.temperature)
        return false;
    for (int i = 0; i < 3; i++) {
        if (a.color_balance[i] != b.color_balance[i] ||
            a.lab_scale[i]     != b.lab_scale[i] ||
            a.lab_offset[i]    != b.lab_offset[i])
            return false;
    }
    return true;
}

bool operator!=(const ColorCorrection &a, const ColorCorrection &b)
{
    return !(a == b);
}

bool lab_is_identity(const ColorCorrection &cc)
{
    for (int i = 0; i < 3; i++)
        if (cc.lab_scale[i] != 1.0f || cc.lab_offset[i] != 0.0f)
            return false;
    return true;
}

bool legacy_is_identity(const ColorCorrection &cc)
{
    return cc.brightness == 0.0f && cc.contrast == 1.0f &&
           cc.saturation == 1.0f && cc.temperature == 0.0f &&
           cc.color_balance[0] == 1.0f && cc.color_balance[1] == 1.0f &&
           cc.color_balance[2] == 1.0f;
}

void clamp_color_correction(ColorCorrection *cc)
{
    cc->brightness  = std::clamp(cc->brightness, -0.5f, 0.5f);
    cc->contrast    = std::clamp(cc->contrast, 0.5f, 1.5f);
    cc->saturation  = std::clamp(cc->saturation, 0.0f, 2.0f);
    cc->temperature = std::clamp(cc->temperature, -1.0f, 1.0f);
    for (int i = 0; i < 3; i++)
        cc->color_balance[i] = std::max(cc->color_balance[i], 0.0f);
}

/* ========================================================================
 * RGB <-> Lab (sRGB, D65)
 * ======================================================================== */

static const float XN = 0.950456f;
static const float ZN = 1.088754f;
static const float LAB_EPS = 0.008856f;
static const float LAB_EPS_CBRT = 0.206893f;

static float srgb_to_linear(float c)
{
    return c <= 0.04045f ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f);
}

static float linear_to_srgb(float c)
{
    return c <= 0.0031308f ? c * 12.92f
                           : 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
}

static float lab_f(float t)
{
    return t > LAB_EPS ? std::cbrt(t) : 7.787f * t + 16.0f / 116.0f;
}

static float lab_f_inv(float f)
{
    return f > LAB_EPS_CBRT ? f * f * f : (f - 16.0f / 116.0f) / 7.787f;
}

cv::Vec3f rgb_to_lab(const cv::Vec3f &rgb)
{
    float r = srgb_to_linear(rgb[0]);
    float g = srgb_to_linear(rgb[1]);
    float b = srgb_to_linear(rgb[2]);

    float x = 0.4124564f * r + 0.3575761f * g + 0.1804375f * b;
    float y = 0.2126729f * r + 0.7151522f * g + 0.0721750f * b;
    float z = 0.0193339f * r + 0.1191920f * g + 0.9503041f * b;

    float fx = lab_f(x / XN);
    float fy = lab_f(y);
    float fz = lab_f(z / ZN);

    float L = 116.0f * fy - 16.0f;
    float A = 500.0f * (fx - fy);
    float B = 200.0f * (fy - fz);

    return cv::Vec3f(L * 255.0f / 100.0f, A + 128.0f, B + 128.0f);
}

cv::Vec3f lab_to_rgb(const cv::Vec3f &lab)
{
    float L = lab[0] * 100.0f / 255.0f;
    float A = lab[1] - 128.0f;
    float B = lab[2] - 128.0f;

    float fy = (L + 16.0f) / 116.0f;
    float fx = fy + A / 500.0f;
    float fz = fy - B / 200.0f;

    float x = lab_f_inv(fx) * XN;
    float y = lab_f_inv(fy);
    float z = lab_f_inv(fz) * ZN;

    float r =  3.2404542f * x - 1.5371385f * y - 0.4985314f * z;
    float g = -0.9692660f * x + 1.8760108f * y + 0.0415560f * z;
    float b =  0.0556434f * x - 0.2040259f * y + 1.0572252f * z;

    return cv::Vec3f(std::clamp(linear_to_srgb(std::max(r, 0.0f)), 0.0f, 1.0f),
                     std::clamp(linear_to_srgb(std::max(g, 0.0f)), 0.0f, 1.0f),
                     std::clamp(linear_to_srgb(std::max(b, 0.0f)), 0.0f, 1.0f));
}

/* ========================================================================
 * RGB <-> HSL
 * ======================================================================== */

cv::Vec3f rgb_to_hsl(const cv::Vec3f &c)
{
    float max_c = std::max(std::max(c[0], c[1]), c[2]);
    float min_c = std::min(std::min(c[0], c[1]), c[2]);
    float l = (max_c + min_c) / 2.0f;

    if (max_c == min_c)
        return cv::Vec3f(0.0f, 0.0f, l);

    float d = max_c - min_c;
    float s = l > 0.5f ? d / (2.0f - max_c - min_c) : d / (max_c + min_c);

    float h;
    if (max_c == c[0])
        h = (c[1] - c[2]) / d + (c[1] < c[2] ? 6.0f : 0.0f);
    else if (max_c == c[1])
        h = (c[2] - c[0]) / d + 2.0f;
    else
        h = (c[0] - c[1]) / d + 4.0f;

    return cv::Vec3f(h / 6.0f, s, l);
}

static float hue_to_rgb(float p, float q, float t)
{
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 1.0f / 2.0f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
    return p;
}

cv::Vec3f hsl_to_rgb(const cv::Vec3f &hsl)
{
    if (hsl[1] == 0.0f)
        return cv::Vec3f(hsl[2], hsl[2], hsl[2]);

    float q = hsl[2] < 0.5f ? hsl[2] * (1.0f + hsl[1])
                            : hsl[2] + hsl[1] - hsl[2] * hsl[1];
    float p = 2.0f * hsl[2] - q;

    return cv::Vec3f(hue_to_rgb(p, q, hsl[0] + 1.0f / 3.0f),
                     hue_to_rgb(p, q, hsl[0]),
                     hue_to_rgb(p, q, hsl[0] - 1.0f / 3.0f));
}

/* ========================================================================
 * Correction stages
 * ======================================================================== */

cv::Vec3f apply_lab_transfer(const cv::Vec3f &rgb, const ColorCorrection &cc)
{
    cv::Vec3f lab = rgb_to_lab(rgb);
    for (int i = 0; i < 3; i++)
        lab[i] = std::clamp(lab[i] * cc.lab_scale[i] + cc.lab_offset[i],
                            0.0f, 255.0f);
    return lab_to_rgb(lab);
}

cv::Vec3f apply_legacy_grading(const cv::Vec3f &rgb, const ColorCorrection &cc)
{
    cv::Vec3f c = rgb;
    for (int i = 0; i < 3; i++)
        c[i] *= cc.color_balance[i];

    c[0] += cc.temperature * 0.1f;
    c[2] -= cc.temperature * 0.1f;
    for (int i = 0; i < 3; i++)
        c[i] = std::clamp(c[i], 0.0f, 1.0f);

    for (int i = 0; i < 3; i++) {
        c[i] += cc.brightness;
        c[i] = (c[i] - 0.5f) * cc.contrast + 0.5f;
    }

    cv::Vec3f hsl = rgb_to_hsl(c);
    hsl[1] *= cc.saturation;
    c = hsl_to_rgb(hsl);

    for (int i = 0; i < 3; i++)
        c[i] = std::clamp(c[i], 0.0f, 1.0f);
    return c;
}

cv::Vec3f apply_color_correction(const cv::Vec3f &rgb, const ColorCorrection &cc)
{
    cv::Vec3f c = rgb;
    if (!lab_is_identity(cc))
        c = apply_lab_transfer(c, cc);
    if (!legacy_is_identity(cc))
        c = apply_legacy_grading(c, cc);
    return c;
}

/* ========================================================================
 * Image path
 * ======================================================================== */

/* `rgb` is CV_32FC3 in [0,1].  OpenCV's float Lab is L in [0,100] and
 * signed a/b; the transfer runs in the 0-255 convention of rgb_to_lab. */
static void lab_transfer_image(cv::Mat &rgb, const ColorCorrection &cc)
{
    cv::Mat lab;
    cv::cvtColor(rgb, lab, cv::COLOR_RGB2Lab);

    cv::multiply(lab, cv::Scalar(2.55 * cc.lab_scale[0], cc.lab_scale[1],
                                 cc.lab_scale[2]), lab);
    cv::add(lab, cv::Scalar(cc.lab_offset[0],
                            128.0 * cc.lab_scale[1] + cc.lab_offset[1],
                            128.0 * cc.lab_scale[2] + cc.lab_offset[2]), lab);
    cv::min(lab, 255.0, lab);
    cv::max(lab, 0.0, lab);

    cv::subtract(lab, cv::Scalar(0.0, 128.0, 128.0), lab);
    cv::multiply(lab, cv::Scalar(100.0 / 255.0, 1.0, 1.0), lab);
    cv::cvtColor(lab, rgb, cv::COLOR_Lab2RGB);

    cv::min(rgb, 1.0, rgb);
    cv::max(rgb, 0.0, rgb);
}

static void legacy_grading_image(cv::Mat &rgb, const ColorCorrection &cc)
{
    cv::multiply(rgb, cv::Scalar(cc.color_balance[0], cc.color_balance[1],
                                 cc.color_balance[2]), rgb);
    cv::add(rgb, cv::Scalar(cc.temperature * 0.1, 0.0, -cc.temperature * 0.1), rgb);
    cv::min(rgb, 1.0, rgb);
    cv::max(rgb, 0.0, rgb);

    /* (c + brightness - 0.5) * contrast + 0.5 */
    rgb.convertTo(rgb, -1, cc.contrast,
                  (cc.brightness - 0.5) * cc.contrast + 0.5);

    cv::Mat hls;
    cv::cvtColor(rgb, hls, cv::COLOR_RGB2HLS);
    cv::multiply(hls, cv::Scalar(1.0, 1.0, cc.saturation), hls);
    cv::cvtColor(hls, rgb, cv::COLOR_HLS2RGB);

    cv::min(rgb, 1.0, rgb);
    cv::max(rgb, 0.0, rgb);
}

bool apply_color_correction(cv::Mat &image, const ColorCorrection &cc)
{
    if (image.depth() != CV_8U ||
        (image.channels() != 3 && image.channels() != 4))
        return false;
    if (lab_is_identity(cc) && legacy_is_identity(cc))
        return true;

    cv::Mat rgb;
    if (image.channels() == 4)
        cv::cvtColor(image, rgb, cv::COLOR_RGBA2RGB);
    else
        rgb = image;

    cv::Mat f;
    rgb.convertTo(f, CV_32F, 1.0 / 255.0);
    if (!lab_is_identity(cc))
        lab_transfer_image(f, cc);
    if (!legacy_is_identity(cc))
        legacy_grading_image(f, cc);

    cv::Mat out;
    f.convertTo(out, CV_8U, 255.0);
    if (image.channels() == 3) {
        out.copyTo(image);
        return true;
    }

    /* transparent pixels are left untouched */
    cv::Mat alpha, rgba;
    cv::extractChannel(image, alpha, 3);
    cv::cvtColor(out, rgba, cv::COLOR_RGB2RGBA);
    cv::insertChannel(alpha, rgba, 3);
    rgba.copyTo(image, alpha);
    return true;
}
