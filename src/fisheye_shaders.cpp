#include "fisheye_shaders.h"

bool operator==(const ShaderVariant &a, const ShaderVariant &b)
{
    return a.side == b.side && a.layout == b.layout && a.lab == b.lab &&
           a.legacy == b.legacy && a.seam_blend == b.seam_blend;
}

ShaderVariant shader_variant_for(Side side, TextureLayout layout,
                                 const ColorCorrection &cc, bool seam_blend)
{
    ShaderVariant v;
    v.side       = side;
    v.layout     = layout;
    v.lab        = !lab_is_identity(cc);
    v.legacy     = !legacy_is_identity(cc);
    v.seam_blend = seam_blend;
    return v;
}

/* ========================================================================
 * GLSL sources (OpenGL ES 3.1)
 * ======================================================================== */

static const char *FISHEYE_VS = R"(#version 310 es
layout(location = 0) in vec3 a_pos;
layout(location = 1) in vec2 a_uv;
uniform mat4 u_mvp;
out vec2 v_plane_uv;
out vec2 v_uv;
void main() {
    v_plane_uv = a_uv;
    v_uv = a_uv * 2.0 - 0.5;
    gl_Position = u_mvp * vec4(a_pos, 1.0);
}
)";

static const char *FISHEYE_FS_BODY = R"(
precision highp float;
in vec2 v_plane_uv;
in vec2 v_uv;
out vec4 frag_color;

uniform sampler2D u_video;
uniform float u_fx, u_fy, u_cx, u_cy;
uniform vec4  u_d;

uniform float u_brightness;
uniform float u_contrast;
uniform float u_saturation;
uniform vec3  u_color_balance;
uniform float u_temperature;
uniform vec3  u_lab_scale;
uniform vec3  u_lab_offset;

uniform float u_seam_u;
uniform float u_blend_width;

#ifdef USE_LAB
float srgb_to_linear(float c) {
    return c <= 0.04045 ? c / 12.92 : pow((c + 0.055) / 1.055, 2.4);
}
float linear_to_srgb(float c) {
    return c <= 0.0031308 ? c * 12.92 : 1.055 * pow(c, 1.0 / 2.4) - 0.055;
}
float lab_f(float t) {
    return t > 0.008856 ? pow(t, 1.0 / 3.0) : 7.787 * t + 16.0 / 116.0;
}
float lab_f_inv(float f) {
    return f > 0.206893 ? f * f * f : (f - 16.0 / 116.0) / 7.787;
}
vec3 rgb2lab(vec3 c) {
    vec3 l = vec3(srgb_to_linear(c.r), srgb_to_linear(c.g), srgb_to_linear(c.b));
    float x = dot(vec3(0.4124564, 0.3575761, 0.1804375), l) / 0.950456;
    float y = dot(vec3(0.2126729, 0.7151522, 0.0721750), l);
    float z = dot(vec3(0.0193339, 0.1191920, 0.9503041), l) / 1.088754;
    float fx = lab_f(x), fy = lab_f(y), fz = lab_f(z);
    return vec3((116.0 * fy - 16.0) * 255.0 / 100.0,
                500.0 * (fx - fy) + 128.0,
                200.0 * (fy - fz) + 128.0);
}
vec3 lab2rgb(vec3 lab) {
    float fy = (lab.x * 100.0 / 255.0 + 16.0) / 116.0;
    float fx = fy + (lab.y - 128.0) / 500.0;
    float fz = fy - (lab.z - 128.0) / 200.0;
    vec3 xyz = vec3(lab_f_inv(fx) * 0.950456, lab_f_inv(fy), lab_f_inv(fz) * 1.088754);
    vec3 l = vec3(dot(vec3( 3.2404542, -1.5371385, -0.4985314), xyz),
                  dot(vec3(-0.9692660,  1.8760108,  0.0415560), xyz),
                  dot(vec3( 0.0556434, -0.2040259,  1.0572252), xyz));
    l = max(l, 0.0);
    return clamp(vec3(linear_to_srgb(l.r), linear_to_srgb(l.g), linear_to_srgb(l.b)),
                 0.0, 1.0);
}
#endif

#ifdef USE_LEGACY
vec3 rgb2hsl(vec3 c) {
    float max_c = max(max(c.r, c.g), c.b);
    float min_c = min(min(c.r, c.g), c.b);
    float l = (max_c + min_c) / 2.0;
    if (max_c == min_c) return vec3(0.0, 0.0, l);
    float d = max_c - min_c;
    float s = l > 0.5 ? d / (2.0 - max_c - min_c) : d / (max_c + min_c);
    float h;
    if (max_c == c.r)      h = (c.g - c.b) / d + (c.g < c.b ? 6.0 : 0.0);
    else if (max_c == c.g) h = (c.b - c.r) / d + 2.0;
    else                   h = (c.r - c.g) / d + 4.0;
    return vec3(h / 6.0, s, l);
}
float hue2rgb(float p, float q, float t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}
vec3 hsl2rgb(vec3 hsl) {
    if (hsl.y == 0.0) return vec3(hsl.z);
    float q = hsl.z < 0.5 ? hsl.z * (1.0 + hsl.y) : hsl.z + hsl.y - hsl.z * hsl.y;
    float p = 2.0 * hsl.z - q;
    return vec3(hue2rgb(p, q, hsl.x + 1.0 / 3.0),
                hue2rgb(p, q, hsl.x),
                hue2rgb(p, q, hsl.x - 1.0 / 3.0));
}
#endif

void main() {
    float x = (v_uv.x - u_cx) / u_fx;
    float y = (v_uv.y - u_cy) / u_fy;
    float r = sqrt(x * x + y * y);
    float scale = 1.0;
    if (r > 0.0) {
        float theta = atan(r);
        float t2 = theta * theta;
        scale = 1.0 + t2 * (u_d.x + t2 * (u_d.y + t2 * (u_d.z + t2 * u_d.w)));
    }
    vec2 src = vec2(u_fx * x * scale + u_cx, u_fy * y * scale + u_cy);

#ifdef STACKED
    src.y = src.y * 0.5 + SIDE_V_OFFSET;
    float v_lo = SIDE_V_OFFSET;
    float v_hi = SIDE_V_OFFSET + 0.5;
#else
    float v_lo = 0.0;
    float v_hi = 1.0;
#endif

    if (src.x < 0.0 || src.x > 1.0 || src.y < v_lo || src.y > v_hi) {
        frag_color = vec4(0.0);
        return;
    }

    vec4 tex = texture(u_video, src);
    vec3 color = tex.rgb;

#ifdef USE_LAB
    vec3 lab = clamp(rgb2lab(color) * u_lab_scale + u_lab_offset, 0.0, 255.0);
    color = lab2rgb(lab);
#endif

#ifdef USE_LEGACY
    color *= u_color_balance;
    color.r += u_temperature * 0.1;
    color.b -= u_temperature * 0.1;
    color = clamp(color, 0.0, 1.0);
    color += u_brightness;
    color = (color - 0.5) * u_contrast + 0.5;
    vec3 hsl = rgb2hsl(color);
    hsl.y *= u_saturation;
    color = clamp(hsl2rgb(hsl), 0.0, 1.0);
#endif

    float alpha = tex.a;
#ifdef SEAM_BLEND
    alpha *= smoothstep(0.0, u_blend_width, v_plane_uv.x - u_seam_u);
#endif
    frag_color = vec4(color, alpha);
}
)";

const char *fisheye_vertex_shader()
{
    return FISHEYE_VS;
}

std::string fisheye_fragment_shader(const ShaderVariant &v)
{
    std::string src = "#version 310 es\n";
    if (v.layout == TextureLayout::Stacked) {
        src += "#define STACKED\n";
        src += v.side == Side::Left ? "#define SIDE_V_OFFSET 0.5\n"
                                    : "#define SIDE_V_OFFSET 0.0\n";
    }
    if (v.lab)        src += "#define USE_LAB\n";
    if (v.legacy)     src += "#define USE_LEGACY\n";
    if (v.seam_blend) src += "#define SEAM_BLEND\n";
    src += FISHEYE_FS_BODY;
    return src;
}
