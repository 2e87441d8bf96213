/*
 * GLSL ES sources for the undistortion + color kernel.
 *
 * Side, texture layout and the enabled color stages are resolved at
 * shader compile time through #defines, so each plane gets a program
 * with no per-pixel branching on those choices.
 */

#ifndef DUOSTITCH_FISHEYE_SHADERS_H
#define DUOSTITCH_FISHEYE_SHADERS_H

#include <string>

#include "color_model.h"
#include "fisheye_model.h"

struct ShaderVariant {
    Side          side       = Side::Left;
    TextureLayout layout     = TextureLayout::Stacked;
    bool          lab        = false;
    bool          legacy     = false;
    bool          seam_blend = false;
};

bool operator==(const ShaderVariant &a, const ShaderVariant &b);

ShaderVariant shader_variant_for(Side side, TextureLayout layout,
                                 const ColorCorrection &cc, bool seam_blend);

const char *fisheye_vertex_shader();
std::string fisheye_fragment_shader(const ShaderVariant &v);

#endif
