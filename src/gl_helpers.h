#ifndef DUOSTITCH_GL_HELPERS_H
#define DUOSTITCH_GL_HELPERS_H

#include <GLES3/gl31.h>

#include <opencv2/core.hpp>

GLuint compile_shader(GLenum type, const char *source);
GLuint create_render_program(const char *vs_src, const char *fs_src);

/* RGBA8 texture with linear filtering and edge clamping. */
GLuint create_texture_rgba8(int w, int h);

/* Uploads an 8-bit RGB frame, reallocating `tex` when the size changes. */
bool upload_frame_texture(GLuint *tex, cv::Size *tex_size, const cv::Mat &rgb);

#endif
