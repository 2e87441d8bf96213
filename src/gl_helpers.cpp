#include "gl_helpers.h"

#include <cstdio>

#include <opencv2/imgproc.hpp>

/* Prints the info log of a failed shader or program; true when `ok`. */
static bool check_gl_object(GLuint obj, bool is_program, const char *what)
{
    GLint ok = GL_FALSE;
    if (is_program)
        glGetProgramiv(obj, GL_LINK_STATUS, &ok);
    else
        glGetShaderiv(obj, GL_COMPILE_STATUS, &ok);
    if (ok)
        return true;

    char log[1024] = { 0 };
    if (is_program)
        glGetProgramInfoLog(obj, sizeof(log), nullptr, log);
    else
        glGetShaderInfoLog(obj, sizeof(log), nullptr, log);
    fprintf(stderr, "[gl] %s failed:\n%s\n", what, log);
    return false;
}

GLuint compile_shader(GLenum type, const char *source)
{
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &source, nullptr);
    glCompileShader(s);
    if (!check_gl_object(s, false, type == GL_VERTEX_SHADER ? "vertex shader compile"
                                                            : "fragment shader compile")) {
        glDeleteShader(s);
        return 0;
    }
    return s;
}

GLuint create_render_program(const char *vs_src, const char *fs_src)
{
    GLuint vs = compile_shader(GL_VERTEX_SHADER, vs_src);
    GLuint fs = vs ? compile_shader(GL_FRAGMENT_SHADER, fs_src) : 0;

    GLuint prog = 0;
    if (vs && fs) {
        prog = glCreateProgram();
        glAttachShader(prog, vs);
        glAttachShader(prog, fs);
        glLinkProgram(prog);
        if (!check_gl_object(prog, true, "program link")) {
            glDeleteProgram(prog);
            prog = 0;
        }
    }

    /* glDeleteShader ignores 0 */
    glDeleteShader(vs);
    glDeleteShader(fs);
    return prog;
}

GLuint create_texture_rgba8(int w, int h)
{
    GLuint tex;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexStorage2D(GL_TEXTURE_2D, 1, GL_RGBA8, w, h);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    return tex;
}

bool upload_frame_texture(GLuint *tex, cv::Size *tex_size, const cv::Mat &rgb)
{
    if (rgb.empty() || rgb.type() != CV_8UC3)
        return false;

    if (!*tex || *tex_size != rgb.size()) {
        if (*tex)
            glDeleteTextures(1, tex);
        *tex = create_texture_rgba8(rgb.cols, rgb.rows);
        *tex_size = rgb.size();
        printf("[gl] frame texture %dx%d\n", rgb.cols, rgb.rows);
    }

    cv::Mat rgba;
    cv::cvtColor(rgb, rgba, cv::COLOR_RGB2RGBA);

    /* row 0 of the frame lands at texture v = 0 */
    glBindTexture(GL_TEXTURE_2D, *tex);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, rgba.cols, rgba.rows,
                    GL_RGBA, GL_UNSIGNED_BYTE, rgba.data);
    return true;
}
