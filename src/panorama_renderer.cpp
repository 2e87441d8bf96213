#include "panorama_renderer.h"

#include <cstdio>
#include <string>

#include "gl_helpers.h"

PanoramaRenderer::PanoramaRenderer()
    : gl_ready(false), plane_vao(0), plane_vbo(0), textures{ 0, 0 }
{
}

PanoramaRenderer::~PanoramaRenderer()
{
    if (gl_ready)
        fprintf(stderr, "[gl] renderer destroyed without release()\n");
}

/* ---- GL initialisation ---- */

bool PanoramaRenderer::initialize()
{
    if (gl_ready)
        return true;

    printf("[gl] OpenGL version: %s\n", glGetString(GL_VERSION));
    printf("[gl] GLSL version:   %s\n", glGetString(GL_SHADING_LANGUAGE_VERSION));
    printf("[gl] Renderer:       %s\n", glGetString(GL_RENDERER));

    /* unit plane; uv origin at the top-left corner */
    float quad[] = {
        /* pos.x  pos.y  pos.z  uv.s  uv.t */
        -0.5f, -0.5f, 0.0f,  0.0f, 1.0f,
         0.5f, -0.5f, 0.0f,  1.0f, 1.0f,
        -0.5f,  0.5f, 0.0f,  0.0f, 0.0f,
         0.5f,  0.5f, 0.0f,  1.0f, 0.0f,
    };
    glGenVertexArrays(1, &plane_vao);
    glGenBuffers(1, &plane_vbo);
    glBindVertexArray(plane_vao);
    glBindBuffer(GL_ARRAY_BUFFER, plane_vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 5 * sizeof(float), (void *)0);
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 5 * sizeof(float),
                          (void *)(3 * sizeof(float)));
    glBindVertexArray(0);

    /* the opaque base variants must build; others compile on demand */
    ShaderVariant base;
    base.side = Side::Left;
    if (!programFor(base)) {
        fprintf(stderr, "[gl] FATAL: fisheye shader compilation failed\n");
        return false;
    }

    gl_ready = true;
    return true;
}

void PanoramaRenderer::release()
{
    for (auto &[variant, prog] : programs)
        glDeleteProgram(prog);
    programs.clear();
    for (auto &t : textures) {
        if (t) glDeleteTextures(1, &t);
        t = 0;
    }
    if (plane_vbo) glDeleteBuffers(1, &plane_vbo);
    if (plane_vao) glDeleteVertexArrays(1, &plane_vao);
    plane_vbo = plane_vao = 0;
    gl_ready = false;
}

GLuint PanoramaRenderer::programFor(const ShaderVariant &v)
{
    for (auto &[variant, prog] : programs)
        if (variant == v)
            return prog;

    std::string fs = fisheye_fragment_shader(v);
    GLuint prog = create_render_program(fisheye_vertex_shader(), fs.c_str());
    if (!prog)
        return 0;

    printf("[gl] program %s%s%s%s%s\n", side_name(v.side),
           v.layout == TextureLayout::Stacked ? " stacked" : " dual",
           v.lab ? " +lab" : "", v.legacy ? " +legacy" : "",
           v.seam_blend ? " +blend" : "");
    programs.push_back(std::make_pair(v, prog));
    return prog;
}

bool PanoramaRenderer::uploadFrame(int slot, const cv::Mat &rgb)
{
    return upload_frame_texture(&textures[slot], &texture_sizes[slot], rgb);
}

/* ---- drawing ---- */

bool PanoramaRenderer::drawScene(const PanoramaComposer &composer,
                                 TextureLayout layout,
                                 const cv::Matx44f &view_proj)
{
    if (!composer.hasIntrinsics()) {
        fprintf(stderr, "[gl] scene has no intrinsics, nothing drawn\n");
        return false;
    }

    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_LESS);

    bool ok = true;
    for (const DrawCommand &cmd : composer.drawList()) {
        glDepthMask(cmd.depth_write ? GL_TRUE : GL_FALSE);
        if (cmd.blend) {
            glEnable(GL_BLEND);
            glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        } else {
            glDisable(GL_BLEND);
        }

        ShaderVariant v = shader_variant_for(cmd.side, layout, cmd.color, cmd.blend);
        ok = draw(v, composer.intrinsics(cmd.side), cmd.color, cmd.pose,
                  view_proj, cmd.seam_u, cmd.blend_width) && ok;
    }

    glDisable(GL_BLEND);
    glDepthMask(GL_TRUE);
    return ok;
}

bool PanoramaRenderer::drawPlane(Side side, const CameraIntrinsics &in,
                                 const ColorCorrection &color,
                                 TextureLayout layout, const PlanePose &pose,
                                 const cv::Matx44f &view_proj)
{
    glDisable(GL_BLEND);
    glDisable(GL_DEPTH_TEST);
    ShaderVariant v = shader_variant_for(side, layout, color, false);
    return draw(v, in, color, pose, view_proj, 0.0f, 0.0f);
}

bool PanoramaRenderer::draw(const ShaderVariant &v, const CameraIntrinsics &in,
                            const ColorCorrection &color, const PlanePose &pose,
                            const cv::Matx44f &view_proj, float seam,
                            float blend_width)
{
    int slot = (v.layout == TextureLayout::Dual && v.side == Side::Right) ? 1 : 0;
    if (!textures[slot])
        return false;

    GLuint prog = programFor(v);
    if (!prog)
        return false;

    cv::Matx44f scale = cv::Matx44f::eye();
    scale(0, 0) = pose.width;
    scale(1, 1) = pose.height;
    cv::Matx44f mvp = view_proj * plane_model_matrix(pose) * scale;

    glUseProgram(prog);
    glUniformMatrix4fv(glGetUniformLocation(prog, "u_mvp"), 1, GL_TRUE, mvp.val);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, textures[slot]);
    glUniform1i(glGetUniformLocation(prog, "u_video"), 0);

    glUniform1f(glGetUniformLocation(prog, "u_fx"), in.fx);
    glUniform1f(glGetUniformLocation(prog, "u_fy"), in.fy);
    glUniform1f(glGetUniformLocation(prog, "u_cx"), in.cx);
    glUniform1f(glGetUniformLocation(prog, "u_cy"), in.cy);
    glUniform4f(glGetUniformLocation(prog, "u_d"), in.d[0], in.d[1], in.d[2], in.d[3]);

    if (v.legacy) {
        glUniform1f(glGetUniformLocation(prog, "u_brightness"), color.brightness);
        glUniform1f(glGetUniformLocation(prog, "u_contrast"), color.contrast);
        glUniform1f(glGetUniformLocation(prog, "u_saturation"), color.saturation);
        glUniform3fv(glGetUniformLocation(prog, "u_color_balance"), 1, color.color_balance);
        glUniform1f(glGetUniformLocation(prog, "u_temperature"), color.temperature);
    }
    if (v.lab) {
        glUniform3fv(glGetUniformLocation(prog, "u_lab_scale"), 1, color.lab_scale);
        glUniform3fv(glGetUniformLocation(prog, "u_lab_offset"), 1, color.lab_offset);
    }
    if (v.seam_blend) {
        glUniform1f(glGetUniformLocation(prog, "u_seam_u"), seam);
        glUniform1f(glGetUniformLocation(prog, "u_blend_width"), blend_width);
    }

    glBindVertexArray(plane_vao);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    glBindVertexArray(0);
    return true;
}
