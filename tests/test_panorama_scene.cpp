#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "panorama_scene.h"

static cv::Vec4f transform(const cv::Matx44f &m, const cv::Vec4f &p)
{
    return m * p;
}

TEST(PanoramaScene, HalfIntersectShiftsBothPlanes)
{
    StitchParameters p;
    p.intersect = 0.5f;

    PlanePose left = plane_pose(Side::Left, p);
    PlanePose right = plane_pose(Side::Right, p);

    EXPECT_FLOAT_EQ(left.position[0], 0.0f);
    EXPECT_FLOAT_EQ(left.position[1], 0.0f);
    EXPECT_FLOAT_EQ(left.position[2], 0.25f);
    EXPECT_FLOAT_EQ(right.position[0], 0.25f);
    EXPECT_FLOAT_EQ(right.position[1], 0.0f);
    EXPECT_FLOAT_EQ(right.position[2], 0.0f);

    EXPECT_NEAR(left.rotation[1], M_PI / 2.0, 1e-6);
    EXPECT_FLOAT_EQ(left.width, PLANE_WIDTH);
    EXPECT_FLOAT_EQ(left.height, PLANE_WIDTH * 9.0f / 16.0f);
}

TEST(PanoramaScene, FullIntersectMeetsAtOrigin)
{
    StitchParameters p;
    p.intersect = 1.0f;
    p.x_ty = 0.02f;
    p.x_rz = 0.01f;
    p.z_rx = -0.03f;

    PlanePose left = plane_pose(Side::Left, p);
    PlanePose right = plane_pose(Side::Right, p);

    EXPECT_FLOAT_EQ(left.position[2], 0.0f);
    EXPECT_FLOAT_EQ(right.position[0], 0.0f);
    EXPECT_FLOAT_EQ(right.position[1], 0.02f);
    EXPECT_FLOAT_EQ(right.rotation[2], 0.01f);
    EXPECT_FLOAT_EQ(left.rotation[0], -0.03f);
}

TEST(PanoramaScene, ValidatesParameters)
{
    StitchParameters p;
    std::string reason;
    EXPECT_TRUE(validate_stitch_parameters(p, &reason));

    p.intersect = 1.5f;
    EXPECT_FALSE(validate_stitch_parameters(p, &reason));
    EXPECT_FALSE(reason.empty());

    p = StitchParameters();
    p.blend_width = -0.1f;
    EXPECT_FALSE(validate_stitch_parameters(p, nullptr));

    p = StitchParameters();
    p.x_rz = NAN;
    EXPECT_FALSE(validate_stitch_parameters(p, nullptr));
}

TEST(PanoramaScene, EulerOrderIsXYZ)
{
    cv::Vec3f r(0.3f, 0.0f, 0.0f);
    cv::Matx44f m = euler_xyz_matrix(r);
    EXPECT_NEAR(m(1, 1), std::cos(0.3f), 1e-6);
    EXPECT_NEAR(m(2, 1), std::sin(0.3f), 1e-6);

    /* a quarter turn about Y maps +x onto -z */
    cv::Vec4f p = transform(euler_xyz_matrix(cv::Vec3f(0.0f, (float)M_PI / 2, 0.0f)),
                            cv::Vec4f(1, 0, 0, 1));
    EXPECT_NEAR(p[0], 0.0f, 1e-6);
    EXPECT_NEAR(p[2], -1.0f, 1e-6);
}

TEST(PanoramaScene, CaptureCameraFramesPlaneExactly)
{
    CameraPose cam = capture_camera_pose();
    EXPECT_FLOAT_EQ(cam.position[2], 1.0f);
    EXPECT_NEAR(cam.fov_deg, 2.0 * std::atan(9.0 / 32.0) * 180.0 / M_PI, 1e-4);

    cv::Matx44f vp = perspective_matrix(cam.fov_deg, cam.aspect, cam.near_z, cam.far_z) *
                     camera_view_matrix(cam) * plane_model_matrix(capture_plane_pose());

    cv::Vec4f corner = vp * cv::Vec4f(PLANE_WIDTH / 2, PLANE_HEIGHT / 2, 0, 1);
    EXPECT_NEAR(corner[0] / corner[3], 1.0f, 1e-4);
    EXPECT_NEAR(corner[1] / corner[3], 1.0f, 1e-4);

    cv::Vec4f centre = vp * cv::Vec4f(0, 0, 0, 1);
    EXPECT_NEAR(centre[0] / centre[3], 0.0f, 1e-6);
    EXPECT_NEAR(centre[1] / centre[3], 0.0f, 1e-6);
}

TEST(PanoramaScene, DrawOrderWithoutBlend)
{
    PanoramaComposer composer;
    const auto &draws = composer.drawList();
    ASSERT_EQ(draws.size(), 2u);

    EXPECT_EQ(draws[0].side, Side::Left);
    EXPECT_TRUE(draws[0].depth_write);
    EXPECT_FALSE(draws[0].blend);

    EXPECT_EQ(draws[1].side, Side::Right);
    EXPECT_TRUE(draws[1].depth_write);
    EXPECT_FALSE(draws[1].blend);
}

TEST(PanoramaScene, BlendedRightPlaneSkipsDepthWrite)
{
    PanoramaComposer composer;
    RenderKey key;
    key.params.blend_width = 0.1f;
    key.params.intersect = 0.6f;
    ASSERT_TRUE(composer.update(key));

    const auto &draws = composer.drawList();
    ASSERT_EQ(draws.size(), 2u);
    EXPECT_EQ(draws[0].side, Side::Left);
    EXPECT_TRUE(draws[0].depth_write);
    EXPECT_FALSE(draws[0].blend);
    EXPECT_EQ(draws[1].side, Side::Right);
    EXPECT_FALSE(draws[1].depth_write);
    EXPECT_TRUE(draws[1].blend);
    EXPECT_FLOAT_EQ(draws[1].blend_width, 0.1f);
    EXPECT_FLOAT_EQ(draws[1].seam_u, 0.3f);
}

TEST(PanoramaScene, RekeysOnAnyChange)
{
    PanoramaComposer composer;
    uint64_t gen = composer.generation();

    RenderKey key = composer.key();
    EXPECT_FALSE(composer.update(key));
    EXPECT_EQ(composer.generation(), gen);

    key.params.x_ty = 0.01f;
    EXPECT_TRUE(composer.update(key));
    EXPECT_EQ(composer.generation(), gen + 1);

    key.right_color.saturation = 1.2f;
    EXPECT_TRUE(composer.update(key));
    EXPECT_FLOAT_EQ(composer.drawList()[1].color.saturation, 1.2f);

    key.params.blend_width = 0.05f;
    EXPECT_TRUE(composer.update(key));
    EXPECT_EQ(composer.generation(), gen + 3);
}

TEST(PanoramaScene, SnapshotIsIndependentOfCaller)
{
    PanoramaComposer composer;
    RenderKey key;
    key.left_color.brightness = 0.2f;
    composer.update(key);

    key.left_color.brightness = -0.4f;
    EXPECT_FLOAT_EQ(composer.drawList()[0].color.brightness, 0.2f);
}

TEST(PanoramaScene, ComposerRejectsBadIntrinsics)
{
    PanoramaComposer composer;
    CameraIntrinsics good;
    good.width = 1920;
    good.height = 1080;
    good.fx = good.fy = 0.5f;
    good.cx = good.cy = 0.5f;
    CameraIntrinsics bad = good;
    bad.fx = -1.0f;

    std::string reason;
    EXPECT_FALSE(composer.setIntrinsics(good, bad, &reason));
    EXPECT_FALSE(composer.hasIntrinsics());
    EXPECT_EQ(reason.rfind("right", 0), 0u);

    EXPECT_TRUE(composer.setIntrinsics(good, good, &reason));
    EXPECT_TRUE(composer.hasIntrinsics());
}

TEST(PanoramaScene, ViewerCameraClamps)
{
    ViewerCamera cam;
    cam.setAxisOffset(0.8f);

    cam.drag(1e6f, 1e6f);
    EXPECT_NEAR(cam.yaw(), 115.0f * M_PI / 180.0f, 1e-5);
    EXPECT_NEAR(cam.pitch(), 0.0f, 1e-6);

    cam.drag(-1e6f, -1e6f);
    EXPECT_NEAR(cam.yaw(), -25.0f * M_PI / 180.0f, 1e-5);
    EXPECT_NEAR(cam.pitch(), -20.0f * M_PI / 180.0f, 1e-5);

    cam.zoom(-1e4f);
    EXPECT_FLOAT_EQ(cam.fov(), 30.0f);
    cam.zoom(1e4f);
    EXPECT_FLOAT_EQ(cam.fov(), 75.0f);

    CameraPose pose = cam.pose(16.0f / 9.0f);
    EXPECT_FLOAT_EQ(pose.position[0], 0.8f);
    EXPECT_FLOAT_EQ(pose.position[2], 0.8f);
    EXPECT_FLOAT_EQ(pose.fov_deg, 75.0f);
}
