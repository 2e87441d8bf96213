#include <gtest/gtest.h>

#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "remap_capture_target.h"

/* Stacked test frame: right camera (top half) red, left camera (bottom half) blue. */
static cv::Mat stacked_frame()
{
    cv::Mat frame(64, 64, CV_8UC3, cv::Scalar(0, 0, 0));
    frame(cv::Rect(0, 0, 64, 32)).setTo(cv::Scalar(255, 0, 0));
    frame(cv::Rect(0, 32, 64, 32)).setTo(cv::Scalar(0, 0, 255));
    return frame;
}

static SideView centered_view()
{
    SideView view;
    view.intrinsics.width  = 3840;
    view.intrinsics.height = 2160;
    view.intrinsics.fx = 0.5f;
    view.intrinsics.fy = 0.5f;
    view.intrinsics.cx = 0.5f;
    view.intrinsics.cy = 0.5f;
    return view;
}

TEST(RemapCaptureTarget, SamplesEachSidesHalf)
{
    RemapCaptureTarget target(cv::Size(16, 9));
    cv::Mat frame = stacked_frame();

    ASSERT_TRUE(target.renderSide(Side::Left, centered_view(),
                                  TextureLayout::Stacked, frame));
    cv::Vec4b c = target.image().at<cv::Vec4b>(4, 8);
    EXPECT_EQ(c, cv::Vec4b(0, 0, 255, 255));

    ASSERT_TRUE(target.renderSide(Side::Right, centered_view(),
                                  TextureLayout::Stacked, frame));
    c = target.image().at<cv::Vec4b>(4, 8);
    EXPECT_EQ(c, cv::Vec4b(255, 0, 0, 255));
}

TEST(RemapCaptureTarget, CornersOutsideLensAreTransparent)
{
    RemapCaptureTarget target(cv::Size(16, 9));
    ASSERT_TRUE(target.renderSide(Side::Left, centered_view(),
                                  TextureLayout::Stacked, stacked_frame()));
    EXPECT_EQ(target.image().at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(target.image().at<cv::Vec4b>(8, 15)[3], 0);
}

TEST(RemapCaptureTarget, AppliesColorCorrection)
{
    RemapCaptureTarget target(cv::Size(16, 9));
    SideView view = centered_view();
    view.color.brightness = 0.2f;

    ASSERT_TRUE(target.renderSide(Side::Left, view, TextureLayout::Stacked,
                                  stacked_frame()));
    cv::Vec4b c = target.image().at<cv::Vec4b>(4, 8);
    EXPECT_NEAR(c[0], 51, 1);
    EXPECT_NEAR(c[1], 51, 1);
    EXPECT_EQ(c[2], 255);
    EXPECT_EQ(c[3], 255);
}

TEST(RemapCaptureTarget, EncodesOpaquePng)
{
    RemapCaptureTarget target(cv::Size(16, 9));
    std::vector<unsigned char> png;
    EXPECT_FALSE(target.encodePng(&png));

    ASSERT_TRUE(target.renderSide(Side::Left, centered_view(),
                                  TextureLayout::Stacked, stacked_frame()));
    ASSERT_TRUE(target.encodePng(&png));

    cv::Mat decoded = cv::imdecode(png, cv::IMREAD_UNCHANGED);
    ASSERT_EQ(decoded.type(), CV_8UC3);
    EXPECT_EQ(decoded.size(), cv::Size(16, 9));
    EXPECT_EQ(decoded.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
    /* BGR on disk */
    EXPECT_EQ(decoded.at<cv::Vec3b>(4, 8), cv::Vec3b(255, 0, 0));
}

TEST(RemapCaptureTarget, RejectsNonRgbFrames)
{
    RemapCaptureTarget target(cv::Size(16, 9));
    cv::Mat gray(64, 64, CV_8UC1, cv::Scalar(128));
    EXPECT_FALSE(target.renderSide(Side::Left, centered_view(),
                                   TextureLayout::Stacked, gray));
    EXPECT_FALSE(target.renderSide(Side::Left, centered_view(),
                                   TextureLayout::Stacked, cv::Mat()));
}
