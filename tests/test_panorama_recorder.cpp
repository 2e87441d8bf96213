#include <gtest/gtest.h>

#include <QFileInfo>
#include <QTemporaryDir>

#include "panorama_recorder.h"

TEST(PanoramaRecorder, WritesFramesOfTheStartSize)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    std::string path = dir.filePath("pano.avi").toStdString();

    PanoramaRecorder rec;
    ASSERT_TRUE(rec.start(path, 30.0, cv::Size(64, 48)));
    EXPECT_TRUE(rec.active());

    cv::Mat frame(48, 64, CV_8UC3, cv::Scalar(10, 200, 30));
    for (int i = 0; i < 5; i++)
        EXPECT_TRUE(rec.addFrame(frame));
    EXPECT_EQ(rec.frames(), 5);

    EXPECT_TRUE(rec.stop());
    EXPECT_FALSE(rec.active());
    EXPECT_TRUE(QFileInfo::exists(QString::fromStdString(rec.path())));
}

TEST(PanoramaRecorder, RejectsMismatchedFrames)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    PanoramaRecorder rec;
    ASSERT_TRUE(rec.start(dir.filePath("pano.avi").toStdString(), 30.0, cv::Size(64, 48)));

    EXPECT_FALSE(rec.addFrame(cv::Mat(32, 64, CV_8UC3, cv::Scalar::all(0))));
    EXPECT_FALSE(rec.addFrame(cv::Mat(48, 64, CV_8UC4, cv::Scalar::all(0))));
    EXPECT_EQ(rec.frames(), 0);

    EXPECT_TRUE(rec.addFrame(cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(0))));
    EXPECT_TRUE(rec.stop());
}

TEST(PanoramaRecorder, EmptyRecordingIsRemoved)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    PanoramaRecorder rec;
    ASSERT_TRUE(rec.start(dir.filePath("empty.avi").toStdString(), 30.0, cv::Size(32, 32)));
    std::string written = rec.path();

    EXPECT_FALSE(rec.stop());
    EXPECT_FALSE(QFileInfo::exists(QString::fromStdString(written)));
}

TEST(PanoramaRecorder, RefusesFramesWhenIdle)
{
    PanoramaRecorder rec;
    EXPECT_FALSE(rec.active());
    EXPECT_FALSE(rec.addFrame(cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(0))));
    EXPECT_FALSE(rec.stop());
    EXPECT_FALSE(rec.start("unused.avi", 30.0, cv::Size(0, 10)));
}
