#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <QTemporaryDir>

#include <opencv2/videoio.hpp>

#include "test_support.h"
#include "video_file_source.h"

#define CLIP_FPS    10.0
#define CLIP_FRAMES 20

namespace {

/* Frame i is a flat grey of level i * 10, so a decoded frame names its index. */
bool write_clip(const std::string &path)
{
    cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'),
                           CLIP_FPS, cv::Size(64, 48));
    if (!writer.isOpened())
        return false;
    for (int i = 0; i < CLIP_FRAMES; i++)
        writer.write(cv::Mat(48, 64, CV_8UC3, cv::Scalar::all(i * 10)));
    writer.release();
    return true;
}

int frame_level(const cv::Mat &rgb)
{
    return rgb.at<cv::Vec3b>(24, 32)[0];
}

class VideoFileSourceTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("clip.avi");
        ASSERT_TRUE(write_clip(path.toStdString()));

        source.reset(new VideoFileSource(path, &sched));
        QObject::connect(source.get(), &MediaSource::loaded,
                         [this]() { loaded_count++; });
        QObject::connect(source.get(), &MediaSource::seeked,
                         [this](bool ok) { seeks.push_back(ok); });
        QObject::connect(source.get(), &MediaSource::framePresented,
                         [this](const FrameMetadata &m) { presented.push_back(m); });
    }

    void load()
    {
        ASSERT_TRUE(source->open());
        sched.advance(0);
        ASSERT_TRUE(source->isLoaded());
    }

    /* Advances the display clock in steps short of the catch-up limit. */
    void playFor(int ms, int step_ms = 300)
    {
        for (int t = 0; t < ms; t += step_ms) {
            sched.advance(step_ms);
            sched.tick();
        }
    }

    QTemporaryDir dir;
    QString path;
    ManualFrameScheduler sched;
    std::unique_ptr<VideoFileSource> source;

    int loaded_count = 0;
    std::vector<bool> seeks;
    std::vector<FrameMetadata> presented;
};

} // namespace

TEST_F(VideoFileSourceTest, LoadsFirstFrameAsynchronously)
{
    ASSERT_TRUE(source->open());
    EXPECT_FALSE(source->isLoaded());
    EXPECT_EQ(loaded_count, 0);

    sched.advance(0);
    EXPECT_EQ(loaded_count, 1);
    EXPECT_TRUE(source->isLoaded());
    EXPECT_TRUE(source->supportsFrameCallbacks());
    EXPECT_NEAR(source->duration(), CLIP_FRAMES / CLIP_FPS, 1e-6);
    EXPECT_DOUBLE_EQ(source->currentTime(), 0.0);

    cv::Mat frame = source->currentFrame();
    ASSERT_EQ(frame.type(), CV_8UC3);
    EXPECT_EQ(frame.size(), cv::Size(64, 48));
    EXPECT_NEAR(frame_level(frame), 0, 4);
}

TEST_F(VideoFileSourceTest, MissingFileDoesNotOpen)
{
    VideoFileSource missing(dir.filePath("missing.avi"), &sched);
    EXPECT_FALSE(missing.open());
    EXPECT_EQ(sched.pendingDelays(), 0u);
}

TEST_F(VideoFileSourceTest, SeekReportsTargetWhilePending)
{
    load();

    source->seek(1.0);
    EXPECT_DOUBLE_EQ(source->currentTime(), 1.0);
    EXPECT_TRUE(seeks.empty());

    sched.advance(0);
    ASSERT_EQ(seeks.size(), 1u);
    EXPECT_TRUE(seeks[0]);
    EXPECT_NEAR(frame_level(source->currentFrame()), 100, 6);
}

TEST_F(VideoFileSourceTest, SeekClampsBelowZero)
{
    load();
    source->seek(1.0);
    sched.advance(0);

    source->seek(-3.0);
    EXPECT_DOUBLE_EQ(source->currentTime(), 0.0);
    sched.advance(0);
    ASSERT_EQ(seeks.size(), 2u);
    EXPECT_TRUE(seeks[1]);
    EXPECT_NEAR(frame_level(source->currentFrame()), 0, 4);
}

TEST_F(VideoFileSourceTest, SeekPastEndClampsAndFails)
{
    load();

    source->seek(100.0);
    EXPECT_DOUBLE_EQ(source->currentTime(), source->duration());
    sched.advance(0);
    ASSERT_EQ(seeks.size(), 1u);
    EXPECT_FALSE(seeks[0]);
}

TEST_F(VideoFileSourceTest, PlaybackFollowsDisplayClock)
{
    load();
    source->play();
    EXPECT_TRUE(source->isPlaying());

    sched.tick();
    EXPECT_TRUE(presented.empty());

    sched.advance(250);
    sched.tick();
    ASSERT_EQ(presented.size(), 1u);
    EXPECT_NEAR(presented[0].media_time, 0.2, 1e-3);
    EXPECT_NEAR(presented[0].current_time, 0.25, 1e-9);
    EXPECT_EQ(presented[0].presented_frames, 1u);
    EXPECT_NEAR(frame_level(source->currentFrame()), 20, 4);

    /* no new frame inside the same frame interval */
    sched.advance(30);
    sched.tick();
    EXPECT_EQ(presented.size(), 1u);
}

TEST_F(VideoFileSourceTest, SeekWhilePlayingPresentsTheNewFrame)
{
    load();
    source->play();

    source->seek(1.0);
    sched.advance(0);
    ASSERT_EQ(seeks.size(), 1u);
    EXPECT_TRUE(seeks[0]);
    ASSERT_EQ(presented.size(), 1u);
    EXPECT_NEAR(presented[0].media_time, 1.0, 1e-3);
    EXPECT_DOUBLE_EQ(source->currentTime(), 1.0);
}

TEST_F(VideoFileSourceTest, PauseKeepsTheDisplayedFrameTime)
{
    load();
    source->play();
    sched.advance(250);
    sched.tick();
    ASSERT_EQ(presented.size(), 1u);

    sched.advance(30);
    source->pause();
    EXPECT_FALSE(source->isPlaying());
    EXPECT_DOUBLE_EQ(source->currentTime(), presented[0].media_time);

    /* resumes from the clock position, not from the frame time */
    source->play();
    EXPECT_NEAR(source->currentTime(), 0.28, 1e-9);
}

TEST_F(VideoFileSourceTest, StopsAtEndWithoutLoop)
{
    source->setLoop(false);
    load();
    source->play();

    playFor(3000);
    EXPECT_FALSE(source->isPlaying());
    EXPECT_TRUE(seeks.empty());
    EXPECT_NEAR(frame_level(source->currentFrame()), (CLIP_FRAMES - 1) * 10, 6);
    EXPECT_EQ(sched.pendingFrames(), 0u);
}

TEST_F(VideoFileSourceTest, LoopsBackToStart)
{
    load();
    source->play();

    playFor(3000);
    EXPECT_TRUE(source->isPlaying());
    ASSERT_FALSE(seeks.empty());
    EXPECT_TRUE(seeks[0]);
    EXPECT_LT(source->currentTime(), 1.5);
}
