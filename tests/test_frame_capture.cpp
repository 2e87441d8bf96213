#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "frame_capture.h"
#include "test_support.h"

namespace {

CameraIntrinsics valid_lens()
{
    CameraIntrinsics in;
    in.width = 3840;
    in.height = 2160;
    in.fx = in.fy = 0.5f;
    in.cx = in.cy = 0.5f;
    return in;
}

CaptureRequest make_request(double t, TextureLayout layout)
{
    CaptureRequest req;
    req.time_s = t;
    req.layout = layout;
    req.left.intrinsics = valid_lens();
    req.right.intrinsics = valid_lens();
    return req;
}

struct Result {
    int calls = 0;
    StitchError err = StitchError::None;
    ExtractedFramePair pair;
};

class FrameCaptureTest : public ::testing::Test {
protected:
    ManualFrameScheduler sched;
    FakeRenderTarget target;
    FakeMediaSource stacked{ "stacked.mp4" };
    Result result;

    FrameCapture::DoneCallback recorder()
    {
        return [this](StitchError err, const ExtractedFramePair &pair) {
            result.calls++;
            result.err = err;
            result.pair = pair;
        };
    }

    /* Display ticks at 60 Hz until the capture reports or `max` ticks pass. */
    void pump(int max = 400)
    {
        for (int i = 0; i < max && result.calls == 0; i++) {
            sched.tick();
            sched.advance(16);
        }
    }
};

} // namespace

TEST_F(FrameCaptureTest, StackedCaptureRendersLeftThenRight)
{
    FrameCapture capture(&sched, &target);
    std::vector<Side> images;
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(6.0, TextureLayout::Stacked), recorder(),
                              CancelToken(),
                              [&](Side s, const std::vector<unsigned char> &) {
                                  images.push_back(s);
                              }));
    EXPECT_EQ(capture.phase(), FrameCapture::Phase::Seeking);
    ASSERT_EQ(stacked.seeks.size(), 1u);
    EXPECT_DOUBLE_EQ(stacked.seeks[0], 6.0);

    stacked.completeSeek(true);
    EXPECT_EQ(capture.phase(), FrameCapture::Phase::Settling);
    pump();

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::None);
    EXPECT_EQ(std::string(result.pair.left_image.begin(), result.pair.left_image.end()),
              "left");
    EXPECT_EQ(std::string(result.pair.right_image.begin(), result.pair.right_image.end()),
              "right");

    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0], Side::Left);
    EXPECT_EQ(images[1], Side::Right);

    /* every settle tick renders, plus one render after the delay */
    EXPECT_EQ(target.count("render:left"), CAPTURE_SETTLE_FRAMES + 1);
    EXPECT_EQ(target.count("render:right"), CAPTURE_SETTLE_FRAMES + 1);
    EXPECT_EQ(target.count("encode:left"), 1);
    EXPECT_EQ(target.count("encode:right"), 1);

    /* strictly sequential: nothing for the right side before the left encode */
    size_t left_encode = 0, first_right = target.events.size();
    for (size_t i = 0; i < target.events.size(); i++) {
        if (target.events[i] == "encode:left")
            left_encode = i;
        if (target.events[i] == "render:right" && first_right == target.events.size())
            first_right = i;
    }
    EXPECT_LT(left_encode, first_right);
    EXPECT_EQ(target.last_layout, TextureLayout::Stacked);
    EXPECT_FALSE(capture.busy());

    /* nothing left behind once it reports */
    EXPECT_EQ(sched.pendingFrames(), 0u);
    EXPECT_EQ(sched.pendingDelays(), 0u);
}

TEST_F(FrameCaptureTest, DualCaptureSeeksSourcesInOrder)
{
    FakeMediaSource left("left.mp4"), right("right.mp4");
    FrameCapture capture(&sched, &target);
    CaptureRequest req = make_request(3.5, TextureLayout::Dual);
    req.secondary_offset_s = 2.0;
    ASSERT_TRUE(capture.start(&left, &right, req, recorder()));

    ASSERT_EQ(left.seeks.size(), 1u);
    EXPECT_DOUBLE_EQ(left.seeks[0], 3.5);
    EXPECT_TRUE(right.seeks.empty());

    /* the right stream is captured at the same moment, i.e. at its offset */
    left.completeSeek(true);
    ASSERT_EQ(right.seeks.size(), 1u);
    EXPECT_DOUBLE_EQ(right.seeks[0], 5.5);
    EXPECT_EQ(sched.pendingFrames(), 0u);

    right.completeSeek(true);
    pump();

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::None);
    EXPECT_EQ(target.last_layout, TextureLayout::Dual);
}

TEST_F(FrameCaptureTest, StackedCaptureIgnoresSecondaryOffset)
{
    FrameCapture capture(&sched, &target);
    CaptureRequest req = make_request(4.0, TextureLayout::Stacked);
    req.secondary_offset_s = 2.0;
    ASSERT_TRUE(capture.start(&stacked, &stacked, req, recorder()));

    ASSERT_EQ(stacked.seeks.size(), 1u);
    EXPECT_DOUBLE_EQ(stacked.seeks[0], 4.0);
    stacked.completeSeek(true);
    pump();

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::None);
    EXPECT_EQ(stacked.seeks.size(), 1u);
}

TEST_F(FrameCaptureTest, SeekFailureProducesNoPair)
{
    FrameCapture capture(&sched, &target);
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(1.0, TextureLayout::Stacked), recorder()));
    stacked.completeSeek(false);

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::SeekFailed);
    EXPECT_TRUE(result.pair.left_image.empty());
    EXPECT_TRUE(result.pair.right_image.empty());
    EXPECT_TRUE(target.events.empty());

    pump();
    EXPECT_EQ(result.calls, 1);
}

TEST_F(FrameCaptureTest, StalledSeekTimesOut)
{
    FrameCapture capture(&sched, &target);
    CaptureRequest req = make_request(2.0, TextureLayout::Stacked);
    ASSERT_TRUE(capture.start(&stacked, &stacked, req, recorder()));

    sched.advance(req.timeout_ms - 1);
    EXPECT_EQ(result.calls, 0);
    sched.advance(1);

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::CaptureTimeout);
    EXPECT_TRUE(is_decode_failure(result.err));
    EXPECT_TRUE(result.pair.left_image.empty());

    /* a late seek completion is ignored */
    stacked.completeSeek(true);
    EXPECT_EQ(sched.pendingFrames(), 0u);
    EXPECT_EQ(result.calls, 1);
}

TEST_F(FrameCaptureTest, CancelTokenStopsAtNextStep)
{
    FrameCapture capture(&sched, &target);
    CancelToken token;
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(2.0, TextureLayout::Stacked), recorder(),
                              token));
    stacked.completeSeek(true);
    sched.tick();
    sched.tick();
    EXPECT_EQ(target.count("render:left"), 2);

    token.cancel();
    sched.tick();

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::Cancelled);
    EXPECT_EQ(target.count("render:left"), 2);
    EXPECT_FALSE(capture.busy());
}

TEST_F(FrameCaptureTest, CancelIsImmediate)
{
    FrameCapture capture(&sched, &target);
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(2.0, TextureLayout::Stacked), recorder()));
    capture.cancel();

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::Cancelled);
    EXPECT_EQ(sched.pendingDelays(), 0u);
}

TEST_F(FrameCaptureTest, InvalidIntrinsicsFailBeforeSeeking)
{
    FrameCapture capture(&sched, &target);
    CaptureRequest req = make_request(2.0, TextureLayout::Stacked);
    req.right.intrinsics.d[2] = NAN;

    EXPECT_FALSE(capture.start(&stacked, &stacked, req, recorder()));
    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::InvalidIntrinsics);
    EXPECT_TRUE(stacked.seeks.empty());
    EXPECT_FALSE(capture.busy());
}

TEST_F(FrameCaptureTest, SecondStartWhileBusyIsRefused)
{
    FrameCapture capture(&sched, &target);
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(2.0, TextureLayout::Stacked), recorder()));

    int second_calls = 0;
    EXPECT_FALSE(capture.start(&stacked, &stacked,
                               make_request(4.0, TextureLayout::Stacked),
                               [&](StitchError, const ExtractedFramePair &) {
                                   second_calls++;
                               }));
    EXPECT_EQ(second_calls, 0);
    EXPECT_EQ(stacked.seeks.size(), 1u);
}

TEST_F(FrameCaptureTest, EmptyFrameIsDecodeError)
{
    stacked.frame_ = cv::Mat();
    FrameCapture capture(&sched, &target);
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(2.0, TextureLayout::Stacked), recorder()));
    stacked.completeSeek(true);
    pump();

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::DecodeError);
}

TEST_F(FrameCaptureTest, EncodeFailureIsDecodeError)
{
    target.fail_encode = true;
    FrameCapture capture(&sched, &target);
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(2.0, TextureLayout::Stacked), recorder()));
    stacked.completeSeek(true);
    pump();

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::DecodeError);
    EXPECT_TRUE(is_decode_failure(result.err));
}

TEST_F(FrameCaptureTest, MediaErrorAbortsCapture)
{
    FrameCapture capture(&sched, &target);
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(2.0, TextureLayout::Stacked), recorder()));
    stacked.completeSeek(true);
    sched.tick();
    stacked.fail(StitchError::DecodeError);

    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::DecodeError);
    EXPECT_EQ(sched.pendingFrames(), 0u);
}

TEST_F(FrameCaptureTest, CaptureCanRunAgainAfterFinishing)
{
    FrameCapture capture(&sched, &target);
    stacked.auto_complete = true;
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(1.0, TextureLayout::Stacked), recorder()));
    pump();
    ASSERT_EQ(result.calls, 1);

    result = Result();
    ASSERT_TRUE(capture.start(&stacked, &stacked,
                              make_request(9.0, TextureLayout::Stacked), recorder()));
    pump();
    ASSERT_EQ(result.calls, 1);
    EXPECT_EQ(result.err, StitchError::None);
    EXPECT_DOUBLE_EQ(stacked.seeks.back(), 9.0);
}
