/*
 * Records rendered panorama frames to a video file with cv::VideoWriter.
 */

#ifndef DUOSTITCH_PANORAMA_RECORDER_H
#define DUOSTITCH_PANORAMA_RECORDER_H

#include <string>

#include <opencv2/videoio.hpp>

class PanoramaRecorder {
public:
    PanoramaRecorder();
    ~PanoramaRecorder();

    /*
     * Opens `path` for writing.  If the container/codec pair implied by
     * the extension is unavailable, falls back to MJPG in an .avi next
     * to it.  path() reports the file actually written.
     */
    bool start(const std::string &path, double fps, cv::Size size);

    /* 8-bit RGB frame of exactly the size given to start(). */
    bool addFrame(const cv::Mat &rgb);

    /* Closes the file.  A recording with no frames is removed and fails. */
    bool stop();

    bool active() const { return writer.isOpened(); }
    int  frames() const { return frame_count; }
    const std::string &path() const { return out_path; }

private:
    cv::VideoWriter writer;
    cv::Size        frame_size;
    std::string     out_path;
    int             frame_count;
};

#endif
