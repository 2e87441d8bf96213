#include "panorama_recorder.h"

#include <cstdio>

#include <opencv2/imgproc.hpp>

static std::string replace_extension(const std::string &path, const char *ext)
{
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return path + ext;
    return path.substr(0, dot) + ext;
}

PanoramaRecorder::PanoramaRecorder() : frame_count(0)
{
}

PanoramaRecorder::~PanoramaRecorder()
{
    if (active())
        stop();
}

bool PanoramaRecorder::start(const std::string &path, double fps, cv::Size size)
{
    if (active()) {
        fprintf(stderr, "[record] already recording to %s\n", out_path.c_str());
        return false;
    }
    if (size.width <= 0 || size.height <= 0 || fps <= 0.0) {
        fprintf(stderr, "[record] invalid format %dx%d @ %.1f fps\n",
                size.width, size.height, fps);
        return false;
    }

    frame_size  = size;
    frame_count = 0;
    out_path    = path;

    if (writer.open(path, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps, size)) {
        printf("[record] %s  %dx%d @ %.1f fps\n", path.c_str(),
               size.width, size.height, fps);
        return true;
    }

    out_path = replace_extension(path, ".avi");
    if (writer.open(out_path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, size)) {
        printf("[record] %s  %dx%d @ %.1f fps (MJPG fallback)\n",
               out_path.c_str(), size.width, size.height, fps);
        return true;
    }

    fprintf(stderr, "[record] no usable encoder for %s\n", path.c_str());
    out_path.clear();
    return false;
}

bool PanoramaRecorder::addFrame(const cv::Mat &rgb)
{
    if (!active())
        return false;
    if (rgb.type() != CV_8UC3 || rgb.size() != frame_size) {
        fprintf(stderr, "[record] frame %dx%d does not match %dx%d\n",
                rgb.cols, rgb.rows, frame_size.width, frame_size.height);
        return false;
    }

    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    writer.write(bgr);
    frame_count++;
    return true;
}

bool PanoramaRecorder::stop()
{
    if (!active())
        return false;
    writer.release();

    if (frame_count == 0) {
        fprintf(stderr, "[record] no frames recorded, removing %s\n", out_path.c_str());
        std::remove(out_path.c_str());
        return false;
    }
    printf("[record] wrote %d frames to %s\n", frame_count, out_path.c_str());
    return true;
}
