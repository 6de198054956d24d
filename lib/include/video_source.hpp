#ifndef VIDEO_SOURCE_HPP
#define VIDEO_SOURCE_HPP

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <string>

struct VideoFrame {
    cv::Mat image;
    int frameNumber = 0;
    double timestamp = 0.0;  // seconds
};

// Sequential reader over a video file or camera. Frame numbers start at 0 and increase by one
// per frame read.
class VideoSource {
   public:
    // Throws std::runtime_error when the source cannot be opened.
    explicit VideoSource(const std::string& path);
    explicit VideoSource(int cameraIndex);

    // False at end of stream.
    bool read(VideoFrame& frame);

    double fps() const { return framesPerSecond; }
    cv::Size frameSize() const;

   private:
    void init(const std::string& description);

    cv::VideoCapture capture;
    double framesPerSecond = 30.0;
    int nextFrame = 0;
};

#endif  // VIDEO_SOURCE_HPP
