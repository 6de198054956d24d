#include "video_source.hpp"

#include <stdexcept>

#include "utilities.hpp"

using namespace std;
using namespace cv;

VideoSource::VideoSource(const string& path) : capture(path) { init(path); }

VideoSource::VideoSource(int cameraIndex) : capture(cameraIndex) {
    init("camera " + to_string(cameraIndex));
}

void VideoSource::init(const string& description) {
    if (!capture.isOpened()) {
        throw runtime_error("could not open video source " + description);
    }
    double reported = capture.get(CAP_PROP_FPS);
    if (reported > 0.0) framesPerSecond = reported;
    LOGI("[VideoSource] Opened %s at %.2f fps", description.c_str(), framesPerSecond);
}

bool VideoSource::read(VideoFrame& frame) {
    Mat image;
    if (!capture.read(image) || image.empty()) return false;

    frame.image = image;
    frame.frameNumber = nextFrame++;
    // Container timestamps can repeat or go backwards; derive them from the frame index.
    frame.timestamp = frame.frameNumber / framesPerSecond;
    return true;
}

Size VideoSource::frameSize() const {
    return Size(static_cast<int>(capture.get(CAP_PROP_FRAME_WIDTH)),
                static_cast<int>(capture.get(CAP_PROP_FRAME_HEIGHT)));
}
