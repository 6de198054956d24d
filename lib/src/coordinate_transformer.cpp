#include "coordinate_transformer.hpp"

#include <opencv2/core.hpp>

#include "errors.hpp"

using namespace std;
using namespace cv;

CoordinateTransformer::CoordinateTransformer(shared_ptr<const CalibrationData> calibration)
    : calibration(std::move(calibration)), inverse(Matx33d::eye()) {
    if (isTransformationAvailable()) {
        inverse = this->calibration->homography.inv();
    }
}

bool CoordinateTransformer::isTransformationAvailable() const {
    return calibration && calibration->isValid;
}

void CoordinateTransformer::requireCalibration() const {
    if (!calibration) {
        throw CoordinateError("no calibration available");
    }
    if (!calibration->isValid) {
        throw CoordinateError("calibration from frame " + to_string(calibration->frameNumber) +
                              " is not valid");
    }
}

vector<Point2f> CoordinateTransformer::pixelsToTable(const vector<Point2f>& pixels) const {
    requireCalibration();
    vector<Point2f> out;
    if (pixels.empty()) return out;
    perspectiveTransform(pixels, out, calibration->homography);
    return out;
}

vector<Point2f> CoordinateTransformer::tableToPixels(const vector<Point2f>& points) const {
    requireCalibration();
    vector<Point2f> out;
    if (points.empty()) return out;
    perspectiveTransform(points, out, inverse);
    return out;
}

Point2f CoordinateTransformer::pixelToTable(const Point2f& pixel) const {
    return pixelsToTable({pixel}).front();
}

Point2f CoordinateTransformer::tableToPixel(const Point2f& table) const {
    return tableToPixels({table}).front();
}

vector<Point2f> CoordinateTransformer::transformTrajectory(const vector<Point2f>& trajectory) const {
    return pixelsToTable(trajectory);
}

bool CoordinateTransformer::isOnTable(const Point2f& table) const {
    requireCalibration();
    const Size2f& dims = calibration->tableDimensions;
    return table.x >= 0.f && table.y >= 0.f && table.x <= dims.width && table.y <= dims.height;
}
