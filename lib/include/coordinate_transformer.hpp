#ifndef COORDINATE_TRANSFORMER_HPP
#define COORDINATE_TRANSFORMER_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <vector>

#include "snooker_types.hpp"

// Maps points between frame pixels and table metres through a calibration's homography.
// Every operation throws CoordinateError when the calibration is missing or invalid.
class CoordinateTransformer {
   public:
    explicit CoordinateTransformer(std::shared_ptr<const CalibrationData> calibration);

    bool isTransformationAvailable() const;

    cv::Point2f pixelToTable(const cv::Point2f& pixel) const;
    cv::Point2f tableToPixel(const cv::Point2f& table) const;

    std::vector<cv::Point2f> pixelsToTable(const std::vector<cv::Point2f>& pixels) const;
    std::vector<cv::Point2f> tableToPixels(const std::vector<cv::Point2f>& points) const;

    // Element-wise pixelToTable; preserves length and order.
    std::vector<cv::Point2f> transformTrajectory(const std::vector<cv::Point2f>& trajectory) const;

    // Whether a table-space point lies on the playing surface.
    bool isOnTable(const cv::Point2f& table) const;

   private:
    void requireCalibration() const;

    std::shared_ptr<const CalibrationData> calibration;
    cv::Matx33d inverse;
};

#endif  // COORDINATE_TRANSFORMER_HPP
