#ifndef TABLE_DETECTOR_HPP
#define TABLE_DETECTOR_HPP

#include <opencv2/opencv.hpp>
#include <vector>

#include "config.hpp"

// Finds the playing-surface outline from the four dominant cushion lines.
class TableDetector {
   public:
    explicit TableDetector(const CalibrationConfig &config);

    // Returns TL, TR, BR, BL corners in frame pixels, or an empty vector when fewer than two
    // separated lines are found in either direction.
    std::vector<cv::Point2f> detect(const cv::Mat &frame, cv::Mat *debugDraw = nullptr) const;

    // Four boundary lines (rho, theta) in processing resolution from the last detect call.
    const std::vector<cv::Vec2f> &boundaryLines() const { return lastBoundaryLines; }

   private:
    std::vector<cv::Vec2f> selectBoundaryPair(const std::vector<cv::Vec2f> &family,
                                              const cv::Point2f &centre,
                                              double minSeparation) const;
    static bool intersect(const cv::Vec2f &a, const cv::Vec2f &b, cv::Point2f &out);

    int maxDimension;
    double cannyLow;
    double cannyHigh;
    int houghThreshold;
    double angleTolerance;  // radians
    double minSeparation;

    mutable std::vector<cv::Vec2f> lastBoundaryLines;
};

#endif  // TABLE_DETECTOR_HPP
