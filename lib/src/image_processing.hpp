#pragma once

#include <opencv2/opencv.hpp>

#include "snooker_types.hpp"

// Frame copy with detections, table outline, pockets, trajectories and frame info drawn on it.
cv::Mat drawFrameAnalysis(const cv::Mat& frame, const FrameAnalysis& analysis);

// Top-down table view with tracked balls at their table positions. Empty without a calibration.
cv::Mat drawTopDownView(const cv::Mat& frame, const FrameAnalysis& analysis, int outW = 1000);
