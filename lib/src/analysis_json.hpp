#pragma once

#include <string>
#include <vector>

#include "calibration_engine.hpp"
#include "snooker_types.hpp"

std::string formatDetectionsJson(const std::vector<Detection>& detections,
                                 const std::vector<cv::Point2f>& tablePositions);
std::string formatTrackedBallsJson(const std::vector<TrackedBall>& balls);
std::string formatTrajectoriesJson(const std::vector<TrajectorySummary>& summaries);
std::string formatEventsJson(const std::vector<BallEvent>& events);
std::string formatOverviewJson(const TrajectoryOverview& overview);
std::string formatCalibrationJson(const CalibrationData* calibration, CalibrationState state);
std::string formatFrameAnalysisJson(const FrameAnalysis& analysis);
std::string formatErrorJson(const std::string& message);
