#ifndef SNOOKERIZER_HPP
#define SNOOKERIZER_HPP

#include "ball_detector.hpp"
#include "ball_tracker.hpp"
#include "calibration_engine.hpp"
#include "calibration_store.hpp"
#include "config.hpp"
#include "coordinate_transformer.hpp"
#include "detection_api.hpp"
#include "errors.hpp"
#include "frame_processor.hpp"
#include "snooker_types.hpp"
#include "trajectory_analyzer.hpp"
#include "video_source.hpp"

#endif  // SNOOKERIZER_HPP
