#ifndef CALIBRATION_STORE_HPP
#define CALIBRATION_STORE_HPP

#include <memory>
#include <string>

#include "snooker_types.hpp"

// Persists calibrations per camera as cv::FileStorage YAML files.
class CalibrationStore {
   public:
    CalibrationStore(std::string directory, double maxAgeHours);

    // Returns false and logs when the file cannot be written.
    bool save(const CalibrationData& data, const std::string& cameraId) const;

    // Null when nothing is stored, the record is older than maxAgeHours or cannot be parsed.
    std::shared_ptr<const CalibrationData> load(const std::string& cameraId) const;

    std::string pathFor(const std::string& cameraId) const;

   private:
    std::string directory;
    double maxAgeHours;
};

#endif  // CALIBRATION_STORE_HPP
