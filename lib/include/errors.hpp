#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Root of every error raised by the analysis pipeline.
class SnookerError : public std::runtime_error {
   public:
    explicit SnookerError(const std::string& what) : std::runtime_error(what) {}
};

// Inference failure or malformed detector output.
class DetectionError : public SnookerError {
   public:
    explicit DetectionError(const std::string& what) : SnookerError(what) {}
};

// Table corners not found or homography failed validation.
class CalibrationError : public SnookerError {
   public:
    explicit CalibrationError(const std::string& what) : SnookerError(what) {}
};

// Transformation requested without a usable calibration.
class CoordinateError : public SnookerError {
   public:
    explicit CoordinateError(const std::string& what) : SnookerError(what) {}
};

// Association failed (for example a non-finite cost matrix).
class TrackingError : public SnookerError {
   public:
    explicit TrackingError(const std::string& what) : SnookerError(what) {}
};

// Invalid or missing session configuration. Raised at session creation only.
class ConfigurationError : public SnookerError {
   public:
    explicit ConfigurationError(const std::string& what) : SnookerError(what) {}
};

#endif  // ERRORS_HPP
