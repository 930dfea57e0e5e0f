#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Raised when a series is shorter than the lookback an indicator needs.
// Callers skip the symbol or retry with a longer window.
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(const std::string& series, std::size_t required, std::size_t actual)
        : std::runtime_error("insufficient data for " + series + ": need " +
                             std::to_string(required) + ", got " + std::to_string(actual)),
          series_(series), required_(required), actual_(actual) {}

    const std::string& series() const { return series_; }
    std::size_t required() const { return required_; }
    std::size_t actual() const { return actual_; }

private:
    std::string series_;
    std::size_t required_;
    std::size_t actual_;
};

// Calibration run aborted before superseding the active record.
class CalibrationInsufficientDataError : public std::runtime_error {
public:
    explicit CalibrationInsufficientDataError(const std::string& message)
        : std::runtime_error(message) {}
};

// Historical fetch exceeded its deadline. Retryable.
class CalibrationTimeoutError : public std::runtime_error {
public:
    explicit CalibrationTimeoutError(const std::string& message)
        : std::runtime_error(message) {}
};
