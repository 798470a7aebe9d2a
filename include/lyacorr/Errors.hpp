#pragma once

#include <stdexcept>
#include <string>

namespace lyacorr {

class LyacorrError : public std::runtime_error {
public:
    explicit LyacorrError(const std::string& message)
        : std::runtime_error(message) {}
};

// invalid or missing parameter, raised before any computation starts
class ConfigurationError : public LyacorrError {
public:
    explicit ConfigurationError(const std::string& message)
        : LyacorrError("Configuration error: " + message) {}
};

// malformed forest data (length mismatch, negative weight, NaN delta, ...)
class DataIntegrityError : public LyacorrError {
public:
    explicit DataIntegrityError(const std::string& message)
        : LyacorrError("Data integrity error: " + message) {}
};

class IOError : public LyacorrError {
public:
    explicit IOError(const std::string& message)
        : LyacorrError("I/O error: " + message) {}
};

// a cell task failed; the whole correlation run is discarded
class WorkerFailure : public LyacorrError {
public:
    WorkerFailure(long long cell, const std::string& message)
        : LyacorrError("Worker failure in cell " + std::to_string(cell) +
                       ": " + message),
          cell_(cell) {}

    long long cell() const { return cell_; }

private:
    long long cell_;
};

} // namespace lyacorr
