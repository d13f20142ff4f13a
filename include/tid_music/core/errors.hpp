#pragma once

#include <stdexcept>
#include <string>

namespace tid_music {

class TidMusicError : public std::runtime_error {
public:
    explicit TidMusicError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public TidMusicError {
public:
    explicit ConfigurationError(const std::string& message)
        : TidMusicError("Configuration error: " + message) {}
};

class ValidationError : public ConfigurationError {
public:
    explicit ValidationError(const std::string& message)
        : ConfigurationError("Validation error: " + message) {}
};

class IOError : public TidMusicError {
public:
    explicit IOError(const std::string& message)
        : TidMusicError("I/O error: " + message) {}
};

class StorageError : public IOError {
public:
    explicit StorageError(const std::string& message)
        : IOError("Storage error: " + message) {}
};

class FitsError : public StorageError {
public:
    explicit FitsError(const std::string& message)
        : StorageError("FITS error: " + message) {}
};

class InsufficientDataError : public TidMusicError {
public:
    explicit InsufficientDataError(const std::string& message)
        : TidMusicError("Insufficient data: " + message) {}
};

class DetectionFailed : public TidMusicError {
public:
    explicit DetectionFailed(const std::string& message)
        : TidMusicError("Detection failed: " + message) {}
};

class InsufficientChannelsError : public DetectionFailed {
public:
    explicit InsufficientChannelsError(const std::string& message)
        : DetectionFailed("insufficient channels: " + message) {}
};

class PipelineError : public TidMusicError {
public:
    explicit PipelineError(const std::string& message)
        : TidMusicError("Pipeline error: " + message) {}
};

class PreconditionError : public PipelineError {
public:
    explicit PreconditionError(const std::string& message)
        : PipelineError("precondition: " + message) {}
};

// Short machine-readable name recorded on the event document.
inline const char* error_type_name(const std::exception& e) {
    if (dynamic_cast<const InsufficientChannelsError*>(&e)) return "InsufficientChannelsError";
    if (dynamic_cast<const DetectionFailed*>(&e)) return "DetectionFailed";
    if (dynamic_cast<const InsufficientDataError*>(&e)) return "InsufficientDataError";
    if (dynamic_cast<const PreconditionError*>(&e)) return "PreconditionError";
    if (dynamic_cast<const StorageError*>(&e)) return "StorageError";
    if (dynamic_cast<const IOError*>(&e)) return "IOError";
    if (dynamic_cast<const ConfigurationError*>(&e)) return "ConfigurationError";
    if (dynamic_cast<const PipelineError*>(&e)) return "PipelineError";
    return "Error";
}

} // namespace tid_music
