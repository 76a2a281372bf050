#pragma once

#include <stdexcept>
#include <string>

namespace driftwatch {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Invalid startup parameters; fatal, raised before any loop starts
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

// Detection for a single file failed; the file is retried next cycle
class ScanError : public Error {
public:
    ScanError(const std::string& file_path, const std::string& message)
        : Error(file_path + ": " + message), file_path_(file_path) {}

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;
};

class SpecLoadError : public Error {
public:
    explicit SpecLoadError(const std::string& message) : Error(message) {}
};

class ChannelDeliveryError : public Error {
public:
    explicit ChannelDeliveryError(const std::string& message) : Error(message) {}
};

class SuggestionGenerationError : public Error {
public:
    explicit SuggestionGenerationError(const std::string& message) : Error(message) {}
};

class StoreError : public Error {
public:
    explicit StoreError(const std::string& message) : Error(message) {}
};

} // namespace driftwatch
