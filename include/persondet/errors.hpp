#pragma once

#include <stdexcept>
#include <string>

namespace persondet {

class InputNotFoundError : public std::runtime_error {
public:
    explicit InputNotFoundError(const std::string& path)
        : std::runtime_error("Input video file not found: " + path), path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class OutputPathError : public std::runtime_error {
public:
    explicit OutputPathError(const std::string& msg) : std::runtime_error(msg) {}
};

class StreamOpenError : public std::runtime_error {
public:
    explicit StreamOpenError(const std::string& msg) : std::runtime_error(msg) {}
};

class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace persondet
