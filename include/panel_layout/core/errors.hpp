#pragma once

#include <stdexcept>
#include <string>

namespace panel_layout {

class PanelLayoutError : public std::runtime_error {
public:
    explicit PanelLayoutError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PanelLayoutError {
public:
    explicit ConfigError(const std::string& message)
        : PanelLayoutError("Config error: " + message) {}
};

class ValidationError : public PanelLayoutError {
public:
    explicit ValidationError(const std::string& message)
        : PanelLayoutError("Validation error: " + message) {}
};

class InvalidRegionError : public PanelLayoutError {
public:
    explicit InvalidRegionError(const std::string& message)
        : PanelLayoutError("Invalid region: " + message) {}
};

class IOError : public PanelLayoutError {
public:
    explicit IOError(const std::string& message)
        : PanelLayoutError("I/O error: " + message) {}
};

class ImageIOError : public IOError {
public:
    explicit ImageIOError(const std::string& message)
        : IOError("Image error: " + message) {}
};

} // namespace panel_layout
