#ifndef DAF_ERRORS
#define DAF_ERRORS
#include <stdexcept>
#include <string>

class DafException : public std::runtime_error {
public:
    explicit DafException(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

// no input or output device to open
class DeviceUnavailableException : public DafException {
public:
    explicit DeviceUnavailableException(const std::string& message)
        : DafException(message)
    {
    }
};

class StreamOpenException : public DafException {
public:
    explicit StreamOpenException(const std::string& message)
        : DafException(message)
    {
    }
};

// fatal read/write failure on a running stream
class StreamIOException : public DafException {
public:
    explicit StreamIOException(const std::string& message)
        : DafException(message)
    {
    }
};

class SettingsException : public DafException {
public:
    explicit SettingsException(const std::string& message)
        : DafException(message)
    {
    }
};
#endif
