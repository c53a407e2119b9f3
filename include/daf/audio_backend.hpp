#ifndef DAF_AUDIO_BACKEND
#define DAF_AUDIO_BACKEND
#include "defines.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct StreamFormat {
    double sample_rate = SAMPLE_RATE;
    int channels = CHANNELS;
    unsigned long frames_per_buffer = FRAMES_PER_BUFFER;
};

struct DeviceInfo {
    int index;
    std::string name;
    std::string host_api;
    int max_input_channels;
    int max_output_channels;
    double default_sample_rate;
    bool is_default_input;
    bool is_default_output;
};

// Result of a blocking read or write that did not fail outright.
enum class StreamStatus {
    Ok,
    Overflow, // input samples were dropped before we read them
    Underflow, // output ran dry before we wrote
};

class AudioStream {
public:
    virtual ~AudioStream() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    // Both block until frames are transferred and throw StreamIOException on device errors.
    virtual StreamStatus read(SAMPLE* buffer, unsigned long frames) = 0;
    virtual StreamStatus write(const SAMPLE* buffer, unsigned long frames) = 0;
};

class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    virtual std::vector<DeviceInfo> devices() = 0;
    // An empty device selects the host default. Throws DeviceUnavailableException or StreamOpenException.
    virtual std::unique_ptr<AudioStream> open_input(std::optional<int> device, const StreamFormat& format) = 0;
    virtual std::unique_ptr<AudioStream> open_output(std::optional<int> device, const StreamFormat& format) = 0;
};
#endif
