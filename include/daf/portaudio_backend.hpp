#ifndef DAF_PORTAUDIO_BACKEND
#define DAF_PORTAUDIO_BACKEND
#include "audio_backend.hpp"
#include <portaudio.h>

class PortAudioStream : public AudioStream {
public:
    explicit PortAudioStream(PaStream* stream);
    ~PortAudioStream() override;

    PortAudioStream(const PortAudioStream&) = delete;
    PortAudioStream& operator=(const PortAudioStream&) = delete;

    void start() override;
    void stop() override;
    StreamStatus read(SAMPLE* buffer, unsigned long frames) override;
    StreamStatus write(const SAMPLE* buffer, unsigned long frames) override;

private:
    PaStream* stream;
};

// Owns the PortAudio library lifetime: Pa_Initialize on construction, Pa_Terminate on destruction.
class PortAudioBackend : public AudioBackend {
public:
    PortAudioBackend();
    ~PortAudioBackend() override;

    PortAudioBackend(const PortAudioBackend&) = delete;
    PortAudioBackend& operator=(const PortAudioBackend&) = delete;

    std::vector<DeviceInfo> devices() override;
    std::unique_ptr<AudioStream> open_input(std::optional<int> device, const StreamFormat& format) override;
    std::unique_ptr<AudioStream> open_output(std::optional<int> device, const StreamFormat& format) override;

private:
    std::unique_ptr<AudioStream> open(std::optional<int> device, const StreamFormat& format, bool input);
};
#endif
