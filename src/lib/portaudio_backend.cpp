#include "daf/portaudio_backend.hpp"
#include "daf/errors.hpp"
#include <iostream>

static std::string pa_error_text(const std::string& what, PaError err)
{
    return what + ": " + Pa_GetErrorText(err);
}

PortAudioStream::PortAudioStream(PaStream* stream)
    : stream(stream)
{
}

PortAudioStream::~PortAudioStream()
{
    if (Pa_IsStreamActive(stream) == 1) {
        PaError err = Pa_StopStream(stream);
        if (err != paNoError) {
            std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
        }
    }
    PaError err = Pa_CloseStream(stream);
    if (err != paNoError) {
        std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
    }
}

void PortAudioStream::start()
{
    PaError err = Pa_StartStream(stream);
    if (err != paNoError) {
        throw StreamOpenException(pa_error_text("PortAudio start stream error", err));
    }
}

void PortAudioStream::stop()
{
    if (Pa_IsStreamStopped(stream) == 1) {
        return;
    }
    PaError err = Pa_StopStream(stream);
    if (err != paNoError) {
        std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
    }
}

StreamStatus PortAudioStream::read(SAMPLE* buffer, unsigned long frames)
{
    PaError err = Pa_ReadStream(stream, buffer, frames);
    if (err == paInputOverflowed) {
        return StreamStatus::Overflow;
    }
    if (err != paNoError) {
        throw StreamIOException(pa_error_text("PortAudio ReadStream error", err));
    }
    return StreamStatus::Ok;
}

StreamStatus PortAudioStream::write(const SAMPLE* buffer, unsigned long frames)
{
    PaError err = Pa_WriteStream(stream, buffer, frames);
    if (err == paOutputUnderflowed) {
        return StreamStatus::Underflow;
    }
    if (err != paNoError) {
        throw StreamIOException(pa_error_text("PortAudio WriteStream error", err));
    }
    return StreamStatus::Ok;
}

PortAudioBackend::PortAudioBackend()
{
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw DafException(pa_error_text("PortAudio init error", err));
    }
}

PortAudioBackend::~PortAudioBackend()
{
    Pa_Terminate();
}

std::vector<DeviceInfo> PortAudioBackend::devices()
{
    std::vector<DeviceInfo> result;
    PaDeviceIndex count = Pa_GetDeviceCount();
    if (count < 0) {
        throw DafException(pa_error_text("PortAudio device enumeration error", count));
    }
    PaDeviceIndex default_input = Pa_GetDefaultInputDevice();
    PaDeviceIndex default_output = Pa_GetDefaultOutputDevice();
    for (PaDeviceIndex i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info == nullptr) {
            continue;
        }
        const PaHostApiInfo* host = Pa_GetHostApiInfo(info->hostApi);
        result.push_back(DeviceInfo {
            i,
            info->name,
            host != nullptr ? host->name : "",
            info->maxInputChannels,
            info->maxOutputChannels,
            info->defaultSampleRate,
            i == default_input,
            i == default_output,
        });
    }
    return result;
}

std::unique_ptr<AudioStream> PortAudioBackend::open_input(std::optional<int> device, const StreamFormat& format)
{
    return open(device, format, true);
}

std::unique_ptr<AudioStream> PortAudioBackend::open_output(std::optional<int> device, const StreamFormat& format)
{
    return open(device, format, false);
}

std::unique_ptr<AudioStream> PortAudioBackend::open(std::optional<int> device, const StreamFormat& format, bool input)
{
    const char* direction = input ? "input" : "output";
    PaDeviceIndex index;
    if (device.has_value()) {
        index = *device;
        if (index < 0 || index >= Pa_GetDeviceCount()) {
            throw DeviceUnavailableException("No " + std::string(direction) + " device with index " + std::to_string(index));
        }
    } else {
        index = input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (index == paNoDevice) {
            throw DeviceUnavailableException("No default " + std::string(direction) + " device");
        }
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (info == nullptr || (input ? info->maxInputChannels : info->maxOutputChannels) <= 0) {
        throw DeviceUnavailableException("Device " + std::to_string(index) + " has no " + direction + " channels");
    }

    PaStreamParameters params;
    params.device = index;
    params.channelCount = format.channels;
    params.sampleFormat = DAF_SAMPLE_TYPE;
    params.suggestedLatency = input ? info->defaultLowInputLatency : info->defaultLowOutputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    const PaStreamParameters* in_params = input ? &params : nullptr;
    const PaStreamParameters* out_params = input ? nullptr : &params;
    PaError err = Pa_IsFormatSupported(in_params, out_params, format.sample_rate);
    if (err != paFormatIsSupported) {
        throw StreamOpenException(pa_error_text(std::string("Unsupported ") + direction + " format on " + info->name, err));
    }

    PaStream* stream = nullptr;
    err = Pa_OpenStream(&stream, in_params, out_params, format.sample_rate, format.frames_per_buffer, paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        throw StreamOpenException(pa_error_text("PortAudio open stream error", err));
    }
    std::cout << "Opened " << direction << " device " << index << " (" << info->name << ")" << std::endl;
    return std::make_unique<PortAudioStream>(stream);
}
