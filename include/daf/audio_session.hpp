#ifndef DAF_AUDIO_SESSION
#define DAF_AUDIO_SESSION
#include "audio_backend.hpp"
#include "delay_ring.hpp"
#include "tunable_session.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <thread>

size_t blocks_for_delay(int delay_ms, const StreamFormat& format);
double delay_for_blocks(size_t blocks, const StreamFormat& format);

/*
 * Microphone to headphones transfer with a fixed delay.
 *
 * A worker thread reads one block from the input stream, pushes it into the
 * DelayRing and, once more blocks are buffered than the delay asks for,
 * writes the oldest block scaled by the gain to the output stream. Until then
 * it writes silence. Delay and gain are atomics so the control thread can
 * change them at any time; the worker picks them up at the next block.
 */
class AudioSession : public TunableAudioSession {
public:
    AudioSession(AudioBackend& backend, const StreamFormat& format = StreamFormat(),
        std::optional<int> input_device = std::nullopt, std::optional<int> output_device = std::nullopt);
    ~AudioSession() override;

    AudioSession(const AudioSession&) = delete;
    AudioSession& operator=(const AudioSession&) = delete;

    // Must be set before start(); callbacks arrive on the audio thread.
    void set_events(SessionEvents* events);

    void start(int delay_ms, float gain) override;
    void set_delay(int delay_ms) override;
    void set_gain(float gain) override;
    void stop() override;
    bool is_running() const override;

    int delay_ms() const;
    size_t delay_blocks() const;
    float gain() const;
    const StreamFormat& format() const;

private:
    void transfer_loop(std::unique_ptr<AudioStream> input, std::unique_ptr<AudioStream> output,
        std::unique_ptr<DelayRing<SAMPLE>> ring);

    AudioBackend& backend_;
    StreamFormat format_;
    std::optional<int> input_device_;
    std::optional<int> output_device_;
    SessionEvents* events_ = nullptr;

    std::atomic<int> delay_ms_ { DEFAULT_DELAY_MS };
    std::atomic<size_t> target_blocks_ { 0 };
    std::atomic<float> gain_ { 1.0f };
    std::atomic_bool running_ { false };
    std::atomic_bool exit_flag { false };
    std::thread worker_;
};
#endif
