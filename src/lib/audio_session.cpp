#include "daf/audio_session.hpp"
#include "daf/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <vector>
using namespace std::chrono;
using Clock = DelayRing<SAMPLE>::Clock;

size_t blocks_for_delay(int delay_ms, const StreamFormat& format)
{
    double blocks_per_second = format.sample_rate / format.frames_per_buffer;
    return static_cast<size_t>(std::lround(std::max(delay_ms, 0) / 1000.0 * blocks_per_second));
}

double delay_for_blocks(size_t blocks, const StreamFormat& format)
{
    return blocks * format.frames_per_buffer * 1000.0 / format.sample_rate;
}

AudioSession::AudioSession(AudioBackend& backend, const StreamFormat& format,
    std::optional<int> input_device, std::optional<int> output_device)
    : backend_(backend)
    , format_(format)
    , input_device_(input_device)
    , output_device_(output_device)
{
    if (format_.channels <= 0 || format_.frames_per_buffer == 0 || format_.frames_per_buffer > MAX_FRAMES_PER_BUFFER
        || !(format_.sample_rate > 0 && format_.sample_rate <= MAX_SAMPLE_RATE)) {
        throw std::invalid_argument("Invalid stream format");
    }
    target_blocks_ = blocks_for_delay(delay_ms_.load(), format_);
}

AudioSession::~AudioSession()
{
    stop();
}

void AudioSession::set_events(SessionEvents* events)
{
    events_ = events;
}

void AudioSession::start(int delay_ms, float gain)
{
    set_delay(delay_ms);
    set_gain(gain);
    if (running_.load()) {
        return;
    }
    // the worker may have ended on its own after a device error
    if (worker_.joinable()) {
        worker_.join();
    }

    auto input = backend_.open_input(input_device_, format_);
    auto output = backend_.open_output(output_device_, format_);
    auto ring = std::make_unique<DelayRing<SAMPLE>>(
        blocks_for_delay(MAX_DELAY_MS, format_) + 1, format_.frames_per_buffer * format_.channels);
    input->start();
    output->start();

    exit_flag = false;
    running_ = true;
    worker_ = std::thread(&AudioSession::transfer_loop, this, std::move(input), std::move(output), std::move(ring));
    std::cout << "Started, delay " << delay_ms_.load() << " ms, gain " << gain_.load() << std::endl;
}

void AudioSession::set_delay(int delay_ms)
{
    delay_ms = std::min(std::max(delay_ms, 0), MAX_DELAY_MS);
    delay_ms_ = delay_ms;
    target_blocks_ = blocks_for_delay(delay_ms, format_);
}

void AudioSession::set_gain(float gain)
{
    if (std::isnan(gain)) {
        gain = 0.0f;
    }
    gain_ = std::min(std::max(gain, 0.0f), MAX_GAIN_PERCENT / 100.0f);
}

void AudioSession::stop()
{
    exit_flag = true;
    if (worker_.joinable()) {
        worker_.join();
        std::cout << "Stopped" << std::endl;
    }
    running_ = false;
}

bool AudioSession::is_running() const
{
    return running_.load();
}

int AudioSession::delay_ms() const
{
    return delay_ms_.load();
}

size_t AudioSession::delay_blocks() const
{
    return target_blocks_.load();
}

float AudioSession::gain() const
{
    return gain_.load();
}

const StreamFormat& AudioSession::format() const
{
    return format_;
}

void AudioSession::transfer_loop(std::unique_ptr<AudioStream> input, std::unique_ptr<AudioStream> output,
    std::unique_ptr<DelayRing<SAMPLE>> ring)
{
    const unsigned long frames = format_.frames_per_buffer;
    std::vector<SAMPLE> in_block(ring->block_size());
    std::vector<SAMPLE> out_block(ring->block_size());

    size_t applied_blocks = target_blocks_.load();
    auto last_resize = Clock::now();
    auto last_report = Clock::now();
    size_t overruns = 0;
    size_t underruns = 0;
    size_t reported_overruns = 0;
    size_t reported_underruns = 0;
    double latency_sum = 0;
    size_t latency_count = 0;
    std::string error;

    try {
        while (!exit_flag.load()) {
            auto now = Clock::now();
            size_t target = target_blocks_.load();
            if (target != applied_blocks && now - last_resize >= milliseconds(RESIZE_THROTTLE_MS)) {
                applied_blocks = target;
                last_resize = now;
                if (ring->queue_size() > applied_blocks) {
                    ring->drop_oldest(ring->queue_size() - applied_blocks);
                }
            }

            if (input->read(in_block.data(), frames) == StreamStatus::Overflow) {
                overruns++;
            }
            if (!ring->push(in_block.data())) {
                overruns++;
            }

            if (ring->queue_size() > applied_blocks) {
                Clock::time_point captured;
                ring->pop(out_block.data(), gain_.load(), &captured);
                latency_sum += duration<double, std::milli>(Clock::now() - captured).count();
                latency_count++;
            } else {
                std::fill(out_block.begin(), out_block.end(), SAMPLE {});
            }

            if (output->write(out_block.data(), frames) == StreamStatus::Underflow) {
                underruns++;
            }

            now = Clock::now();
            if (events_ != nullptr && now - last_report >= milliseconds(REPORT_INTERVAL_MS)) {
                last_report = now;
                if (latency_count > 0) {
                    events_->on_measured_delay(latency_sum / latency_count);
                    latency_sum = 0;
                    latency_count = 0;
                }
                if (overruns != reported_overruns || underruns != reported_underruns) {
                    events_->on_xrun(overruns - reported_overruns, underruns - reported_underruns);
                    reported_overruns = overruns;
                    reported_underruns = underruns;
                }
            }
        }
    } catch (const StreamIOException& e) {
        std::cerr << "Audio device error: " << e.what() << std::endl;
        error = e.what();
    }

    input->stop();
    output->stop();
    input.reset();
    output.reset();
    ring.reset();
    running_ = false;
    if (!error.empty() && events_ != nullptr) {
        events_->on_fatal_error(error);
    }
}
