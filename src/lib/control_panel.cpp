#include "daf/control_panel.hpp"
#include "daf/defines.hpp"
#include "daf/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

ControlPanel::ControlPanel(TunableAudioSession& session, PanelView& view, int delay_ms, int gain_percent)
    : session_(session)
    , view_(view)
    , delay_ms_(std::min(std::max(delay_ms, 0), MAX_DELAY_MS))
    , gain_percent_(std::min(std::max(gain_percent, 0), MAX_GAIN_PERCENT))
{
    running_ = session_.is_running();
    view_.show_delay(std::to_string(delay_ms_) + " ms");
    view_.show_gain(std::to_string(gain_percent_) + " %");
    view_.set_running(running_);
}

void ControlPanel::on_start()
{
    if (running_) {
        return;
    }
    try {
        session_.start(delay_ms_, gain_percent_ / 100.0f);
    } catch (const DeviceUnavailableException& e) {
        std::cerr << e.what() << std::endl;
        view_.show_error("No input/output device found! Connect and rerun.");
        return;
    } catch (const DafException& e) {
        view_.show_error(e.what());
        return;
    }
    running_ = true;
    view_.set_running(true);
}

void ControlPanel::on_stop()
{
    session_.stop();
    running_ = false;
    view_.clear_actual_delay();
    view_.set_running(false);
}

void ControlPanel::on_delay_changed(int delay_ms)
{
    delay_ms_ = std::min(std::max(delay_ms, 0), MAX_DELAY_MS);
    view_.show_delay(std::to_string(delay_ms_) + " ms");
    session_.set_delay(delay_ms_);
}

void ControlPanel::on_gain_changed(int gain_percent)
{
    gain_percent_ = std::min(std::max(gain_percent, 0), MAX_GAIN_PERCENT);
    view_.show_gain(std::to_string(gain_percent_) + " %");
    session_.set_gain(gain_percent_ / 100.0f);
}

void ControlPanel::on_quit()
{
    on_stop();
    view_.close();
}

void ControlPanel::on_session_measured_delay(double delay_ms)
{
    if (!running_) {
        return;
    }
    view_.show_actual_delay(std::to_string(static_cast<long>(std::floor(delay_ms))) + " ms");
}

void ControlPanel::on_session_xrun(size_t overruns, size_t underruns)
{
    if (!running_) {
        return;
    }
    view_.show_warning("Audio dropouts: " + std::to_string(overruns) + " input overrun(s), "
        + std::to_string(underruns) + " output underrun(s)");
}

void ControlPanel::on_session_fatal_error(const std::string& message)
{
    // the error belongs to a session run that was stopped, or stopped and restarted, before it arrived
    if (!running_ || session_.is_running()) {
        return;
    }
    // the session already halted; make sure its thread is joined
    session_.stop();
    running_ = false;
    view_.clear_actual_delay();
    view_.set_running(false);
    view_.show_error("Audio device error: " + message);
}
