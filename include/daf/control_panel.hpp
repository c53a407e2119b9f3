#ifndef DAF_CONTROL_PANEL
#define DAF_CONTROL_PANEL
#include "tunable_session.hpp"
#include <string>

// Rendering side of the panel, implemented by the front-end.
class PanelView {
public:
    virtual ~PanelView() = default;

    virtual void show_delay(const std::string& text) = 0;
    virtual void show_gain(const std::string& text) = 0;
    virtual void show_actual_delay(const std::string& text) = 0;
    virtual void clear_actual_delay() = 0;
    // Running enables Stop and disables Start, Stopped the other way round.
    virtual void set_running(bool running) = 0;
    virtual void show_warning(const std::string& message) = 0;
    virtual void show_error(const std::string& message) = 0;
    virtual void close() = 0;
};

/*
 * Forwards user interaction to a TunableAudioSession and keeps the view in
 * sync with it. Every method runs on the UI thread; session events must be
 * marshalled there before calling the on_session_* methods.
 */
class ControlPanel {
public:
    ControlPanel(TunableAudioSession& session, PanelView& view, int delay_ms, int gain_percent);

    ControlPanel(const ControlPanel&) = delete;
    ControlPanel& operator=(const ControlPanel&) = delete;

    void on_start();
    void on_stop();
    void on_delay_changed(int delay_ms);
    void on_gain_changed(int gain_percent);
    void on_quit();

    void on_session_measured_delay(double delay_ms);
    void on_session_xrun(size_t overruns, size_t underruns);
    void on_session_fatal_error(const std::string& message);

    bool running() const { return running_; }
    int delay_ms() const { return delay_ms_; }
    int gain_percent() const { return gain_percent_; }

private:
    TunableAudioSession& session_;
    PanelView& view_;
    int delay_ms_;
    int gain_percent_;
    bool running_ = false;
};
#endif
