#ifndef DAF_CONSOLE_PANEL
#define DAF_CONSOLE_PANEL
#include "audio_backend.hpp"
#include "control_panel.hpp"
#include <boost/asio.hpp>
#include <iostream>
#include <ostream>
#include <string>

/*
 * Terminal front-end. Commands arrive on stdin through the io_context, audio
 * thread events are posted onto the same io_context, so the ControlPanel is
 * only ever touched from the thread running io_context.run().
 */
class ConsolePanel : public PanelView, public SessionEvents {
public:
    ConsolePanel(boost::asio::io_context& io_context, TunableAudioSession& session, AudioBackend& backend,
        int delay_ms, int gain_percent, std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~ConsolePanel() override;

    // Starts reading stdin and watching SIGINT/SIGTERM.
    void start_reading();
    void handle_command(const std::string& line);

    ControlPanel& panel() { return panel_; }
    bool closed() const { return closed_; }

    // PanelView
    void show_delay(const std::string& text) override;
    void show_gain(const std::string& text) override;
    void show_actual_delay(const std::string& text) override;
    void clear_actual_delay() override;
    void set_running(bool running) override;
    void show_warning(const std::string& message) override;
    void show_error(const std::string& message) override;
    void close() override;

    // SessionEvents, called from the audio thread
    void on_measured_delay(double delay_ms) override;
    void on_xrun(size_t overruns, size_t underruns) override;
    void on_fatal_error(const std::string& message) override;

private:
    void start_read();
    void handle_read(const boost::system::error_code& error, std::size_t bytes_transferred);
    void print_help();
    void print_status();
    void print_devices();

    boost::asio::io_context& io_context_;
    TunableAudioSession& session_;
    AudioBackend& backend_;
    std::ostream& out_;
    std::ostream& err_;
    boost::asio::posix::stream_descriptor input_;
    boost::asio::signal_set signals_;
    std::string input_buffer_;
    std::string delay_text_;
    std::string gain_text_;
    std::string actual_delay_text_;
    bool reading_ = false;
    bool closed_ = false;
    ControlPanel panel_;
};
#endif
