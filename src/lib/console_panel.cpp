#include "daf/console_panel.hpp"
#include "daf/defines.hpp"
#include "daf/errors.hpp"
#include <boost/bind/bind.hpp>
#include <csignal>
#include <sstream>
#include <unistd.h>

ConsolePanel::ConsolePanel(boost::asio::io_context& io_context, TunableAudioSession& session, AudioBackend& backend,
    int delay_ms, int gain_percent, std::ostream& out, std::ostream& err)
    : io_context_(io_context)
    , session_(session)
    , backend_(backend)
    , out_(out)
    , err_(err)
    , input_(io_context)
    , signals_(io_context)
    , panel_(session, *this, delay_ms, gain_percent)
{
}

ConsolePanel::~ConsolePanel()
{
    // joins the audio thread, nothing posts to us afterwards
    session_.stop();
}

void ConsolePanel::start_reading()
{
    print_help();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int /*signal_number*/) {
        if (!error) {
            panel_.on_quit();
        }
    });
    // a duplicate, so closing the descriptor leaves stdin alone
    input_.assign(::dup(STDIN_FILENO));
    reading_ = true;
    start_read();
}

void ConsolePanel::start_read()
{
    boost::asio::async_read_until(input_, boost::asio::dynamic_buffer(input_buffer_), "\n",
        boost::bind(&ConsolePanel::handle_read, this, boost::asio::placeholders::error, boost::asio::placeholders::bytes_transferred));
}

void ConsolePanel::handle_read(const boost::system::error_code& error, std::size_t bytes_transferred)
{
    if (!error) {
        std::string line(input_buffer_.substr(0, bytes_transferred - 1));
        input_buffer_.erase(0, bytes_transferred);
        handle_command(line);
        if (!closed_) {
            start_read();
        }
    } else if (error == boost::asio::error::eof) {
        panel_.on_quit();
    } else if (error != boost::asio::error::operation_aborted) {
        err_ << "Read error: " << error.message() << std::endl;
        panel_.on_quit();
    }
}

void ConsolePanel::handle_command(const std::string& line)
{
    std::istringstream words(line);
    std::string command;
    words >> command;
    if (command.empty()) {
        return;
    }

    if (command == "start") {
        panel_.on_start();
    } else if (command == "stop") {
        panel_.on_stop();
    } else if (command == "delay" || command == "gain") {
        int value;
        if (!(words >> value)) {
            err_ << "usage: " << command << (command == "delay" ? " <ms>" : " <percent>") << std::endl;
            return;
        }
        if (command == "delay") {
            panel_.on_delay_changed(value);
        } else {
            panel_.on_gain_changed(value);
        }
    } else if (command == "+") {
        panel_.on_delay_changed(panel_.delay_ms() + DELAY_STEP_MS);
    } else if (command == "-") {
        panel_.on_delay_changed(panel_.delay_ms() - DELAY_STEP_MS);
    } else if (command == "status") {
        print_status();
    } else if (command == "devices") {
        print_devices();
    } else if (command == "help") {
        print_help();
    } else if (command == "quit" || command == "exit" || command == "q") {
        panel_.on_quit();
    } else {
        err_ << "Unknown command: " << command << " (type help)" << std::endl;
    }
}

void ConsolePanel::print_help()
{
    out_ << "Commands:\n"
         << "  start            start delayed playback\n"
         << "  stop             stop playback\n"
         << "  delay <ms>       set delay (0-" << MAX_DELAY_MS << ")\n"
         << "  + / -            nudge delay by " << DELAY_STEP_MS << " ms\n"
         << "  gain <percent>   set volume (0-" << MAX_GAIN_PERCENT << ")\n"
         << "  status           show current settings\n"
         << "  devices          list audio devices\n"
         << "  quit             stop and exit" << std::endl;
}

void ConsolePanel::print_status()
{
    out_ << (panel_.running() ? "Running" : "Stopped")
         << ", delay " << delay_text_
         << ", volume " << gain_text_;
    if (!actual_delay_text_.empty()) {
        out_ << ", actual delay " << actual_delay_text_;
    }
    out_ << std::endl;
}

void ConsolePanel::print_devices()
{
    try {
        for (const auto& device : backend_.devices()) {
            out_ << (device.is_default_input || device.is_default_output ? "* " : "  ")
                 << device.index << ": " << device.name
                 << " [" << device.host_api << "] in " << device.max_input_channels
                 << " out " << device.max_output_channels
                 << " @ " << device.default_sample_rate << " Hz" << std::endl;
        }
    } catch (const DafException& e) {
        err_ << e.what() << std::endl;
    }
}

void ConsolePanel::show_delay(const std::string& text)
{
    delay_text_ = text;
    if (reading_) {
        out_ << "Delay: " << text << std::endl;
    }
}

void ConsolePanel::show_gain(const std::string& text)
{
    gain_text_ = text;
    if (reading_) {
        out_ << "Volume: " << text << std::endl;
    }
}

void ConsolePanel::show_actual_delay(const std::string& text)
{
    // printed once per start, later values are kept for `status`
    if (actual_delay_text_.empty()) {
        out_ << "Actual delay: " << text << std::endl;
    }
    actual_delay_text_ = text;
}

void ConsolePanel::clear_actual_delay()
{
    actual_delay_text_.clear();
}

void ConsolePanel::set_running(bool running)
{
    if (reading_) {
        out_ << (running ? "[running] type stop to pause" : "[stopped] type start to begin") << std::endl;
    }
}

void ConsolePanel::show_warning(const std::string& message)
{
    err_ << "Warning: " << message << std::endl;
}

void ConsolePanel::show_error(const std::string& message)
{
    err_ << "Error: " << message << std::endl;
}

void ConsolePanel::close()
{
    closed_ = true;
    if (reading_) {
        boost::system::error_code error;
        input_.cancel(error);
        if (error) {
            err_ << "Cancel error: " << error.message() << std::endl;
        }
        signals_.cancel(error);
        if (error) {
            err_ << "Cancel error: " << error.message() << std::endl;
        }
    }
    io_context_.stop();
}

void ConsolePanel::on_measured_delay(double delay_ms)
{
    boost::asio::post(io_context_, [this, delay_ms]() { panel_.on_session_measured_delay(delay_ms); });
}

void ConsolePanel::on_xrun(size_t overruns, size_t underruns)
{
    boost::asio::post(io_context_, [this, overruns, underruns]() { panel_.on_session_xrun(overruns, underruns); });
}

void ConsolePanel::on_fatal_error(const std::string& message)
{
    boost::asio::post(io_context_, [this, message]() { panel_.on_session_fatal_error(message); });
}
