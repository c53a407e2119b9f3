#define BOOST_TEST_MODULE ControlPanelTest
#include <boost/test/included/unit_test.hpp>
#include "daf/console_panel.hpp"
#include "daf/control_panel.hpp"
#include "daf/errors.hpp"
#include "fake_audio_backend.hpp"
#include <sstream>

namespace {
class FakeSession : public TunableAudioSession {
public:
    void start(int delay_ms, float gain) override
    {
        calls.push_back("start " + std::to_string(delay_ms));
        if (fail_with_missing_device) {
            throw DeviceUnavailableException("No default input device");
        }
        if (fail_with_open_error) {
            throw StreamOpenException("PortAudio open stream error: Invalid sample rate");
        }
        last_delay = delay_ms;
        last_gain = gain;
        running = true;
    }
    void set_delay(int delay_ms) override
    {
        calls.push_back("set_delay " + std::to_string(delay_ms));
        last_delay = delay_ms;
    }
    void set_gain(float gain) override
    {
        calls.push_back("set_gain");
        last_gain = gain;
    }
    void stop() override
    {
        calls.push_back("stop");
        running = false;
    }
    bool is_running() const override { return running; }

    std::vector<std::string> calls;
    bool fail_with_missing_device = false;
    bool fail_with_open_error = false;
    bool running = false;
    int last_delay = -1;
    float last_gain = -1;
};

class RecordingView : public PanelView {
public:
    void show_delay(const std::string& text) override { delay = text; }
    void show_gain(const std::string& text) override { gain = text; }
    void show_actual_delay(const std::string& text) override { actual_delay = text; }
    void clear_actual_delay() override { actual_delay.clear(); }
    void set_running(bool value) override { running = value; }
    void show_warning(const std::string& message) override { warnings.push_back(message); }
    void show_error(const std::string& message) override { errors.push_back(message); }
    void close() override { closed = true; }

    std::string delay;
    std::string gain;
    std::string actual_delay;
    bool running = true;
    bool closed = false;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};
}

BOOST_AUTO_TEST_CASE(test_initial_view) {
    FakeSession session;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    BOOST_CHECK_EQUAL(view.delay, "200 ms");
    BOOST_CHECK_EQUAL(view.gain, "100 %");
    BOOST_CHECK(!view.running);
    BOOST_CHECK(session.calls.empty());
}

BOOST_AUTO_TEST_CASE(test_start_forwards_parameters) {
    FakeSession session;
    RecordingView view;
    ControlPanel panel(session, view, 150, 80);

    panel.on_start();
    BOOST_CHECK(panel.running());
    BOOST_CHECK(view.running);
    BOOST_CHECK_EQUAL(session.last_delay, 150);
    BOOST_CHECK_CLOSE(session.last_gain, 0.8f, 1e-4);

    // a second start is ignored while running
    panel.on_start();
    BOOST_CHECK_EQUAL(session.calls.size(), 1);
}

BOOST_AUTO_TEST_CASE(test_missing_device_shows_message) {
    FakeSession session;
    session.fail_with_missing_device = true;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    panel.on_start();
    BOOST_CHECK(!panel.running());
    BOOST_CHECK(!view.running);
    BOOST_REQUIRE_EQUAL(view.errors.size(), 1);
    BOOST_CHECK_EQUAL(view.errors[0], "No input/output device found! Connect and rerun.");
}

BOOST_AUTO_TEST_CASE(test_open_failure_shows_reason) {
    FakeSession session;
    session.fail_with_open_error = true;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    panel.on_start();
    BOOST_CHECK(!panel.running());
    BOOST_REQUIRE_EQUAL(view.errors.size(), 1);
    BOOST_CHECK_EQUAL(view.errors[0], "PortAudio open stream error: Invalid sample rate");
}

BOOST_AUTO_TEST_CASE(test_delay_and_gain_changes_are_clamped_and_forwarded) {
    FakeSession session;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    panel.on_delay_changed(5000);
    BOOST_CHECK_EQUAL(view.delay, std::to_string(MAX_DELAY_MS) + " ms");
    BOOST_CHECK_EQUAL(session.last_delay, MAX_DELAY_MS);
    panel.on_delay_changed(-20);
    BOOST_CHECK_EQUAL(view.delay, "0 ms");
    BOOST_CHECK_EQUAL(session.last_delay, 0);

    panel.on_gain_changed(50);
    BOOST_CHECK_EQUAL(view.gain, "50 %");
    BOOST_CHECK_CLOSE(session.last_gain, 0.5f, 1e-4);
    panel.on_gain_changed(900);
    BOOST_CHECK_EQUAL(panel.gain_percent(), MAX_GAIN_PERCENT);
}

BOOST_AUTO_TEST_CASE(test_stop_clears_actual_delay) {
    FakeSession session;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    panel.on_start();
    panel.on_session_measured_delay(199.7);
    BOOST_CHECK_EQUAL(view.actual_delay, "199 ms");
    panel.on_stop();
    BOOST_CHECK(!view.running);
    BOOST_CHECK(view.actual_delay.empty());
    BOOST_CHECK_EQUAL(session.calls.back(), "stop");

    // late measurements from the stopped session are dropped
    panel.on_session_measured_delay(201.0);
    BOOST_CHECK(view.actual_delay.empty());
}

BOOST_AUTO_TEST_CASE(test_fatal_error_transitions_to_stopped) {
    FakeSession session;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    panel.on_start();
    panel.on_session_xrun(2, 0);
    BOOST_CHECK_EQUAL(view.warnings.size(), 1);
    // the session halts itself before reporting
    session.running = false;
    panel.on_session_fatal_error("device unplugged");
    BOOST_CHECK(!panel.running());
    BOOST_CHECK(!view.running);
    BOOST_REQUIRE_EQUAL(view.errors.size(), 1);
    BOOST_CHECK_EQUAL(view.errors[0], "Audio device error: device unplugged");
    BOOST_CHECK_EQUAL(session.calls.back(), "stop");
}

BOOST_AUTO_TEST_CASE(test_late_fatal_error_does_not_stop_new_run) {
    FakeSession session;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    panel.on_start();
    panel.on_stop();
    // error from the run that was just stopped, delivered while stopped
    panel.on_session_fatal_error("device unplugged");
    BOOST_CHECK(!panel.running());
    BOOST_CHECK(view.errors.empty());
    BOOST_CHECK_EQUAL(session.calls.size(), 2);

    panel.on_start();
    BOOST_REQUIRE(session.running);
    // same error delivered only after the restart
    panel.on_session_fatal_error("device unplugged");
    BOOST_CHECK(panel.running());
    BOOST_CHECK(view.running);
    BOOST_CHECK(session.running);
    BOOST_CHECK(view.errors.empty());
    BOOST_CHECK_EQUAL(session.calls.back(), "start 200");
}

BOOST_AUTO_TEST_CASE(test_quit_stops_and_closes) {
    FakeSession session;
    RecordingView view;
    ControlPanel panel(session, view, 200, 100);

    panel.on_start();
    panel.on_quit();
    BOOST_CHECK(!session.running);
    BOOST_CHECK(view.closed);
}

BOOST_AUTO_TEST_CASE(test_console_commands) {
    boost::asio::io_context io_context;
    FakeSession session;
    FakeAudioBackend backend;
    std::ostringstream out;
    std::ostringstream err;
    ConsolePanel console(io_context, session, backend, 200, 100, out, err);

    console.handle_command("delay 300");
    BOOST_CHECK_EQUAL(session.last_delay, 300);
    console.handle_command("+");
    BOOST_CHECK_EQUAL(session.last_delay, 300 + DELAY_STEP_MS);
    console.handle_command("-");
    console.handle_command("-");
    BOOST_CHECK_EQUAL(session.last_delay, 300 - DELAY_STEP_MS);
    console.handle_command("gain 40");
    BOOST_CHECK_CLOSE(session.last_gain, 0.4f, 1e-4);
    console.handle_command("start");
    BOOST_CHECK(console.panel().running());

    console.handle_command("status");
    BOOST_CHECK(out.str().find("Running, delay 290 ms, volume 40 %") != std::string::npos);
    console.handle_command("devices");
    BOOST_CHECK(out.str().find("fake microphone") != std::string::npos);

    console.handle_command("delay");
    BOOST_CHECK(err.str().find("usage: delay <ms>") != std::string::npos);
    console.handle_command("bogus");
    BOOST_CHECK(err.str().find("Unknown command: bogus") != std::string::npos);
    console.handle_command("   ");

    console.handle_command("quit");
    BOOST_CHECK(console.closed());
    BOOST_CHECK(!session.running);
}

BOOST_AUTO_TEST_CASE(test_console_marshals_session_events) {
    boost::asio::io_context io_context;
    FakeSession session;
    FakeAudioBackend backend;
    std::ostringstream out;
    std::ostringstream err;
    ConsolePanel console(io_context, session, backend, 200, 100, out, err);

    console.handle_command("start");
    std::thread audio_thread([&console, &session] {
        console.on_measured_delay(200.4);
        session.running = false;
        console.on_fatal_error("device unplugged");
    });
    audio_thread.join();
    BOOST_CHECK(console.panel().running());

    io_context.run();
    BOOST_CHECK(out.str().find("Actual delay: 200 ms") != std::string::npos);
    BOOST_CHECK(!console.panel().running());
    BOOST_CHECK(err.str().find("Error: Audio device error: device unplugged") != std::string::npos);
}
