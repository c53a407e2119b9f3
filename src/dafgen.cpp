#include "daf/audio_session.hpp"
#include "daf/console_panel.hpp"
#include "daf/errors.hpp"
#include "daf/portaudio_backend.hpp"
#include "daf/settings.hpp"
#include <boost/asio.hpp>
#include <iostream>

static void list_devices(AudioBackend& backend)
{
    for (const auto& device : backend.devices()) {
        std::cout << device.index << ": " << device.name << " [" << device.host_api << "]"
                  << (device.is_default_input ? " (default input)" : "")
                  << (device.is_default_output ? " (default output)" : "")
                  << " in " << device.max_input_channels << " out " << device.max_output_channels
                  << " @ " << device.default_sample_rate << " Hz" << std::endl;
    }
}

int main(int argc, char* argv[])
{
    CommandLine command_line;
    try {
        command_line = parse_command_line(argc, argv);
    } catch (const SettingsException& e) {
        std::cerr << "dafgen: " << e.what() << std::endl;
        return 1;
    }
    if (command_line.action == LaunchAction::Help) {
        std::cout << command_line.usage;
        return 0;
    }

    Settings& settings = command_line.settings;
    try {
        PortAudioBackend backend;
        if (command_line.action == LaunchAction::ListDevices) {
            list_devices(backend);
            return 0;
        }

        AudioSession session(backend, settings.format, settings.input_device, settings.output_device);
        boost::asio::io_context io_context;
        ConsolePanel console(io_context, session, backend, settings.delay_ms, settings.gain_percent);
        session.set_events(&console);
        console.start_reading();
        if (command_line.autostart) {
            console.panel().on_start();
        }
        io_context.run();

        settings.delay_ms = console.panel().delay_ms();
        settings.gain_percent = console.panel().gain_percent();
    } catch (const DafException& e) {
        std::cerr << "dafgen: " << e.what() << std::endl;
        return 1;
    } catch (const boost::system::system_error& e) {
        std::cerr << "dafgen: " << e.what() << std::endl;
        return 1;
    }

    try {
        save_settings(command_line.config_path, settings);
    } catch (const SettingsException& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
    }
    return 0;
}
