#ifndef DAF_SETTINGS
#define DAF_SETTINGS
#include "audio_backend.hpp"
#include "defines.hpp"
#include <optional>
#include <string>

struct Settings {
    int delay_ms = DEFAULT_DELAY_MS;
    int gain_percent = DEFAULT_GAIN_PERCENT;
    std::optional<int> input_device;
    std::optional<int> output_device;
    StreamFormat format;
};

enum class LaunchAction {
    Run,
    ListDevices,
    Help,
};

struct CommandLine {
    Settings settings;
    LaunchAction action = LaunchAction::Run;
    bool autostart = false;
    std::string config_path;
    std::string usage;
};

// $XDG_CONFIG_HOME/dafgen/settings.ini, falling back to ~/.config
std::string default_settings_path();

// A missing file yields defaults. Throws SettingsException on malformed content.
Settings load_settings(const std::string& path);
void save_settings(const std::string& path, const Settings& settings);

// Clamps delay and gain into range, throws SettingsException on an unusable stream format.
void validate_settings(Settings& settings);

// Loads the settings file named by --config (or the default one) and applies the command line on top.
CommandLine parse_command_line(int argc, const char* const argv[]);
#endif
