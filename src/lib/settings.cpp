#include "daf/settings.hpp"
#include "daf/errors.hpp"
#include <algorithm>
#include <boost/program_options.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace po = boost::program_options;
namespace pt = boost::property_tree;

static std::optional<int> parse_device(const std::string& value)
{
    if (value.empty() || value == "default") {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        int index = std::stoi(value, &used);
        if (used != value.size()) {
            throw SettingsException("Invalid device index: " + value);
        }
        return index < 0 ? std::nullopt : std::optional<int>(index);
    } catch (const std::logic_error&) {
        throw SettingsException("Invalid device index: " + value);
    }
}

// Leaves value untouched when the key is absent, throws ptree_bad_data when it does not convert.
template <typename T>
static void read_value(const pt::ptree& tree, const std::string& path, T& value)
{
    if (auto child = tree.get_child_optional(path)) {
        value = child->get_value<T>();
    }
}

static std::string device_string(const std::optional<int>& device)
{
    return device.has_value() ? std::to_string(*device) : "default";
}

std::string default_settings_path()
{
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".";
    }
    return (base / "dafgen" / "settings.ini").string();
}

void validate_settings(Settings& settings)
{
    settings.delay_ms = std::min(std::max(settings.delay_ms, 0), MAX_DELAY_MS);
    settings.gain_percent = std::min(std::max(settings.gain_percent, 0), MAX_GAIN_PERCENT);
    if (!(settings.format.sample_rate > 0 && settings.format.sample_rate <= MAX_SAMPLE_RATE)) {
        throw SettingsException("Sample rate must be between 1 and " + std::to_string(MAX_SAMPLE_RATE) + " Hz");
    }
    if (settings.format.channels < 1 || settings.format.channels > 32) {
        throw SettingsException("Channel count must be between 1 and 32");
    }
    if (settings.format.frames_per_buffer == 0 || settings.format.frames_per_buffer > MAX_FRAMES_PER_BUFFER) {
        throw SettingsException("Frames per buffer must be between 1 and " + std::to_string(MAX_FRAMES_PER_BUFFER));
    }
}

Settings load_settings(const std::string& path)
{
    Settings settings;
    if (!std::filesystem::exists(path)) {
        return settings;
    }
    pt::ptree tree;
    try {
        pt::read_ini(path, tree);
        std::string input_device = "default";
        std::string output_device = "default";
        read_value(tree, "session.delay_ms", settings.delay_ms);
        read_value(tree, "session.gain_percent", settings.gain_percent);
        read_value(tree, "audio.input_device", input_device);
        read_value(tree, "audio.output_device", output_device);
        read_value(tree, "audio.sample_rate", settings.format.sample_rate);
        read_value(tree, "audio.channels", settings.format.channels);
        read_value(tree, "audio.frames_per_buffer", settings.format.frames_per_buffer);
        settings.input_device = parse_device(input_device);
        settings.output_device = parse_device(output_device);
    } catch (const pt::ptree_error& e) {
        throw SettingsException("Cannot read settings " + path + ": " + e.what());
    }
    validate_settings(settings);
    return settings;
}

void save_settings(const std::string& path, const Settings& settings)
{
    pt::ptree tree;
    tree.put("session.delay_ms", settings.delay_ms);
    tree.put("session.gain_percent", settings.gain_percent);
    tree.put("audio.input_device", device_string(settings.input_device));
    tree.put("audio.output_device", device_string(settings.output_device));
    tree.put("audio.sample_rate", settings.format.sample_rate);
    tree.put("audio.channels", settings.format.channels);
    tree.put("audio.frames_per_buffer", settings.format.frames_per_buffer);
    try {
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        pt::write_ini(path, tree);
    } catch (const std::filesystem::filesystem_error& e) {
        throw SettingsException("Cannot write settings " + path + ": " + e.what());
    } catch (const pt::ptree_error& e) {
        throw SettingsException("Cannot write settings " + path + ": " + e.what());
    }
}

CommandLine parse_command_line(int argc, const char* const argv[])
{
    CommandLine result;
    po::options_description options("Options");
    options.add_options()
        ("help,h", "print this help message")
        ("list-devices,l", "list audio devices and exit")
        ("config,c", po::value<std::string>(), "settings file")
        ("delay,d", po::value<int>(), "delay in milliseconds")
        ("gain,g", po::value<int>(), "volume in percent")
        ("input-device,i", po::value<std::string>(), "input device index or 'default'")
        ("output-device,o", po::value<std::string>(), "output device index or 'default'")
        ("sample-rate,r", po::value<double>(), "sample rate in Hz")
        ("channels", po::value<int>(), "channel count")
        ("frames", po::value<unsigned long>(), "frames per buffer")
        ("autostart,s", "start the delay loop immediately");

    std::ostringstream usage;
    usage << "usage: dafgen [options]\n" << options;
    result.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw SettingsException(e.what());
    }

    if (vm.count("help")) {
        result.action = LaunchAction::Help;
        return result;
    }
    if (vm.count("list-devices")) {
        result.action = LaunchAction::ListDevices;
    }
    result.autostart = vm.count("autostart") > 0;
    result.config_path = vm.count("config") ? vm["config"].as<std::string>() : default_settings_path();

    Settings& settings = result.settings;
    settings = load_settings(result.config_path);
    if (vm.count("delay")) {
        settings.delay_ms = vm["delay"].as<int>();
    }
    if (vm.count("gain")) {
        settings.gain_percent = vm["gain"].as<int>();
    }
    if (vm.count("input-device")) {
        settings.input_device = parse_device(vm["input-device"].as<std::string>());
    }
    if (vm.count("output-device")) {
        settings.output_device = parse_device(vm["output-device"].as<std::string>());
    }
    if (vm.count("sample-rate")) {
        settings.format.sample_rate = vm["sample-rate"].as<double>();
    }
    if (vm.count("channels")) {
        settings.format.channels = vm["channels"].as<int>();
    }
    if (vm.count("frames")) {
        settings.format.frames_per_buffer = vm["frames"].as<unsigned long>();
    }
    validate_settings(settings);
    return result;
}
