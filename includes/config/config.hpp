#pragma once
#include <optional>
#include <string>

namespace voxcall {

// Values read from the config file; unset keys stay disengaged.
struct FileConfig {
    std::optional<std::string> server_url;     // server_url
    std::optional<std::string> api_url;        // api_url
    std::optional<int> input_device;           // input_device
    std::optional<int> output_device;          // output_device
    std::optional<int> sample_rate;            // sample_rate
    std::optional<int> frame_ms;               // frame_ms
    std::optional<std::string> db_path;        // db_path
    std::optional<bool> journal;               // journal
    std::optional<bool> verbose;               // verbose
};

// Effective settings after file, environment and command line are merged.
struct AppConfig {
    std::string server_url = "ws://localhost:8000/call";
    std::string api_url = "http://localhost:8000";
    std::optional<int> input_device;
    std::optional<int> output_device;
    int sample_rate = 16000;
    int frame_ms = 250;
    std::string db_path;
    bool journal = true;
    bool verbose = false;
};

// Returns $XDG_CONFIG_HOME/voxcall/voxcall.toml or ~/.config/voxcall/voxcall.toml
std::string default_config_path();

// Returns $XDG_DATA_HOME/voxcall/voxcall.db or ~/.local/share/voxcall/voxcall.db
std::string default_db_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty FileConfig (all optionals disengaged).
FileConfig load_config_file(const std::string& path);

// Layers file values over the defaults.
void apply_file_config(AppConfig& cfg, const FileConfig& file);

// VOXCALL_WS_URL and VOXCALL_API_URL, when set and non-empty.
void apply_environment(AppConfig& cfg);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

} // namespace voxcall
