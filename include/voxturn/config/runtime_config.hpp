#pragma once

#include <chrono>
#include <istream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <voxturn/core/context.hpp>
#include <voxturn/core/messages.hpp>

namespace voxturn {

/**
 * Everything the assistant binary needs before its first turn.
 *
 * Precedence: command line > process environment > config/runtime.env >
 * built-in defaults. The access token is never read from the project env
 * file, only from ASSIST_ACCESS_TOKEN or $XDG_CONFIG_HOME/voxturn/access_token.
 */
struct RuntimeConfig {
    // service
    std::string endpoint = "wss://localhost:8443/v1/assist";
    std::string access_token;
    bool tls_verify = true;
    std::string ca_file;
    int deadline_sec = 185;

    // identity / dialog
    std::string language_code = "en-US";
    std::string device_model_id;
    std::string device_id;
    std::string device_config;          // device_config.json {"id", "model_id"}

    // audio
    std::string input_audio_file;
    std::string output_audio_file;
    int sample_rate = 16000;
    int iter_size = 3200;               // bytes per request chunk (100 ms at 16 kHz)
    std::string mic_mcast_ip = "239.168.123.161";
    int mic_mcast_port = 5555;
    std::string mic_mcast_iface = "eth0";
    std::string speaker_host = "127.0.0.1";
    int speaker_port = 5556;

    // display
    bool display = false;
    std::string display_file = "/tmp/voxturn_screen.html";
    std::string display_viewer = "xdg-open";

    // device actions
    std::string device_actions_yaml;
    std::string tts_command;
    std::string sensor_temperature;
    std::string sensor_humidity;
    std::string sensor_pressure;
    std::string sensor_light;
    std::string indicator_led;

    // commit count report; the command is only registered with a URL.
    // Credentials come from the process environment only.
    std::string commit_report_url;
    std::string commit_report_sheet_id;
    std::string commit_report_target = "github.com";
    std::string commit_report_user;
    std::string commit_report_password;
    bool commit_report_tls_verify = true;

    bool verbose = false;
    bool once = false;
    bool help = false;

    // Reads the process environment (after loadRuntimeEnv) over the defaults.
    static RuntimeConfig fromEnvironment();

    // Throws ConfigurationError on an unknown flag, a missing value or a bad number.
    void applyCommandLine(const std::vector<std::string>& args);

    // Fills device_id / device_model_id still empty from device_config.
    void loadDeviceIdentity(Logger& log);

    void loadAccessToken(Logger& log);

    // Throws ConfigurationError describing the first problem found.
    void validate() const;

    TurnConfig turnConfig() const;
    std::chrono::seconds deadline() const { return std::chrono::seconds(deadline_sec); }
    bool singleTurn() const { return !input_audio_file.empty() || !output_audio_file.empty(); }

    static std::string usage();
};

// Keys config/runtime.env may set.
const std::set<std::string>& runtimeEnvKeys();

// KEY=VALUE lines; '#' and ';' start comments, values may be quoted.
// Keys outside `allowed` are dropped.
std::map<std::string, std::string> parseEnvFile(std::istream& in, const std::set<std::string>& allowed);

// Applies a runtime.env file to the process environment without overriding
// variables that are already set. Returns false when the file is missing.
bool loadRuntimeEnv(const std::string& path, Logger& log);

// config/<file_name> next to the binary, in the source tree or in the cwd.
// Empty when none exists.
std::string findProjectConfig(const std::string& file_name);

// $XDG_CONFIG_HOME/voxturn, falling back to ~/.config/voxturn.
std::string userConfigDir();

} // namespace voxturn
