#include <voxturn/config/runtime_config.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include <voxturn/core/errors.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace voxturn {

// ---------- helpers ----------
static fs::path self_dir() {
  char buf[4096];
  ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf)-1);
  if (n <= 0) return fs::current_path();
  buf[n] = '\0';
  return fs::path(buf).parent_path();
}

static std::string trim_copy(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static bool read_file_trimmed(const fs::path& p, std::string& out) {
  std::ifstream f(p);
  if (!f.good()) return false;
  std::string s((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  out = trim_copy(s);
  return !out.empty();
}

static std::string env_or(const char* key, const std::string& dflt) {
  const char* v = std::getenv(key);
  return (v && *v) ? std::string(v) : dflt;
}

static bool truthy(const std::string& v) {
  std::string s = v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
  return s == "1" || s == "true" || s == "yes" || s == "on";
}

static int to_int(const std::string& name, const std::string& value) {
  try {
    size_t pos = 0;
    int v = std::stoi(value, &pos);
    if (pos != value.size()) throw std::invalid_argument(value);
    return v;
  } catch (const std::exception&) {
    throw ConfigurationError(name + " expects a number, got '" + value + "'");
  }
}

// ---------- runtime.env ----------

const std::set<std::string>& runtimeEnvKeys() {
  // no ASSIST_ACCESS_TOKEN or COMMIT_REPORT_USER/PASSWORD: secrets stay out of the project tree
  static const std::set<std::string> keys = {
    "ASSIST_ENDPOINT", "ASSIST_TLS_VERIFY", "ASSIST_CA_FILE", "ASSIST_DEADLINE_SEC",
    "ASSIST_LANG", "ASSIST_DEVICE_MODEL_ID", "ASSIST_DEVICE_ID", "ASSIST_DEVICE_CONFIG",
    "AUDIO_INPUT_FILE", "AUDIO_OUTPUT_FILE", "AUDIO_SAMPLE_RATE", "AUDIO_ITER_SIZE",
    "MIC_MCAST_IP", "MIC_MCAST_PORT", "MIC_MCAST_IFACE",
    "SPEAKER_UDP_HOST", "SPEAKER_UDP_PORT",
    "ASSIST_DISPLAY", "ASSIST_DISPLAY_FILE", "ASSIST_DISPLAY_VIEWER",
    "DEVICE_ACTIONS_YAML", "TTS_COMMAND",
    "SENSOR_TEMPERATURE_FILE", "SENSOR_HUMIDITY_FILE", "SENSOR_PRESSURE_FILE",
    "SENSOR_LIGHT_FILE", "INDICATOR_LED_FILE",
    "COMMIT_REPORT_URL", "COMMIT_REPORT_SHEET_ID", "COMMIT_REPORT_TARGET", "COMMIT_REPORT_TLS_VERIFY",
    "VERBOSE"
  };
  return keys;
}

std::map<std::string, std::string> parseEnvFile(std::istream& in, const std::set<std::string>& allowed) {
  std::map<std::string, std::string> out;
  std::string line;
  while (std::getline(in, line)) {
    // strip comments (# or ;)
    auto hash = line.find('#'); if (hash != std::string::npos) line.erase(hash);
    auto semi = line.find(';'); if (semi != std::string::npos) line.erase(semi);
    line = trim_copy(line);
    if (line.empty()) continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim_copy(line.substr(0, eq));
    std::string val = trim_copy(line.substr(eq + 1));
    if (val.size() >= 2 && ((val.front()=='"' && val.back()=='"') || (val.front()=='\'' && val.back()=='\''))) {
      val = val.substr(1, val.size()-2);
    }
    if (allowed.count(key) == 0) continue;
    out[key] = val;
  }
  return out;
}

bool loadRuntimeEnv(const std::string& path, Logger& log) {
  if (path.empty()) return false;
  std::ifstream in(path);
  if (!in.good()) return false;
  for (const auto& kv : parseEnvFile(in, runtimeEnvKeys())) {
    // process env wins over runtime.env
    const char* cur = std::getenv(kv.first.c_str());
    if (!cur || !*cur) setenv(kv.first.c_str(), kv.second.c_str(), 1);
  }
  log.info("Config", "Loaded runtime env from " + path);
  return true;
}

std::string findProjectConfig(const std::string& file_name) {
  // locate config/<file> near the binary first, then in source tree
  const fs::path candidates[] = {
    self_dir().parent_path() / "config" / file_name,
    fs::path(PROJECT_SOURCE_DIR) / "config" / file_name,
    fs::current_path() / "config" / file_name,
  };
  for (const auto& p : candidates) {
    std::error_code ec;
    if (fs::exists(p, ec)) return p.string();
  }
  return "";
}

std::string userConfigDir() {
  fs::path cfgHome = std::getenv("XDG_CONFIG_HOME") && *std::getenv("XDG_CONFIG_HOME")
    ? fs::path(std::getenv("XDG_CONFIG_HOME"))
    : (fs::path(env_or("HOME", ".")) / ".config");
  return (cfgHome / "voxturn").string();
}

// ---------- RuntimeConfig ----------

RuntimeConfig RuntimeConfig::fromEnvironment() {
  RuntimeConfig c;
  c.endpoint        = env_or("ASSIST_ENDPOINT", c.endpoint);
  c.access_token    = env_or("ASSIST_ACCESS_TOKEN", "");
  c.tls_verify      = truthy(env_or("ASSIST_TLS_VERIFY", "1"));
  c.ca_file         = env_or("ASSIST_CA_FILE", "");
  c.deadline_sec    = to_int("ASSIST_DEADLINE_SEC", env_or("ASSIST_DEADLINE_SEC", std::to_string(c.deadline_sec)));

  c.language_code   = env_or("ASSIST_LANG", c.language_code);
  c.device_model_id = env_or("ASSIST_DEVICE_MODEL_ID", "");
  c.device_id       = env_or("ASSIST_DEVICE_ID", "");
  c.device_config   = env_or("ASSIST_DEVICE_CONFIG", (fs::path(userConfigDir()) / "device_config.json").string());

  c.input_audio_file  = env_or("AUDIO_INPUT_FILE", "");
  c.output_audio_file = env_or("AUDIO_OUTPUT_FILE", "");
  c.sample_rate     = to_int("AUDIO_SAMPLE_RATE", env_or("AUDIO_SAMPLE_RATE", std::to_string(c.sample_rate)));
  c.iter_size       = to_int("AUDIO_ITER_SIZE", env_or("AUDIO_ITER_SIZE", std::to_string(c.iter_size)));
  c.mic_mcast_ip    = env_or("MIC_MCAST_IP", c.mic_mcast_ip);
  c.mic_mcast_port  = to_int("MIC_MCAST_PORT", env_or("MIC_MCAST_PORT", std::to_string(c.mic_mcast_port)));
  c.mic_mcast_iface = env_or("MIC_MCAST_IFACE", c.mic_mcast_iface);
  c.speaker_host    = env_or("SPEAKER_UDP_HOST", c.speaker_host);
  c.speaker_port    = to_int("SPEAKER_UDP_PORT", env_or("SPEAKER_UDP_PORT", std::to_string(c.speaker_port)));

  c.display         = truthy(env_or("ASSIST_DISPLAY", "0"));
  c.display_file    = env_or("ASSIST_DISPLAY_FILE", c.display_file);
  c.display_viewer  = env_or("ASSIST_DISPLAY_VIEWER", c.display_viewer);

  c.device_actions_yaml = env_or("DEVICE_ACTIONS_YAML", findProjectConfig("device_actions.yaml"));
  c.tts_command         = env_or("TTS_COMMAND", "");
  c.sensor_temperature  = env_or("SENSOR_TEMPERATURE_FILE", "");
  c.sensor_humidity     = env_or("SENSOR_HUMIDITY_FILE", "");
  c.sensor_pressure     = env_or("SENSOR_PRESSURE_FILE", "");
  c.sensor_light        = env_or("SENSOR_LIGHT_FILE", "");
  c.indicator_led       = env_or("INDICATOR_LED_FILE", "");

  c.commit_report_url        = env_or("COMMIT_REPORT_URL", "");
  c.commit_report_sheet_id   = env_or("COMMIT_REPORT_SHEET_ID", "");
  c.commit_report_target     = env_or("COMMIT_REPORT_TARGET", c.commit_report_target);
  c.commit_report_user       = env_or("COMMIT_REPORT_USER", "");
  c.commit_report_password   = env_or("COMMIT_REPORT_PASSWORD", "");
  c.commit_report_tls_verify = truthy(env_or("COMMIT_REPORT_TLS_VERIFY", "1"));

  c.verbose = truthy(env_or("VERBOSE", "0"));
  return c;
}

void RuntimeConfig::applyCommandLine(const std::vector<std::string>& args) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= args.size()) throw ConfigurationError(a + " needs a value");
      return args[++i];
    };
    if (a == "--help" || a == "-h")          { help = true; }
    else if (a == "--endpoint")              { endpoint = value(); }
    else if (a == "--lang")                  { language_code = value(); }
    else if (a == "--device-model-id")       { device_model_id = value(); }
    else if (a == "--device-id")             { device_id = value(); }
    else if (a == "--device-config")         { device_config = value(); }
    else if (a == "--display")               { display = true; }
    else if (a == "--verbose" || a == "-v")  { verbose = true; }
    else if (a == "--input-audio-file" || a == "-i")  { input_audio_file = value(); }
    else if (a == "--output-audio-file" || a == "-o") { output_audio_file = value(); }
    else if (a == "--audio-sample-rate")     { sample_rate = to_int(a, value()); }
    else if (a == "--audio-iter-size")       { iter_size = to_int(a, value()); }
    else if (a == "--deadline")              { deadline_sec = to_int(a, value()); }
    else if (a == "--once")                  { once = true; }
    else throw ConfigurationError("unknown option " + a + " (see --help)");
  }
}

void RuntimeConfig::loadDeviceIdentity(Logger& log) {
  if (!device_id.empty() && !device_model_id.empty()) return;
  if (device_config.empty()) return;
  std::ifstream f(device_config);
  if (!f.good()) {
    log.debug("Config", "No device config at " + device_config);
    return;
  }
  json j;
  try {
    f >> j;
  } catch (const json::exception& e) {
    throw ConfigurationError("invalid device config " + device_config + ": " + e.what());
  }
  if (!j.is_object()) throw ConfigurationError("device config " + device_config + " must be a JSON object");
  if (device_id.empty() && j.contains("id") && j["id"].is_string()) {
    device_id = j["id"].get<std::string>();
  }
  if (device_model_id.empty() && j.contains("model_id") && j["model_id"].is_string()) {
    device_model_id = j["model_id"].get<std::string>();
  }
  log.info("Config", "Using device model " + device_model_id + " and device id " + device_id +
                     " from " + device_config);
}

void RuntimeConfig::loadAccessToken(Logger& log) {
  if (!access_token.empty()) return;
  fs::path keyPath = fs::path(userConfigDir()) / "access_token";
  std::string token;
  if (read_file_trimmed(keyPath, token)) {
    access_token = token;
    log.info("Config", "Loaded access token from " + keyPath.string());
  }
}

void RuntimeConfig::validate() const {
  if (endpoint.empty()) throw ConfigurationError("no assistant endpoint configured");
  if (endpoint.rfind("ws://", 0) != 0 && endpoint.rfind("wss://", 0) != 0) {
    throw ConfigurationError("endpoint must be a ws:// or wss:// URL: " + endpoint);
  }
  if (access_token.empty()) {
    throw ConfigurationError("no access token: set ASSIST_ACCESS_TOKEN or write " +
                             (fs::path(userConfigDir()) / "access_token").string());
  }
  if (device_model_id.empty()) throw ConfigurationError("device model id missing (--device-model-id or device config)");
  if (device_id.empty()) throw ConfigurationError("device id missing (--device-id or device config)");
  if (language_code.empty()) throw ConfigurationError("language code must not be empty");
  if (sample_rate <= 0) throw ConfigurationError("sample rate must be positive");
  if (iter_size <= 0 || iter_size % 2) throw ConfigurationError("audio iter size must be a positive even byte count");
  if (deadline_sec <= 0) throw ConfigurationError("deadline must be positive");
  if (!commit_report_url.empty() && commit_report_url.rfind("http://", 0) != 0 &&
      commit_report_url.rfind("https://", 0) != 0) {
    throw ConfigurationError("COMMIT_REPORT_URL must be an http:// or https:// URL: " + commit_report_url);
  }
}

TurnConfig RuntimeConfig::turnConfig() const {
  TurnConfig t;
  t.language_code = language_code;
  t.device_model_id = device_model_id;
  t.device_id = device_id;
  t.sample_rate = sample_rate;
  t.display_enabled = display;
  return t;
}

std::string RuntimeConfig::usage() {
  return
R"(Usage:
  voxturn_assistant [options]

Options:
  --endpoint <url>            Assistant WebSocket endpoint (ASSIST_ENDPOINT)
  --lang <code>               Language code, default en-US (ASSIST_LANG)
  --device-model-id <id>      Registered device model id
  --device-id <id>            Registered device instance id
  --device-config <path>      JSON with "id" and "model_id"
  --display                   Show screen_out HTML responses
  --verbose                   Debug logging
  --input-audio-file <wav>    Use a WAV file as the microphone (single turn)
  --output-audio-file <wav>   Write the response audio to a WAV file (single turn)
  --audio-sample-rate <hz>    Default 16000
  --audio-iter-size <bytes>   Bytes per request chunk, default 3200
  --deadline <sec>            Per-attempt deadline, default 185
  --once                      Stop after the first turn without follow-on
  --help                      Show this help and exit

Notes:
  - The access token is read from ASSIST_ACCESS_TOKEN or $XDG_CONFIG_HOME/voxturn/access_token.
  - config/runtime.env may preset any of the environment keys except the token.
  - COMMIT_REPORT_URL enables com.voxturn.commands.ReportCommitCount; its basic
    auth comes from COMMIT_REPORT_USER and COMMIT_REPORT_PASSWORD.
)";
}

} // namespace voxturn
