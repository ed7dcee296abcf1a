#include <voxturn/actions/command_registry.hpp>

#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include <voxturn/core/errors.hpp>
#include <voxturn/core/shell.hpp>

namespace voxturn {

using json = nlohmann::json;

static std::vector<ExecCommand> commandsFromNode(const YAML::Node& root, const std::string& origin) {
  std::vector<ExecCommand> out;
  if (!root || root.IsNull()) return out;
  const YAML::Node list = root["commands"];
  if (!list) return out;
  if (!list.IsSequence()) throw ConfigurationError(origin + ": 'commands' must be a list");

  for (const auto& node : list) {
    ExecCommand c;
    if (!node["name"]) throw ConfigurationError(origin + ": command without a name");
    c.name = node["name"].as<std::string>();
    if (node["exec"]) c.exec = node["exec"].as<std::string>();
    if (node["switch"]) c.switch_param = node["switch"].as<std::string>();
    if (node["cases"]) {
      if (!node["cases"].IsMap()) throw ConfigurationError(origin + ": cases of " + c.name + " must be a map");
      for (const auto& kv : node["cases"]) {
        c.cases[kv.first.as<std::string>()] = kv.second.as<std::string>();
      }
    }
    if (node["say"]) c.say = node["say"].as<std::string>();

    if (c.exec.empty() && c.switch_param.empty()) {
      throw ConfigurationError(origin + ": " + c.name + " needs either exec or switch/cases");
    }
    if (!c.switch_param.empty() && c.cases.empty()) {
      throw ConfigurationError(origin + ": " + c.name + " has a switch but no cases");
    }
    out.push_back(std::move(c));
  }
  return out;
}

std::vector<ExecCommand> loadExecCommands(const std::string& yaml_path) {
  try {
    return commandsFromNode(YAML::LoadFile(yaml_path), yaml_path);
  } catch (const YAML::Exception& e) {
    throw ConfigurationError("Error loading device actions YAML " + yaml_path + ": " + e.what());
  }
}

std::vector<ExecCommand> parseExecCommands(const std::string& yaml_text) {
  try {
    return commandsFromNode(YAML::Load(yaml_text), "<inline>");
  } catch (const YAML::Exception& e) {
    throw ConfigurationError(std::string("Error parsing device actions YAML: ") + e.what());
  }
}

std::string paramToString(const json& params, const std::string& key) {
  if (!params.is_object()) return "";
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) return "";
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

std::string renderTemplate(const std::string& tmpl, const json& params, bool shell_quote) {
  std::string out;
  size_t i = 0;
  while (i < tmpl.size()) {
    size_t open = tmpl.find('{', i);
    if (open == std::string::npos) { out.append(tmpl, i, std::string::npos); break; }
    size_t close = tmpl.find('}', open + 1);
    if (close == std::string::npos) { out.append(tmpl, i, std::string::npos); break; }
    out.append(tmpl, i, open - i);
    std::string value = paramToString(params, tmpl.substr(open + 1, close - open - 1));
    out += shell_quote ? shellQuote(value) : value;
    i = close + 1;
  }
  return out;
}

std::string ExecCommand::commandLine(const json& params) const {
  if (switch_param.empty()) return renderTemplate(exec, params, true);
  std::string key = paramToString(params, switch_param);
  auto it = cases.find(key);
  if (it == cases.end()) {
    throw std::runtime_error(name + ": no case for " + switch_param + "=" + (key.empty() ? "<missing>" : key));
  }
  return renderTemplate(it->second, params, true);
}

void registerExecCommands(DeviceActionDispatcher& dispatcher,
                          const std::vector<ExecCommand>& commands,
                          TextToSpeech& tts,
                          Context& ctx) {
  for (const auto& c : commands) {
    if (dispatcher.hasCommand(c.name)) {
      ctx.log().info("Actions", "YAML overrides built-in " + c.name);
    }
    dispatcher.registerCommand(c.name, [c, &tts, &ctx](const json& params) {
      std::string line = c.commandLine(params);
      ctx.log().info("Action", "Running " + line);
      int ret = runShell(line);
      if (ret != 0) throw std::runtime_error(c.name + ": '" + line + "' exited with code " + std::to_string(ret));
      if (!c.say.empty()) tts.say(renderTemplate(c.say, params, false));
    });
  }
  ctx.log().info("Actions", "Registered " + std::to_string(commands.size()) + " program command(s)");
}

} // namespace voxturn
