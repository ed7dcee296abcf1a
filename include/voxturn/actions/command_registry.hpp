#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <voxturn/actions/device_action_dispatcher.hpp>
#include <voxturn/core/context.hpp>
#include <voxturn/tts/text_to_speech.hpp>

namespace voxturn {

/**
 * A device command implemented by an external program, declared in YAML:
 *
 *   commands:
 *     - name: action.devices.commands.OnOff
 *       switch: on
 *       cases: { "true": ./bin/light_on, "false": ./bin/light_off }
 *     - name: com.example.commands.Play
 *       exec: aplay {file}
 *       say: Playing {file}
 *
 * {param} placeholders in exec/cases are replaced by the shell-quoted
 * parameter value; in say they are replaced verbatim.
 */
struct ExecCommand {
    std::string name;
    std::string exec;
    std::string switch_param;
    std::map<std::string, std::string> cases;
    std::string say;

    // Command line for one invocation. Throws std::runtime_error when the
    // switch value has no case.
    std::string commandLine(const nlohmann::json& params) const;
};

// Both throw ConfigurationError on unreadable or invalid YAML.
std::vector<ExecCommand> loadExecCommands(const std::string& yaml_path);
std::vector<ExecCommand> parseExecCommands(const std::string& yaml_text);

// Parameter value as text: strings unquoted, booleans "true"/"false",
// numbers and objects as JSON. Missing parameters render as "".
std::string paramToString(const nlohmann::json& params, const std::string& key);

std::string renderTemplate(const std::string& tmpl, const nlohmann::json& params, bool shell_quote);

// Registers every command as an executor handler. A non-zero exit status
// fails the PendingAction.
void registerExecCommands(DeviceActionDispatcher& dispatcher,
                          const std::vector<ExecCommand>& commands,
                          TextToSpeech& tts,
                          Context& ctx);

} // namespace voxturn
