#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <voxturn/actions/action_executor.hpp>
#include <voxturn/actions/pending_action.hpp>
#include <voxturn/core/context.hpp>

namespace voxturn {

struct DeviceCommand {
    std::string name;          // e.g. "action.devices.commands.OnOff"
    nlohmann::json params = nlohmann::json::object();
};

/**
 * Maps device command names to local handlers.
 *
 * Populated once at startup, read-only while turns run. Unknown commands,
 * commands addressed to another device and malformed payloads are logged and
 * skipped; a failing handler never aborts the turn that dispatched it.
 */
class DeviceActionDispatcher {
public:
    // Runs on the ActionExecutor; one PendingAction per dispatch.
    using Handler = std::function<void(const nlohmann::json& params)>;
    // Runs on the dispatching thread and returns its own pending work.
    using InlineHandler = std::function<std::vector<PendingAction>(const nlohmann::json& params)>;

    DeviceActionDispatcher(Context& ctx, std::string device_id, ActionExecutor& executor);

    DeviceActionDispatcher& registerCommand(const std::string& name, Handler handler);
    DeviceActionDispatcher& registerInlineCommand(const std::string& name, InlineHandler handler);

    bool hasCommand(const std::string& name) const;
    std::vector<std::string> commandNames() const;

    std::vector<PendingAction> handle(const DeviceCommand& command);

    // Decodes a device_request_json payload and dispatches every execution
    // addressed to this device.
    std::vector<PendingAction> handleRequest(const std::string& device_request_json);

    // Throws MalformedDeviceAction when the envelope is unusable.
    static std::vector<DeviceCommand> parseRequest(const std::string& device_request_json,
                                                   const std::string& device_id,
                                                   Logger* log = nullptr);

    const std::string& deviceId() const { return device_id_; }

private:
    struct Entry {
        Handler handler;
        InlineHandler inline_handler;
    };

    Context& ctx_;
    std::string device_id_;
    ActionExecutor& executor_;
    std::map<std::string, Entry> handlers_;
};

} // namespace voxturn
