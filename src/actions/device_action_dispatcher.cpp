#include <voxturn/actions/device_action_dispatcher.hpp>

#include <voxturn/core/errors.hpp>

using json = nlohmann::json;

namespace voxturn {

static const char* kExecuteIntent = "action.devices.EXECUTE";

DeviceActionDispatcher::DeviceActionDispatcher(Context& ctx, std::string device_id, ActionExecutor& executor)
: ctx_(ctx), device_id_(std::move(device_id)), executor_(executor) {}

DeviceActionDispatcher& DeviceActionDispatcher::registerCommand(const std::string& name, Handler handler) {
  Entry e; e.handler = std::move(handler);
  handlers_[name] = std::move(e);
  return *this;
}

DeviceActionDispatcher& DeviceActionDispatcher::registerInlineCommand(const std::string& name, InlineHandler handler) {
  Entry e; e.inline_handler = std::move(handler);
  handlers_[name] = std::move(e);
  return *this;
}

bool DeviceActionDispatcher::hasCommand(const std::string& name) const {
  return handlers_.count(name) != 0;
}

std::vector<std::string> DeviceActionDispatcher::commandNames() const {
  std::vector<std::string> out;
  for (const auto& kv : handlers_) out.push_back(kv.first);
  return out;
}

std::vector<PendingAction> DeviceActionDispatcher::handle(const DeviceCommand& command) {
  auto it = handlers_.find(command.name);
  if (it == handlers_.end()) {
    ctx_.log().warn("Device", "Ignoring unknown command: " + command.name);
    return {};
  }
  ctx_.counters().device_actions++;
  ctx_.log().info("Device", "Do command " + command.name + " with params " + command.params.dump());

  const Entry& entry = it->second;
  if (entry.inline_handler) {
    try {
      return entry.inline_handler(command.params);
    } catch (const std::exception& e) {
      ctx_.counters().failed_actions++;
      ctx_.log().error("Device", command.name + " failed: " + e.what());
      return {};
    } catch (...) {
      ctx_.counters().failed_actions++;
      ctx_.log().error("Device", command.name + " failed: unknown exception");
      return {};
    }
  }

  Handler handler = entry.handler;
  json params = command.params;
  try {
    return { executor_.submit(command.name, [handler, params]() { handler(params); }) };
  } catch (const std::exception& e) {
    ctx_.counters().failed_actions++;
    ctx_.log().error("Device", "could not schedule " + command.name + ": " + e.what());
    return {};
  }
}

std::vector<PendingAction> DeviceActionDispatcher::handleRequest(const std::string& device_request_json) {
  std::vector<DeviceCommand> commands;
  try {
    commands = parseRequest(device_request_json, device_id_, &ctx_.log());
  } catch (const MalformedDeviceAction& e) {
    ctx_.counters().malformed_actions++;
    ctx_.log().warn("Device", std::string("Skipping malformed device action: ") + e.what());
    return {};
  }

  std::vector<PendingAction> pending;
  for (const auto& c : commands) {
    auto fs = handle(c);
    pending.insert(pending.end(), fs.begin(), fs.end());
  }
  return pending;
}

static bool addressed_to(const json& command, const std::string& device_id, Logger* log) {
  if (!command.contains("devices")) return true; // no device list: ours
  const json& devices = command["devices"];
  if (!devices.is_array()) return false;
  bool ours = false;
  for (const auto& d : devices) {
    if (!d.is_object() || !d.contains("id") || !d["id"].is_string()) continue;
    const std::string id = d["id"].get<std::string>();
    if (id == device_id) ours = true;
    else if (log) log->warn("Device", "Ignoring command for unknown device: " + id);
  }
  return ours;
}

std::vector<DeviceCommand> DeviceActionDispatcher::parseRequest(const std::string& device_request_json,
                                                                const std::string& device_id,
                                                                Logger* log) {
  json request;
  try {
    request = json::parse(device_request_json);
  } catch (const json::parse_error& e) {
    throw MalformedDeviceAction(std::string("invalid JSON: ") + e.what());
  }
  if (!request.is_object()) throw MalformedDeviceAction("device request is not an object");
  if (!request.contains("inputs") || !request["inputs"].is_array()) {
    throw MalformedDeviceAction("device request has no inputs");
  }
  if (log && request.contains("requestId") && request["requestId"].is_string()) {
    log->debug("Device", "requestId=" + request["requestId"].get<std::string>());
  }

  std::vector<DeviceCommand> out;
  for (const auto& input : request["inputs"]) {
    if (!input.is_object()) continue;
    if (!input.contains("intent") || !input["intent"].is_string() ||
        input["intent"].get<std::string>() != kExecuteIntent) {
      if (log) log->debug("Device", "Skipping non-EXECUTE input");
      continue;
    }
    if (!input.contains("payload") || !input["payload"].is_object() ||
        !input["payload"].contains("commands") || !input["payload"]["commands"].is_array()) {
      throw MalformedDeviceAction("EXECUTE input without payload.commands");
    }
    for (const auto& command : input["payload"]["commands"]) {
      if (!command.is_object() || !addressed_to(command, device_id, log)) continue;
      if (!command.contains("execution") || !command["execution"].is_array()) {
        if (log) log->warn("Device", "Command without execution list, skipping");
        continue;
      }
      for (const auto& ex : command["execution"]) {
        if (!ex.is_object() || !ex.contains("command") || !ex["command"].is_string()) {
          if (log) log->warn("Device", "Execution without a command name, skipping");
          continue;
        }
        DeviceCommand dc;
        dc.name = ex["command"].get<std::string>();
        if (ex.contains("params") && ex["params"].is_object()) dc.params = ex["params"];
        out.push_back(std::move(dc));
      }
    }
  }
  return out;
}

} // namespace voxturn
