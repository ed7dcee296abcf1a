#include <voxturn/actions/builtin_commands.hpp>

#include <cstdio>
#include <thread>

using json = nlohmann::json;

namespace voxturn {

static std::string fmt2(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

static bool flag(const json& params, const char* key) {
  auto it = params.find(key);
  return it != params.end() && it->is_boolean() && it->get<bool>();
}

static std::string number(const json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || !it->is_number()) return "?";
  if (it->is_number_integer()) return std::to_string(it->get<long long>());
  return fmt2(it->get<double>());
}

void registerBuiltinCommands(DeviceActionDispatcher& dispatcher,
                             DeviceHardware& hardware,
                             TextToSpeech& tts,
                             Context& ctx,
                             BuiltinOptions opts) {
  const std::string std_ns = "action.devices.commands.";
  const std::string own_ns = "com.voxturn.commands.";

  dispatcher
    .registerCommand(std_ns + "BrightnessAbsolute", [&ctx](const json& p) {
      ctx.log().info("Action", "Setting the brightness to " + number(p, "brightness"));
    })
    .registerCommand(std_ns + "ColorAbsolute", [&ctx](const json& p) {
      std::string color = p.contains("color") ? p["color"].dump() : "?";
      ctx.log().info("Action", "Setting the color to " + color);
    })
    .registerCommand(std_ns + "Dock", [&ctx](const json&) {
      ctx.log().info("Action", "Returning for charging");
    })
    .registerCommand(std_ns + "StartStop", [&ctx](const json& p) {
      ctx.log().info("Action", flag(p, "start") ? "Starting device" : "Stopping device");
    })
    .registerCommand(std_ns + "PauseUnpause", [&ctx](const json& p) {
      ctx.log().info("Action", flag(p, "pause") ? "Setting pause" : "Unsetting pause");
    })
    .registerCommand(std_ns + "ThermostatTemperatureSetpoint", [&ctx](const json& p) {
      ctx.log().info("Action", "Setting thermostat to " + number(p, "thermostatTemperatureSetpoint"));
    });

  dispatcher
    .registerCommand(own_ns + "ReportTemperature", [&](const json&) {
      double t = hardware.temperatureC().value_or(0.0);
      ctx.log().info("Action", "Reporting room temperature: " + fmt2(t) + " C");
      tts.say("The room temperature is " + fmt2(t) + " degrees");
    })
    .registerCommand(own_ns + "ReportPressure", [&](const json&) {
      double p = hardware.pressureHpa().value_or(0.0);
      ctx.log().info("Action", "Reporting pressure: " + fmt2(p) + " hPa");
      tts.say("The room pressure is " + fmt2(p) + " hectopascals");
    })
    .registerCommand(own_ns + "ReportAltitude", [&](const json&) {
      double a = hardware.altitudeMeters().value_or(0.0);
      ctx.log().info("Action", "Reporting altitude: " + fmt2(a) + " meter");
      tts.say("The altitude is " + fmt2(a) + " meters");
    })
    .registerCommand(own_ns + "ReportLightSensor", [&](const json&) {
      double r = hardware.lightRatioPercent().value_or(0.0);
      ctx.log().info("Action", "Reporting light sensor AD converter ratio: " + fmt2(r) + " percent");
      tts.say("The light sensor ratio is " + fmt2(r) + " percent");
    })
    .registerCommand(own_ns + "ReportHumidity", [&hardware, &tts, &ctx, opts](const json&) {
      std::optional<double> h;
      for (int i = 0; i < opts.humidity_attempts; ++i) {
        h = hardware.humidityPercent();
        if (h) break;
        ctx.log().debug("Action", std::to_string(i) + ": Data not good, skip");
        std::this_thread::sleep_for(opts.humidity_interval);
      }
      if (!h) {
        ctx.log().info("Action", "Reporting humidity: timeout");
        tts.say("Reading the humidity timed out");
        return;
      }
      ctx.log().info("Action", "Reporting humidity: " + fmt2(*h) + " %");
      tts.say("The humidity is " + fmt2(*h) + " percent");
    });
}

} // namespace voxturn
