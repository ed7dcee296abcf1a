#pragma once

#include <chrono>

#include <voxturn/actions/device_action_dispatcher.hpp>
#include <voxturn/core/context.hpp>
#include <voxturn/hardware/device_hardware.hpp>
#include <voxturn/tts/text_to_speech.hpp>

namespace voxturn {

struct BuiltinOptions {
    // Humidity sensors (DHT11 and friends) often return a bad sample.
    int humidity_attempts = 20;
    std::chrono::milliseconds humidity_interval{500};
};

/**
 * Registers the handlers that ship with the client:
 *   action.devices.commands.{BrightnessAbsolute, ColorAbsolute, Dock,
 *     StartStop, PauseUnpause, ThermostatTemperatureSetpoint}  (logged only)
 *   com.voxturn.commands.Report{Temperature, Humidity, Pressure, Altitude,
 *     LightSensor}  (read `hardware`, answer through `tts`)
 * `hardware` and `tts` must outlive the dispatcher.
 */
void registerBuiltinCommands(DeviceActionDispatcher& dispatcher,
                             DeviceHardware& hardware,
                             TextToSpeech& tts,
                             Context& ctx,
                             BuiltinOptions opts = BuiltinOptions());

} // namespace voxturn
