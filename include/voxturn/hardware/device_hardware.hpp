#pragma once

#include <memory>
#include <optional>
#include <string>

#include <voxturn/core/context.hpp>

namespace voxturn {

/**
 * Sensors and indicator of the device the assistant runs on.
 * A reading returns nullopt when the sensor is absent or the sample was not
 * good; callers decide whether to retry.
 */
class DeviceHardware {
public:
    virtual ~DeviceHardware() = default;

    virtual std::string name() const = 0;

    virtual std::optional<double> temperatureC() = 0;
    virtual std::optional<double> humidityPercent() = 0;
    virtual std::optional<double> pressureHpa() = 0;
    virtual std::optional<double> lightRatioPercent() = 0;

    // Altitude in metres derived from pressure (international barometric formula).
    std::optional<double> altitudeMeters();

    virtual void setIndicator(bool on) = 0;
};

// Barometric altitude for a pressure in hPa, sea level 1013.25 hPa.
double altitudeFromPressure(double pressure_hpa, double sea_level_hpa = 1013.25);

// Used when the board has no sensors: every reading is 0 and the indicator
// only logs.
class NoOpHardware : public DeviceHardware {
public:
    explicit NoOpHardware(Context& ctx) : ctx_(ctx) {}

    std::string name() const override { return "none"; }
    std::optional<double> temperatureC() override { return 0.0; }
    std::optional<double> humidityPercent() override { return 0.0; }
    std::optional<double> pressureHpa() override { return 0.0; }
    std::optional<double> lightRatioPercent() override { return 0.0; }
    void setIndicator(bool on) override;

private:
    Context& ctx_;
};

// Linux IIO / LED class devices read through sysfs attribute files.
class SysfsHardware : public DeviceHardware {
public:
    struct Paths {
        std::string temperature;   // millidegree Celsius, e.g. .../in_temp_input
        std::string humidity;      // milli percent, .../in_humidityrelative_input
        std::string pressure;      // kPa, .../in_pressure_input
        std::string light;         // raw ADC counts, .../in_illuminance_raw
        double light_full_scale = 4095.0;
        std::string led;           // /sys/class/leds/<name>/brightness
    };

    SysfsHardware(Context& ctx, Paths paths);

    std::string name() const override { return "sysfs"; }
    std::optional<double> temperatureC() override;
    std::optional<double> humidityPercent() override;
    std::optional<double> pressureHpa() override;
    std::optional<double> lightRatioPercent() override;
    void setIndicator(bool on) override;

    // true when at least one configured attribute file exists
    bool anyPresent() const;

private:
    std::optional<double> readNumber(const std::string& path) const;

    Context& ctx_;
    Paths paths_;
};

// Picks SysfsHardware when one of the configured files exists, NoOpHardware otherwise.
std::unique_ptr<DeviceHardware> makeHardware(Context& ctx, const SysfsHardware::Paths& paths);

} // namespace voxturn
