#include <voxturn/hardware/device_hardware.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace voxturn {

double altitudeFromPressure(double pressure_hpa, double sea_level_hpa) {
  if (pressure_hpa <= 0.0) return 0.0;
  return 44330.0 * (1.0 - std::pow(pressure_hpa / sea_level_hpa, 1.0 / 5.255));
}

std::optional<double> DeviceHardware::altitudeMeters() {
  auto p = pressureHpa();
  if (!p) return std::nullopt;
  return altitudeFromPressure(*p);
}

void NoOpHardware::setIndicator(bool on) {
  ctx_.log().debug("Hardware", std::string("indicator ") + (on ? "on" : "off"));
}

// ---------- sysfs ----------

SysfsHardware::SysfsHardware(Context& ctx, Paths paths)
: ctx_(ctx), paths_(std::move(paths)) {}

bool SysfsHardware::anyPresent() const {
  for (const auto* p : {&paths_.temperature, &paths_.humidity, &paths_.pressure, &paths_.light, &paths_.led}) {
    std::error_code ec;
    if (!p->empty() && fs::exists(*p, ec)) return true;
  }
  return false;
}

std::optional<double> SysfsHardware::readNumber(const std::string& path) const {
  if (path.empty()) return std::nullopt;
  std::ifstream f(path);
  if (!f.good()) return std::nullopt;
  double v = 0.0;
  // drivers return EIO on a bad sample; the stream then fails to parse
  if (!(f >> v)) {
    ctx_.log().debug("Hardware", "no reading from " + path);
    return std::nullopt;
  }
  return v;
}

std::optional<double> SysfsHardware::temperatureC() {
  auto v = readNumber(paths_.temperature);
  if (!v) return std::nullopt;
  return *v / 1000.0;
}

std::optional<double> SysfsHardware::humidityPercent() {
  auto v = readNumber(paths_.humidity);
  if (!v) return std::nullopt;
  return *v / 1000.0;
}

std::optional<double> SysfsHardware::pressureHpa() {
  auto v = readNumber(paths_.pressure);
  if (!v) return std::nullopt;
  return *v * 10.0;
}

std::optional<double> SysfsHardware::lightRatioPercent() {
  auto v = readNumber(paths_.light);
  if (!v || paths_.light_full_scale <= 0.0) return std::nullopt;
  return *v / paths_.light_full_scale * 100.0;
}

void SysfsHardware::setIndicator(bool on) {
  if (paths_.led.empty()) return;
  std::ofstream f(paths_.led);
  if (!f.good()) {
    ctx_.log().warn("Hardware", "cannot open LED " + paths_.led);
    return;
  }
  f << (on ? "1" : "0") << std::endl;
  if (!f) ctx_.log().warn("Hardware", "failed to write LED " + paths_.led);
}

std::unique_ptr<DeviceHardware> makeHardware(Context& ctx, const SysfsHardware::Paths& paths) {
  auto sysfs = std::make_unique<SysfsHardware>(ctx, paths);
  if (sysfs->anyPresent()) {
    ctx.log().info("Init", "Using sysfs sensors and indicator");
    return sysfs;
  }
  ctx.log().info("Init", "No sensors found, hardware readings report 0");
  return std::make_unique<NoOpHardware>(ctx);
}

} // namespace voxturn
