#pragma once

#include <filesystem>

// Reports whether the machine currently runs on external (mains) power.
class PowerSource {
public:
    virtual ~PowerSource() = default;
    virtual bool on_external_power() = 0;
};

// Linux implementation backed by /sys/class/power_supply.
//   - any Mains/USB supply with online=1      -> external power
//   - batteries present, no online supply     -> battery
//   - nothing readable (desktop, container)   -> assume external power
class SystemPowerSource : public PowerSource {
public:
    explicit SystemPowerSource(std::filesystem::path sysfs_root = "/sys/class/power_supply");

    bool on_external_power() override;

private:
    std::filesystem::path root_;
};
