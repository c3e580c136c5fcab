#include "power.hpp"
#include <core/utils.hpp>
#include <fstream>

namespace fs = std::filesystem;

static std::string read_attr(const fs::path& dir, const char* name) {
    std::ifstream in(dir / name);
    std::string value;
    if (in) std::getline(in, value);
    trim(value);
    return value;
}

SystemPowerSource::SystemPowerSource(fs::path sysfs_root)
    : root_(std::move(sysfs_root)) {}

bool SystemPowerSource::on_external_power() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return true;

    bool has_battery = false;
    bool has_supply_node = false;
    bool battery_discharging = false;

    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        const auto& dir = entry.path();
        std::string type = read_attr(dir, "type");

        if (type == "Mains" || type == "USB") {
            has_supply_node = true;
            if (read_attr(dir, "online") == "1") return true;
        } else if (type == "Battery") {
            has_battery = true;
            if (read_attr(dir, "status") == "Discharging") battery_discharging = true;
        }
    }

    if (!has_battery) return true;
    if (has_supply_node) return false;
    // Some laptops expose no Mains node; fall back to the battery's own status
    return !battery_discharging;
}
