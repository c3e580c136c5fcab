#include <gtest/gtest.h>
#include <platform/power.hpp>
#include <platform/wake_monitor.hpp>
#include <platform/platform.hpp>
#include <platform/instance_lock.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

// ── SystemPowerSource ───────────────────────────────────────

class PowerSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("keepsake_power_test_" + generate_uuid());
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void add_supply(const std::string& name, const std::string& type,
                    const std::string& attr, const std::string& value) {
        fs::path dir = root_ / name;
        fs::create_directories(dir);
        std::ofstream(dir / "type") << type << "\n";
        std::ofstream(dir / attr) << value << "\n";
    }

    fs::path root_;
};

TEST_F(PowerSourceTest, MissingSysfsCountsAsExternal) {
    SystemPowerSource power(root_ / "does-not-exist");
    EXPECT_TRUE(power.on_external_power());
}

TEST_F(PowerSourceTest, DesktopWithoutBattery) {
    add_supply("AC", "Mains", "online", "0");
    SystemPowerSource power(root_);
    EXPECT_TRUE(power.on_external_power());
}

TEST_F(PowerSourceTest, LaptopPluggedIn) {
    add_supply("BAT0", "Battery", "status", "Charging");
    add_supply("AC", "Mains", "online", "1");
    SystemPowerSource power(root_);
    EXPECT_TRUE(power.on_external_power());
}

TEST_F(PowerSourceTest, LaptopOnBattery) {
    add_supply("BAT0", "Battery", "status", "Discharging");
    add_supply("AC", "Mains", "online", "0");
    SystemPowerSource power(root_);
    EXPECT_FALSE(power.on_external_power());
}

TEST_F(PowerSourceTest, UsbSupplyCounts) {
    add_supply("BAT0", "Battery", "status", "Charging");
    add_supply("usb-c", "USB", "online", "1");
    SystemPowerSource power(root_);
    EXPECT_TRUE(power.on_external_power());
}

TEST_F(PowerSourceTest, BatteryStatusWhenNoSupplyNode) {
    add_supply("BAT0", "Battery", "status", "Full");
    SystemPowerSource power(root_);
    EXPECT_TRUE(power.on_external_power());

    add_supply("BAT0", "Battery", "status", "Discharging");
    EXPECT_FALSE(power.on_external_power());
}

// ── WakeMonitor ─────────────────────────────────────────────

TEST(WakeMonitor, SleepGapDetection) {
    EXPECT_FALSE(WakeMonitor::is_sleep_gap(5.0, 5.0, 30));
    EXPECT_FALSE(WakeMonitor::is_sleep_gap(35.0, 5.0, 30));
    EXPECT_TRUE(WakeMonitor::is_sleep_gap(3605.0, 5.0, 30));
    // Wall clock stepped backwards
    EXPECT_FALSE(WakeMonitor::is_sleep_gap(-100.0, 5.0, 30));
}

TEST(WakeMonitor, StartStop) {
    int wakes = 0;
    WakeMonitor monitor([&] { wakes++; }, 10, 30);
    EXPECT_TRUE(monitor.start());
    platform::sleep_ms(30);
    monitor.stop();
    EXPECT_EQ(wakes, 0);
}

// ── write_file_atomic ───────────────────────────────────────

TEST(Platform, WriteFileAtomicCreatesParents) {
    fs::path dir = fs::temp_directory_path() / ("keepsake_atomic_test_" + generate_uuid());
    fs::path target = dir / "a" / "b" / "file.txt";
    platform::write_file_atomic(target, "one");
    platform::write_file_atomic(target, "two");

    std::ifstream in(target);
    std::string contents;
    std::getline(in, contents);
    EXPECT_EQ(contents, "two");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

// ── InstanceLock ────────────────────────────────────────────

TEST(InstanceLock, SecondHolderIsRefused) {
    fs::path dir = fs::temp_directory_path() / ("keepsake_lock_test_" + generate_uuid());
    fs::path path = dir / "keepsake.lock";

    auto first = InstanceLock::try_acquire(path);
    ASSERT_NE(first, nullptr);

    std::string holder;
    auto second = InstanceLock::try_acquire(path, &holder);
    EXPECT_EQ(second, nullptr);
    EXPECT_EQ(holder, std::to_string(getpid()));

    first.reset();
    auto third = InstanceLock::try_acquire(path);
    EXPECT_NE(third, nullptr);
    third.reset();

    std::error_code ec;
    fs::remove_all(dir, ec);
}
