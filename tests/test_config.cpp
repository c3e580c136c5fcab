#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/utils.hpp>
#include <fstream>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("keepsake_config_test_" + generate_uuid());
        fs::create_directories(dir_);
        path_ = dir_ / "config.yaml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(ConfigTest, DefaultFileParses) {
    ASSERT_TRUE(create_default_config(path_).is_ok());
    auto r = Config::load_file(path_);
    ASSERT_TRUE(r.is_ok()) << r.error;

    const auto& c = r.value;
    ASSERT_EQ(c.sources().paths.size(), 1u);
    EXPECT_TRUE(ends_with(c.sources().paths[0], "/Pictures"));
    EXPECT_EQ(c.destination().mode, DestinationMode::Folder);
    EXPECT_EQ(c.transfer().backup_mode, BackupMode::Incremental);
    EXPECT_EQ(c.schedule().type, ScheduleType::Disabled);
    EXPECT_EQ(c.schedule().days.size(), 7u);
    EXPECT_TRUE(c.schedule().skip_on_battery);
    EXPECT_FALSE(c.notifications().on_start);
    EXPECT_EQ(c.log().max_lines, 10000);
    EXPECT_EQ(c.path(), path_);
}

TEST_F(ConfigTest, DefaultNeverOverwrites) {
    write("destination:\n  folder: /keep/me\n");
    ASSERT_TRUE(create_default_config(path_).is_ok());
    auto r = Config::load_file(path_);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.destination().folder, "/keep/me");
}

TEST_F(ConfigTest, MissingFileIsAnError) {
    auto r = Config::load_file(dir_ / "nope.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(starts_with(r.error, "Config not found"));
}

TEST_F(ConfigTest, InvalidEnumIsRejected) {
    write("transfer:\n  media: x\n");
    auto r = Config::load_file(path_);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(starts_with(r.error, "Failed to parse config: Invalid value for transfer.media: 'x'"))
        << r.error;
}

TEST_F(ConfigTest, ScheduleValuesAreClamped) {
    write("schedule:\n"
          "  type: interval\n"
          "  interval_hours: 100\n"
          "  hour: 40\n"
          "  days: weekdays\n");
    auto r = Config::load_file(path_);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.schedule().type, ScheduleType::Interval);
    EXPECT_EQ(r.value.schedule().interval_hours, 48);
    EXPECT_EQ(r.value.schedule().hour, 23);
    EXPECT_EQ(r.value.schedule().days.size(), 5u);
}

TEST_F(ConfigTest, BadScheduleDayIsRejected) {
    write("schedule:\n  days: [mon, someday]\n");
    EXPECT_TRUE(Config::load_file(path_).is_err());
}

TEST_F(ConfigTest, SnapshotFollowsDestinationMode) {
    write("destination:\n"
          "  mode: server\n"
          "  folder: /mnt/backup\n"
          "  server_url: https://photos.example\n"
          "transfer:\n"
          "  items: both\n"
          "  order: newest\n");
    auto r = Config::load_file(path_);
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto snap = r.value.snapshot("dev-1");
    EXPECT_EQ(snap.mode, "both");
    EXPECT_EQ(snap.media, "all");
    EXPECT_EQ(snap.sort_order, "newest");
    EXPECT_EQ(snap.destination, "");
    EXPECT_EQ(snap.server_url, "https://photos.example");
    EXPECT_EQ(snap.device_id, "dev-1");
}

TEST_F(ConfigTest, TransferOptions) {
    write("sources:\n"
          "  paths: [/data/a, /data/b]\n"
          "destination:\n"
          "  folder: /mnt/backup\n"
          "transfer:\n"
          "  backup_mode: mirror\n");
    auto r = Config::load_file(path_);
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto o = r.value.transfer_options("dev-2", true);
    EXPECT_EQ(o.sources, (std::vector<std::string>{"/data/a", "/data/b"}));
    EXPECT_EQ(o.destination, "/mnt/backup");
    EXPECT_EQ(o.backup_mode, BackupMode::Mirror);
    EXPECT_TRUE(o.dry_run);
    EXPECT_EQ(o.snapshot.device_id, "dev-2");
    EXPECT_EQ(o.snapshot.destination, "/mnt/backup");
}

TEST_F(ConfigTest, ServerModeHandsNoFolderToEngine) {
    write("destination:\n"
          "  mode: server\n"
          "  folder: /mnt/A\n"
          "  server_url: https://photos.example\n");
    auto a = Config::load_file(path_);
    ASSERT_TRUE(a.is_ok()) << a.error;

    write("destination:\n"
          "  mode: server\n"
          "  folder: /mnt/B\n"
          "  server_url: https://photos.example\n");
    auto b = Config::load_file(path_);
    ASSERT_TRUE(b.is_ok()) << b.error;

    auto oa = a.value.transfer_options("dev-1", false);
    auto ob = b.value.transfer_options("dev-1", false);
    EXPECT_EQ(oa.destination, "");
    EXPECT_EQ(ob.destination, "");
    EXPECT_EQ(oa.destination, oa.snapshot.destination);
    EXPECT_FALSE(snapshot_mismatch(oa.snapshot, ob.snapshot).has_value());
}

TEST_F(ConfigTest, EngineFolderAlwaysMatchesSnapshot) {
    write("destination:\n"
          "  mode: both\n"
          "  folder: /mnt/A\n"
          "  server_url: https://photos.example\n");
    auto a = Config::load_file(path_);
    ASSERT_TRUE(a.is_ok()) << a.error;

    write("destination:\n"
          "  mode: both\n"
          "  folder: /mnt/B\n"
          "  server_url: https://photos.example\n");
    auto b = Config::load_file(path_);
    ASSERT_TRUE(b.is_ok()) << b.error;

    auto oa = a.value.transfer_options("dev-1", false);
    auto ob = b.value.transfer_options("dev-1", false);
    EXPECT_EQ(oa.destination, "/mnt/A");
    EXPECT_EQ(oa.snapshot.destination, "/mnt/A");
    EXPECT_EQ(snapshot_mismatch(oa.snapshot, ob.snapshot), std::optional<std::string>("destination"));
}

TEST_F(ConfigTest, SaveSchedulePolicyKeepsOtherSections) {
    write("destination:\n  folder: /mnt/backup\n");
    SchedulePolicy p;
    p.type = ScheduleType::Weekly;
    p.hour = 3;
    p.minute = 30;
    p.days = {Weekday::Monday, Weekday::Friday};
    p.skip_on_battery = false;
    ASSERT_TRUE(save_schedule_policy(path_, p).is_ok());

    auto r = Config::load_file(path_);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.destination().folder, "/mnt/backup");
    EXPECT_EQ(r.value.schedule(), p);
}

TEST(ConfigSnapshot, MismatchNamesFirstField) {
    ConfigSnapshot a{"originals", "all", "oldest", "/mnt", "", "dev"};
    ConfigSnapshot b = a;
    EXPECT_FALSE(snapshot_mismatch(a, b).has_value());

    b.destination = "/elsewhere";
    b.device_id = "other";
    EXPECT_EQ(snapshot_mismatch(a, b), std::optional<std::string>("destination"));

    b = a;
    b.media = "videos";
    EXPECT_EQ(snapshot_mismatch(a, b), std::optional<std::string>("media"));
}

TEST(ConfigEnums, SpellingsAreSymmetric) {
    EXPECT_EQ(parse_backup_mode(to_string(BackupMode::Mirror)), BackupMode::Mirror);
    EXPECT_EQ(parse_item_mode(to_string(ItemMode::Edited)), ItemMode::Edited);
    EXPECT_FALSE(parse_sort_order("random").has_value());
}
