#include <gtest/gtest.h>
#include <managers/folder_mirror_engine.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fstream>

class FolderMirrorEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("keepsake_mirror_test_" + generate_uuid());
        src_ = root_ / "Photos";
        dest_ = root_ / "backup";
        fs::create_directories(src_);
        fs::create_directories(dest_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    // Files get increasing ages so the oldest-first order is predictable.
    void add_file(const std::string& rel, const std::string& contents, int age_hours) {
        fs::path p = src_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << contents;
        fs::last_write_time(p, fs::file_time_type::clock::now() - std::chrono::hours(age_hours));
    }

    TransferOptions options(BackupMode mode = BackupMode::Incremental) const {
        TransferOptions o;
        o.sources = {src_.string()};
        o.destination = dest_.string();
        o.backup_mode = mode;
        o.snapshot.device_id = "dev-1";
        return o;
    }

    TransferResult run(const TransferOptions& o,
                       const RunStatePoll& poll = [] { return RunState::Running; },
                       const std::optional<SessionCheckpoint>& resume = std::nullopt) {
        events_.clear();
        return engine_.run(o, [this](const ProgressEvent& e) { events_.push_back(e); }, poll, resume);
    }

    int count_events(ProgressKind kind) const {
        int n = 0;
        for (const auto& e : events_) {
            if (e.kind == kind) n++;
        }
        return n;
    }

    bool has_message(const std::string& text) const {
        for (const auto& e : events_) {
            if (e.kind == ProgressKind::Message && e.message == text) return true;
        }
        return false;
    }

    FolderMirrorEngine engine_;
    std::vector<ProgressEvent> events_;
    fs::path root_;
    fs::path src_;
    fs::path dest_;
};

TEST_F(FolderMirrorEngineTest, CopiesEverythingOnFirstRun) {
    add_file("a.jpg", "aaa", 3);
    add_file("2024/b.png", "bb", 2);
    add_file("notes.txt", "n", 1);

    auto r = run(options());
    EXPECT_EQ(r.completed, 3);
    EXPECT_EQ(r.errors, 0);
    EXPECT_FALSE(r.was_paused);
    EXPECT_TRUE(fs::exists(dest_ / "Photos/a.jpg"));
    EXPECT_TRUE(fs::exists(dest_ / "Photos/2024/b.png"));
    EXPECT_TRUE(fs::exists(FolderMirrorEngine::manifest_path(dest_)));
    EXPECT_EQ(r.processed_item_ids,
              (std::set<ItemId>{"Photos/a.jpg", "Photos/2024/b.png", "Photos/notes.txt"}));
    EXPECT_EQ(count_events(ProgressKind::ItemUploaded), 3);
    EXPECT_EQ(events_.front().kind, ProgressKind::Scanning);
}

TEST_F(FolderMirrorEngineTest, IncrementalSkipsUnchanged) {
    add_file("a.jpg", "aaa", 3);
    add_file("b.jpg", "bbb", 2);
    run(options());

    add_file("b.jpg", "changed", 1);
    auto r = run(options());
    EXPECT_EQ(r.skipped, 1);
    EXPECT_EQ(r.completed, 1);
    EXPECT_EQ(count_events(ProgressKind::ItemSkipped), 1);
}

TEST_F(FolderMirrorEngineTest, MissingTargetIsCopiedAgain) {
    add_file("a.jpg", "aaa", 3);
    run(options());
    fs::remove(dest_ / "Photos/a.jpg");

    auto r = run(options());
    EXPECT_EQ(r.completed, 1);
    EXPECT_TRUE(fs::exists(dest_ / "Photos/a.jpg"));
}

TEST_F(FolderMirrorEngineTest, FullModeCopiesAgain) {
    add_file("a.jpg", "aaa", 3);
    run(options());
    auto r = run(options(BackupMode::Full));
    EXPECT_EQ(r.completed, 1);
    EXPECT_EQ(r.skipped, 0);
}

TEST_F(FolderMirrorEngineTest, ForeignManifestForcesResync) {
    add_file("a.jpg", "aaa", 3);
    run(options());

    auto o = options();
    o.snapshot.device_id = "dev-2";
    auto r = run(o);
    EXPECT_EQ(r.completed, 1);
    EXPECT_EQ(r.skipped, 0);
}

TEST_F(FolderMirrorEngineTest, MediaFilterAndHiddenFiles) {
    add_file("a.jpg", "a", 3);
    add_file("clip.mp4", "v", 2);
    add_file(".hidden/x.jpg", "h", 1);

    auto o = options();
    o.media = MediaFilter::Images;
    auto r = run(o);
    EXPECT_EQ(r.completed, 1);
    EXPECT_EQ(r.processed_item_ids, (std::set<ItemId>{"Photos/a.jpg"}));
}

TEST_F(FolderMirrorEngineTest, PairedVideoSharesStillId) {
    add_file("IMG_1.HEIC", "still", 3);
    add_file("IMG_1.MOV", "clip", 2);

    std::vector<std::string> missing;
    auto items = FolderMirrorEngine::scan_sources(options(), missing);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, "Photos/IMG_1.HEIC");
    EXPECT_EQ(items[1].id, "Photos/IMG_1.HEIC:pairedVideo");
    EXPECT_EQ(items[1].dest_rel, "Photos/IMG_1.MOV");
}

TEST_F(FolderMirrorEngineTest, NewestFirstOrder) {
    add_file("old.jpg", "o", 5);
    add_file("new.jpg", "n", 1);
    auto o = options();
    o.order = SortOrder::Newest;
    std::vector<std::string> missing;
    auto items = FolderMirrorEngine::scan_sources(o, missing);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, "Photos/new.jpg");
}

TEST_F(FolderMirrorEngineTest, MissingSourceIsAnError) {
    add_file("a.jpg", "a", 1);
    auto o = options();
    o.sources.push_back((root_ / "gone").string());
    auto r = run(o);
    EXPECT_EQ(r.errors, 1);
    EXPECT_EQ(r.completed, 1);
    EXPECT_TRUE(has_message("ERROR Files: source not found: " + (root_ / "gone").string()));
}

TEST_F(FolderMirrorEngineTest, NoDestinationThrows) {
    auto o = options();
    o.destination.clear();
    EXPECT_THROW(run(o), std::runtime_error);
}

TEST_F(FolderMirrorEngineTest, PausesBetweenItems) {
    add_file("1.jpg", "1", 4);
    add_file("2.jpg", "2", 3);
    add_file("3.jpg", "3", 2);

    int polls = 0;
    auto r = run(options(), [&] { return ++polls <= 1 ? RunState::Running : RunState::Paused; });
    EXPECT_TRUE(r.was_paused);
    EXPECT_EQ(r.pause_index, 1);
    EXPECT_EQ(r.completed, 1);
    EXPECT_EQ(r.processed_item_ids, (std::set<ItemId>{"Photos/1.jpg"}));
    EXPECT_EQ(count_events(ProgressKind::Paused), 1);
    EXPECT_FALSE(fs::exists(dest_ / "Photos/2.jpg"));
}

TEST_F(FolderMirrorEngineTest, CancelStopsWithoutPauseEvent) {
    add_file("1.jpg", "1", 2);
    auto r = run(options(), [] { return RunState::Cancelled; });
    EXPECT_FALSE(r.was_paused);
    EXPECT_EQ(r.attempted, 0);
    EXPECT_EQ(count_events(ProgressKind::Paused), 0);
}

TEST_F(FolderMirrorEngineTest, ResumeSkipsProcessedItems) {
    add_file("1.jpg", "1", 3);
    add_file("2.jpg", "2", 2);

    SessionCheckpoint cp;
    cp.session_id = "s";
    cp.processed_item_ids = {"Photos/1.jpg"};
    auto r = run(options(), [] { return RunState::Running; }, cp);
    EXPECT_EQ(r.attempted, 1);
    EXPECT_EQ(r.processed_item_ids, (std::set<ItemId>{"Photos/2.jpg"}));
    EXPECT_FALSE(fs::exists(dest_ / "Photos/1.jpg"));
}

TEST_F(FolderMirrorEngineTest, DryRunTouchesNothing) {
    add_file("a.jpg", "a", 3);
    add_file("b.jpg", "b", 2);
    run(options());
    fs::remove(FolderMirrorEngine::manifest_path(dest_));
    add_file("c.jpg", "c", 1);

    auto o = options();
    o.dry_run = true;
    auto r = run(o);
    ASSERT_TRUE(r.dry_run_plan.has_value());
    EXPECT_EQ(r.dry_run_plan->items_scanned, 3);
    EXPECT_EQ(r.dry_run_plan->planned_uploads, 3);
    EXPECT_EQ(r.dry_run_plan->would_replace_existing, 2);
    EXPECT_EQ(r.dry_run_plan->would_skip_existing, 0);
    EXPECT_FALSE(fs::exists(dest_ / "Photos/c.jpg"));
    EXPECT_FALSE(fs::exists(FolderMirrorEngine::manifest_path(dest_)));
    EXPECT_TRUE(r.processed_item_ids.empty());
}

TEST_F(FolderMirrorEngineTest, MirrorDeletesStaleFiles) {
    add_file("keep.jpg", "k", 3);
    add_file("drop.jpg", "d", 2);
    run(options(BackupMode::Mirror));
    ASSERT_TRUE(fs::exists(dest_ / "Photos/drop.jpg"));

    fs::remove(src_ / "drop.jpg");
    auto r = run(options(BackupMode::Mirror));
    EXPECT_EQ(r.errors, 0);
    EXPECT_FALSE(fs::exists(dest_ / "Photos/drop.jpg"));
    EXPECT_TRUE(fs::exists(dest_ / "Photos/keep.jpg"));
    EXPECT_TRUE(has_message("Files: deleted Photos/drop.jpg"));

    auto manifest = FolderMirrorEngine::load_manifest(dest_, "dev-1");
    EXPECT_EQ(manifest.entries.count("Photos/drop.jpg"), 0u);
}

TEST_F(FolderMirrorEngineTest, ClearDestinationState) {
    add_file("a.jpg", "a", 1);
    run(options());
    ASSERT_TRUE(fs::exists(FolderMirrorEngine::manifest_path(dest_)));

    ASSERT_TRUE(engine_.clear_destination_state(options()).is_ok());
    EXPECT_FALSE(fs::exists(FolderMirrorEngine::manifest_path(dest_)));
    EXPECT_FALSE(fs::exists(dest_ / DEST_META_DIR / DEST_TMP_DIR));
    EXPECT_TRUE(fs::exists(dest_ / "Photos/a.jpg"));

    auto r = run(options());
    EXPECT_EQ(r.completed, 1);
}
