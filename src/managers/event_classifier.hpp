#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>

// Strip one known variant suffix (":edited", ":pairedVideo", ":video",
// "-edited", "-paired-video") so every file of a logical item shares a key.
std::string base_item_id(const ItemId& id);

// Id in the last parenthesized group of a free-form message:
// "upload created (Photos/IMG_1.HEIC:edited)" -> "Photos/IMG_1.HEIC:edited"
std::optional<ItemId> extract_item_id(const std::string& message);

// What a single event changed, for the orchestrator to publish.
struct ClassifiedEvent {
    std::optional<std::string> status;      // new status line, if any
    std::vector<std::string> log_lines;
    std::vector<std::string> error_lines;
    bool paused = false;                    // engine reported it stopped at a pause
};

// Turns the engine's progress stream into deduplicated counters.
// A logical item counts at most once as uploaded or skipped per run; errors
// are deduplicated only when they carry an id. Not thread-safe: the
// orchestrator serializes all calls.
class EventClassifier {
public:
    EventClassifier() = default;

    // Forget everything: counters, progress and dedup sets.
    void reset();

    // Resume: counters start from the checkpoint and its processed items are
    // treated as already counted.
    void seed(const std::set<ItemId>& processed, const SessionStats& stats);

    ClassifiedEvent handle(const ProgressEvent& event);

    const SessionStats& stats() const { return stats_; }
    int progress_value() const { return progress_value_; }
    int progress_total() const { return progress_total_; }

    // Raise the error count to at least `errors` (engine totals may exceed
    // what was observable from events).
    void merge_error_total(int errors);

    // Dry runs report planned actions in place of observed outcomes.
    void set_planned_counts(int would_upload, int would_skip);

private:
    void count_done(const ItemId& id, bool uploaded);
    void count_error(const ItemId& id);
    void classify_message(const std::string& msg, ClassifiedEvent& out);

    SessionStats stats_;
    int progress_value_ = 0;
    int progress_total_ = 0;
    std::set<ItemId> seen_ids_;       // uploaded or skipped, by base id
    std::set<ItemId> error_ids_;      // errored, by base id
};
