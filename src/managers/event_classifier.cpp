#include "event_classifier.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

std::string base_item_id(const ItemId& id) {
    static const char* suffixes[] = {":edited", ":pairedVideo", ":video", "-edited", "-paired-video"};
    for (const char* suffix : suffixes) {
        if (ends_with(id, suffix)) {
            return id.substr(0, id.size() - std::char_traits<char>::length(suffix));
        }
    }
    return id;
}

std::optional<ItemId> extract_item_id(const std::string& message) {
    auto open = message.rfind('(');
    auto close = message.rfind(')');
    if (open == std::string::npos || close == std::string::npos || open >= close) {
        return std::nullopt;
    }
    std::string id = message.substr(open + 1, close - open - 1);
    trim(id);
    if (id.empty()) return std::nullopt;
    return id;
}

void EventClassifier::reset() {
    stats_ = SessionStats{};
    progress_value_ = 0;
    progress_total_ = 0;
    seen_ids_.clear();
    error_ids_.clear();
}

void EventClassifier::seed(const std::set<ItemId>& processed, const SessionStats& stats) {
    reset();
    stats_ = stats;
    for (const auto& id : processed) {
        seen_ids_.insert(base_item_id(id));
    }
}

void EventClassifier::merge_error_total(int errors) {
    stats_.error_count = std::max(stats_.error_count, errors);
}

void EventClassifier::set_planned_counts(int would_upload, int would_skip) {
    stats_.uploaded_count = would_upload;
    stats_.skipped_count = would_skip;
}

void EventClassifier::count_done(const ItemId& id, bool uploaded) {
    if (id.empty()) {
        // Uploads without an id still count; a bare skip carries no information
        if (uploaded) stats_.uploaded_count++;
        return;
    }
    if (!seen_ids_.insert(base_item_id(id)).second) return;
    if (uploaded) {
        stats_.uploaded_count++;
    } else {
        stats_.skipped_count++;
    }
}

void EventClassifier::count_error(const ItemId& id) {
    if (id.empty()) {
        stats_.error_count++;
        return;
    }
    if (error_ids_.insert(base_item_id(id)).second) {
        stats_.error_count++;
    }
}

ClassifiedEvent EventClassifier::handle(const ProgressEvent& e) {
    ClassifiedEvent out;

    switch (e.kind) {
    case ProgressKind::Scanning:
        out.status = "Scanning...";
        out.log_lines.push_back("Scanning...");
        break;

    case ProgressKind::WillProcess:
        progress_total_ = e.total;
        progress_value_ = 0;
        out.status = fmt::format("Will export {} item(s)...", e.total);
        out.log_lines.push_back(*out.status);
        break;

    case ProgressKind::Processing:
        progress_total_ = e.total;
        progress_value_ = e.index;
        out.status = fmt::format("Exporting {}/{}: {}", e.index, e.total, e.name);
        if (e.index <= PROGRESS_LOG_HEAD || e.index == e.total || e.index % PROGRESS_LOG_EVERY == 0) {
            out.log_lines.push_back(fmt::format("[{}/{}] {}", e.index, e.total, e.name));
        }
        break;

    case ProgressKind::ItemUploaded:
        count_done(e.item_id, true);
        out.log_lines.push_back(fmt::format("upload created ({})", e.item_id));
        break;

    case ProgressKind::ItemSkipped:
        count_done(e.item_id, false);
        out.log_lines.push_back(fmt::format("exists, skipping upload ({})", e.item_id));
        break;

    case ProgressKind::ItemFailed: {
        count_error(e.item_id);
        std::string line = e.item_id.empty()
            ? fmt::format("ERROR {}", e.message)
            : fmt::format("ERROR {} ({})", e.message, e.item_id);
        out.log_lines.push_back(line);
        out.error_lines.push_back(line);
        break;
    }

    case ProgressKind::Message:
        out.log_lines.push_back(e.message);
        classify_message(e.message, out);
        break;

    case ProgressKind::Retrying:
        out.status = fmt::format("Retrying {}...", e.name);
        out.log_lines.push_back(fmt::format("Retry {}/{} for {}: {}", e.attempt, e.max_attempts,
                                            e.name, e.message));
        break;

    case ProgressKind::Paused:
        out.paused = true;
        out.status = fmt::format("Paused at {}/{}", e.index, e.total);
        out.log_lines.push_back(*out.status);
        break;
    }

    return out;
}

// Free-form engine messages. Structured outcome events are preferred; these
// rules keep message-only engines counted correctly.
void EventClassifier::classify_message(const std::string& msg, ClassifiedEvent& out) {
    if (starts_with(msg, "ERROR")) {
        out.error_lines.push_back(msg);
    }

    auto id = extract_item_id(msg);

    if (starts_with(msg, "ERROR upload failed")) {
        count_error(id ? *id : ItemId());
    } else if (starts_with(msg, "ERROR processing") || starts_with(msg, "ERROR exporting") ||
               starts_with(msg, "ERROR Files:")) {
        stats_.error_count++;
    } else if (msg.find("skipping upload") != std::string::npos ||
               msg.find("upload duplicate") != std::string::npos) {
        if (id) count_done(*id, false);
    } else if (msg.find("upload created") != std::string::npos) {
        count_done(id ? *id : ItemId(), true);
    }
}
