#include "checkpoint_store.hpp"
#include "backup_log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

// ── Encoding ────────────────────────────────────────────────
// yaml-cpp in flow style with double-quoted strings emits valid JSON.

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if none.
static size_t utf8_sequence_length(const std::string& s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = byte(i);
    if (c < 0x80) return 1;

    size_t len;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F;   // no surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; k++) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

// Item ids and paths are raw filesystem bytes. The emitter would replace
// invalid UTF-8 with U+FFFD, so '%', control bytes and ill-formed
// sequences are written as %XX and restored on load.
std::string escape_checkpoint_text(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        size_t len = utf8_sequence_length(raw, i);
        if (len == 0 || c == '%' || c < 0x20 || c == 0x7F) {
            out += fmt::format("%{:02X}", c);
            i++;
            continue;
        }
        out.append(raw, i, len);
        i += len;
    }
    return out;
}

std::string unescape_checkpoint_text(const std::string& text) {
    auto hex = [](char ch) -> int {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        return -1;
    };

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int h = hex(text[i + 1]);
            int l = hex(text[i + 2]);
            if (h >= 0 && l >= 0) {
                out += static_cast<char>(h * 16 + l);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

static void emit_text(YAML::Emitter& out, const char* key, const std::string& value) {
    out << YAML::Key << key << YAML::Value << escape_checkpoint_text(value);
}

static void emit_id_set(YAML::Emitter& out, const char* key, const std::set<ItemId>& ids) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& id : ids) out << escape_checkpoint_text(id);
    out << YAML::EndSeq;
}

static void emit_timestamp(YAML::Emitter& out, const char* key, const std::string& ts) {
    out << YAML::Key << key << YAML::Value;
    if (ts.empty()) {
        out << YAML::Null;
    } else {
        out << ts;
    }
}

std::string checkpoint_to_json(const SessionCheckpoint& cp) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);

    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << CHECKPOINT_FORMAT_VERSION;
    emit_text(out, "session_id", cp.session_id);
    emit_timestamp(out, "started_at", cp.started_at);
    emit_timestamp(out, "last_updated_at", cp.last_updated_at);
    emit_timestamp(out, "paused_at", cp.paused_at);

    out << YAML::Key << "config" << YAML::Value << YAML::BeginMap;
    emit_text(out, "mode", cp.config.mode);
    emit_text(out, "media", cp.config.media);
    emit_text(out, "sort_order", cp.config.sort_order);
    emit_text(out, "destination", cp.config.destination);
    emit_text(out, "server_url", cp.config.server_url);
    emit_text(out, "device_id", cp.config.device_id);
    out << YAML::EndMap;

    emit_id_set(out, "processed_item_ids", cp.processed_item_ids);
    emit_id_set(out, "error_item_ids", cp.error_item_ids);
    out << YAML::Key << "pause_index" << YAML::Value << cp.pause_index;
    out << YAML::Key << "total_items_at_pause" << YAML::Value << cp.total_items_at_pause;

    out << YAML::Key << "stats" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "uploaded_count" << YAML::Value << cp.stats.uploaded_count;
    out << YAML::Key << "skipped_count" << YAML::Value << cp.stats.skipped_count;
    out << YAML::Key << "error_count" << YAML::Value << cp.stats.error_count;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

// Missing keys and JSON null both read as "" (as<std::string> would
// return the literal "null" for the latter).
static std::string read_text(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return "";
    return unescape_checkpoint_text(node.Scalar());
}

static std::set<ItemId> parse_id_set(const YAML::Node& node) {
    std::set<ItemId> ids;
    if (node && node.IsSequence()) {
        for (const auto& n : node) {
            std::string id = read_text(n);
            if (!id.empty()) ids.insert(id);
        }
    }
    return ids;
}

Result<SessionCheckpoint> checkpoint_from_json(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return Result<SessionCheckpoint>::Err("checkpoint is not an object");
        }

        int version = root["version"].as<int>(0);
        if (version != CHECKPOINT_FORMAT_VERSION) {
            return Result<SessionCheckpoint>::Err(
                fmt::format("unsupported checkpoint version {}", version));
        }

        SessionCheckpoint cp;
        cp.session_id = read_text(root["session_id"]);
        if (cp.session_id.empty()) {
            return Result<SessionCheckpoint>::Err("checkpoint has no session id");
        }
        cp.started_at = read_text(root["started_at"]);
        cp.last_updated_at = read_text(root["last_updated_at"]);
        cp.paused_at = read_text(root["paused_at"]);

        YAML::Node c = root["config"];
        if (c && c.IsMap()) {
            cp.config.mode = read_text(c["mode"]);
            cp.config.media = read_text(c["media"]);
            cp.config.sort_order = read_text(c["sort_order"]);
            cp.config.destination = read_text(c["destination"]);
            cp.config.server_url = read_text(c["server_url"]);
            cp.config.device_id = read_text(c["device_id"]);
        }

        cp.processed_item_ids = parse_id_set(root["processed_item_ids"]);
        cp.error_item_ids = parse_id_set(root["error_item_ids"]);
        cp.pause_index = root["pause_index"].as<int>(0);
        cp.total_items_at_pause = root["total_items_at_pause"].as<int>(0);

        YAML::Node s = root["stats"];
        if (s && s.IsMap()) {
            cp.stats.uploaded_count = s["uploaded_count"].as<int>(0);
            cp.stats.skipped_count = s["skipped_count"].as<int>(0);
            cp.stats.error_count = s["error_count"].as<int>(0);
        }

        return Result<SessionCheckpoint>::Ok(cp);
    } catch (const std::exception& e) {
        return Result<SessionCheckpoint>::Err(std::string("unreadable checkpoint: ") + e.what());
    }
}

// ── FileCheckpointStore ─────────────────────────────────────

FileCheckpointStore::FileCheckpointStore(fs::path path) : path_(std::move(path)) {}

Result<void> FileCheckpointStore::save(const SessionCheckpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        platform::write_file_atomic(path_, checkpoint_to_json(checkpoint));
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        keepsake_log(fmt::format("checkpoint: save to {} failed: {}", path_.string(), e.what()));
        return Result<void>::Err(std::string("Failed to save checkpoint: ") + e.what());
    }
}

std::optional<SessionCheckpoint> FileCheckpointStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(path_, ec)) return std::nullopt;

    std::ifstream in(path_);
    if (!in) {
        keepsake_log("checkpoint: cannot open " + path_.string());
        return std::nullopt;
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto parsed = checkpoint_from_json(buf.str());
    if (parsed.is_err()) {
        // Corrupt or foreign file: no resumable session
        keepsake_log("checkpoint: ignoring " + path_.string() + ": " + parsed.error);
        return std::nullopt;
    }
    return parsed.value;
}

Result<void> FileCheckpointStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        keepsake_log(fmt::format("checkpoint: clear {} failed: {}", path_.string(), ec.message()));
        return Result<void>::Err("Failed to remove checkpoint: " + ec.message());
    }
    return Result<void>::Ok();
}

// ── MemoryCheckpointStore ───────────────────────────────────

Result<void> MemoryCheckpointStore::save(const SessionCheckpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_saves_) {
        return Result<void>::Err("Failed to save checkpoint: store unavailable");
    }
    slot_ = checkpoint;
    ++save_count_;
    return Result<void>::Ok();
}

std::optional<SessionCheckpoint> MemoryCheckpointStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_;
}

Result<void> MemoryCheckpointStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_.reset();
    return Result<void>::Ok();
}

void MemoryCheckpointStore::set_fail_saves(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_saves_ = fail;
}

int MemoryCheckpointStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}
