#include "consolidation/audit_logger.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ACE {
namespace Consolidation {

std::chrono::system_clock::time_point parseISO8601(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("invalid timestamp '" + text + "'");
    }
    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        ss >> millis;
    }
    return tp + std::chrono::milliseconds(millis);
}

void to_json(nlohmann::json& j, const AuditEntry& entry) {
    j = nlohmann::json{
        {"timestamp", Logger::timestampToISO8601(entry.timestamp)},
        {"sourceId", entry.source_id},
        {"sourceName", entry.source_name},
        {"targetId", entry.target_id},
        {"targetName", entry.target_name},
        {"mentionsTransferred", entry.mentions_transferred},
        {"confidence", entry.confidence},
        {"method", entry.method}
    };
}

void from_json(const nlohmann::json& j, AuditEntry& entry) {
    entry.timestamp = parseISO8601(j.at("timestamp").get<std::string>());
    j.at("sourceId").get_to(entry.source_id);
    j.at("sourceName").get_to(entry.source_name);
    j.at("targetId").get_to(entry.target_id);
    j.at("targetName").get_to(entry.target_name);
    j.at("mentionsTransferred").get_to(entry.mentions_transferred);
    j.at("confidence").get_to(entry.confidence);
    j.at("method").get_to(entry.method);
}

std::string dumpJson(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

// JsonFileAuditSink implementation
JsonFileAuditSink::JsonFileAuditSink(std::string path) : path_(std::move(path)) {}

bool JsonFileAuditSink::persist(const std::vector<AuditEntry>& entries) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_ERROR("audit", "Cannot create audit directory " + target.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("audit", "Cannot open audit file " + temp.string());
            return false;
        }
        file << dumpJson(nlohmann::json(entries), 2) << '\n';
        if (!file.good()) {
            LOG_ERROR("audit", "Failed writing audit file " + temp.string());
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        LOG_ERROR("audit", "Cannot move audit file into place: " + ec.message());
        return false;
    }

    LOG_INFO("audit", "Audit log written to " + path_ + " (" + std::to_string(entries.size()) + " entries)");
    return true;
}

// SqliteAuditSink implementation
SqliteAuditSink::SqliteAuditSink(Storage::Database& db, std::string table, std::string actor)
    : db_(db), table_(std::move(table)), actor_(std::move(actor)) {}

Storage::DbResult<void> SqliteAuditSink::ensureTable() {
    return db_.execute("CREATE TABLE IF NOT EXISTS " + table_ + " ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                       "timestamp TEXT NOT NULL, "
                       "user_id TEXT, "
                       "action TEXT NOT NULL, "
                       "object_type TEXT NOT NULL, "
                       "object_id TEXT, "
                       "payload_json TEXT)");
}

bool SqliteAuditSink::persist(const std::vector<AuditEntry>& entries) {
    if (entries.empty()) {
        return true;
    }

    auto created = ensureTable();
    if (!created) {
        LOG_ERROR("audit", "Cannot create audit table " + table_ + ": " + created.error().message);
        return false;
    }

    auto written = db_.transaction([&]() -> Storage::DbResult<void> {
        auto stmtR = db_.prepare("INSERT INTO " + table_ +
                                 " (timestamp, user_id, action, object_type, object_id, payload_json)"
                                 " VALUES (?, ?, 'entity_merge', 'entity', ?, ?)");
        if (!stmtR) return stmtR.error();
        auto stmt = std::move(stmtR).value();

        for (const auto& entry : entries) {
            auto br = stmt.bind(1, std::string_view(Logger::timestampToISO8601(entry.timestamp)));
            if (!br) return br.error();
            br = stmt.bind(2, std::string_view(actor_));
            if (!br) return br.error();
            br = stmt.bind(3, std::string_view(std::to_string(entry.target_id)));
            if (!br) return br.error();
            br = stmt.bind(4, std::string_view(dumpJson(nlohmann::json(entry))));
            if (!br) return br.error();

            auto er = stmt.execute();
            if (!er) return er.error();
            auto rr = stmt.reset();
            if (!rr) return rr;
        }
        return {};
    });

    if (!written) {
        LOG_ERROR("audit", "Failed to append audit rows: " + written.error().message);
        return false;
    }
    LOG_INFO("audit", "Appended " + std::to_string(entries.size()) + " rows to " + table_);
    return true;
}

// AuditLogger implementation
void AuditLogger::addSink(std::unique_ptr<AuditSink> sink) {
    persisted_[sink.get()] = offsetFor(*sink);
    sinks_.push_back(std::move(sink));
}

void AuditLogger::append(AuditEntry entry) {
    entries_.push_back(std::move(entry));
}

size_t AuditLogger::offsetFor(const AuditSink& sink) const {
    if (sink.rewritesAll()) {
        return 0;
    }
    auto it = restored_offsets_.find(sink.name());
    if (it == restored_offsets_.end()) {
        return 0;
    }
    return std::min(it->second, entries_.size());
}

void AuditLogger::restore(std::vector<AuditEntry> entries, const std::map<std::string, size_t>& sink_offsets) {
    entries.insert(entries.end(), std::make_move_iterator(entries_.begin()),
                   std::make_move_iterator(entries_.end()));
    entries_ = std::move(entries);
    restored_offsets_ = sink_offsets;
    for (const auto& sink : sinks_) {
        persisted_[sink.get()] = offsetFor(*sink);
    }
}

std::map<std::string, size_t> AuditLogger::appendOffsets() const {
    std::map<std::string, size_t> offsets;
    for (const auto& sink : sinks_) {
        if (!sink->rewritesAll()) {
            offsets[sink->name()] = persisted_.at(sink.get());
        }
    }
    return offsets;
}

bool AuditLogger::flush() {
    bool all_ok = true;
    for (const auto& sink : sinks_) {
        if (sink->rewritesAll()) {
            all_ok = sink->persist(entries_) && all_ok;
            continue;
        }

        size_t& offset = persisted_[sink.get()];
        std::vector<AuditEntry> pending(entries_.begin() + static_cast<std::ptrdiff_t>(offset), entries_.end());
        if (sink->persist(pending)) {
            offset = entries_.size();
        } else {
            all_ok = false;
        }
    }
    return all_ok;
}

} // namespace Consolidation
} // namespace ACE
