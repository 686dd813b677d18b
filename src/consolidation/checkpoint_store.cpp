#include "consolidation/checkpoint_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>

namespace ACE {
namespace Consolidation {

std::string Checkpoint::computeHash() const {
    std::string payload = dumpJson(nlohmann::json(audit_entries)) + "|" + dumpJson(nlohmann::json(sink_offsets)) +
                          "|" + run_id + "|" + database_path + "|" + entity_type + "|" +
                          std::to_string(merges_completed) + "|" + std::to_string(merges_failed);
    std::ostringstream ss;
    ss << std::hex << std::hash<std::string>{}(payload);
    return ss.str();
}

nlohmann::json Checkpoint::toJson() const {
    return nlohmann::json{
        {"run_id", run_id},
        {"timestamp", Logger::timestampToISO8601(timestamp)},
        {"database_path", database_path},
        {"entity_type", entity_type},
        {"merges_completed", merges_completed},
        {"merges_failed", merges_failed},
        {"audit_entries", audit_entries},
        {"sink_offsets", sink_offsets},
        {"verification_hash", computeHash()}
    };
}

Checkpoint Checkpoint::fromJson(const nlohmann::json& json) {
    Checkpoint checkpoint;
    json.at("run_id").get_to(checkpoint.run_id);
    json.at("database_path").get_to(checkpoint.database_path);
    json.at("entity_type").get_to(checkpoint.entity_type);
    json.at("merges_completed").get_to(checkpoint.merges_completed);
    json.at("merges_failed").get_to(checkpoint.merges_failed);
    json.at("audit_entries").get_to(checkpoint.audit_entries);
    json.at("sink_offsets").get_to(checkpoint.sink_offsets);
    json.at("verification_hash").get_to(checkpoint.verification_hash);

    checkpoint.timestamp = parseISO8601(json.at("timestamp").get<std::string>());
    return checkpoint;
}

bool Checkpoint::verify() const {
    return !verification_hash.empty() && verification_hash == computeHash();
}

bool Checkpoint::matches(const std::string& database, const std::string& type) const {
    std::error_code ec;
    bool same_db = database_path == database ||
                   std::filesystem::equivalent(database_path, database, ec);
    return same_db && entity_type == type;
}

CheckpointStore::CheckpointStore(std::string path) : path_(std::move(path)) {}

bool CheckpointStore::save(const Checkpoint& checkpoint) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_ERROR("checkpoint", "Cannot create checkpoint directory: " + ec.message());
            return false;
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("checkpoint", "Cannot open checkpoint file " + temp.string());
            return false;
        }
        file << dumpJson(checkpoint.toJson(), 2) << '\n';
        if (!file.good()) {
            LOG_ERROR("checkpoint", "Failed writing checkpoint " + temp.string());
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        LOG_ERROR("checkpoint", "Cannot move checkpoint into place: " + ec.message());
        return false;
    }

    LOG_DEBUG("checkpoint", "Checkpoint saved after " + std::to_string(checkpoint.merges_completed) + " merges");
    return true;
}

std::optional<Checkpoint> CheckpointStore::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(file);
        Checkpoint checkpoint = Checkpoint::fromJson(json);
        if (!checkpoint.verify()) {
            LOG_WARN("checkpoint", "Checkpoint verification failed, ignoring: " + path_);
            return std::nullopt;
        }
        return checkpoint;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("checkpoint", "Unreadable checkpoint " + path_ + ": " + e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        LOG_WARN("checkpoint", "Unreadable checkpoint " + path_ + ": " + e.what());
        return std::nullopt;
    }
}

bool CheckpointStore::remove() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_WARN("checkpoint", "Cannot remove checkpoint " + path_ + ": " + ec.message());
        return false;
    }
    return true;
}

bool CheckpointStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

} // namespace Consolidation
} // namespace ACE
