#include "agentlink/data/action_store.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace agentlink::data {

nlohmann::json to_json(const PendingAction &action) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        action.timestamp.time_since_epoch())
                        .count();
    return {{"id", action.id},
            {"requestId", action.request_id},
            {"approved", action.approved},
            {"timestamp", static_cast<int64_t>(ms)}};
}

PendingAction pending_action_from_json(const nlohmann::json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("Pending action is not an object");
    }
    if (!j.contains("id") || !j["id"].is_string()) {
        throw std::runtime_error("Pending action missing 'id'");
    }
    if (!j.contains("requestId") || !j["requestId"].is_string()) {
        throw std::runtime_error("Pending action missing 'requestId'");
    }
    if (!j.contains("approved") || !j["approved"].is_boolean()) {
        throw std::runtime_error("Pending action missing 'approved'");
    }
    if (!j.contains("timestamp") || !j["timestamp"].is_number_integer()) {
        throw std::runtime_error("Pending action missing integer 'timestamp'");
    }

    PendingAction action;
    action.id = j["id"].get<std::string>();
    action.request_id = j["requestId"].get<std::string>();
    action.approved = j["approved"].get<bool>();
    action.timestamp = TimePoint(std::chrono::milliseconds(j["timestamp"].get<int64_t>()));
    return action;
}

FileActionStore::FileActionStore(std::string path) : path_(std::move(path)) {}

std::vector<PendingAction> FileActionStore::load() {
    std::ifstream in(path_);
    if (!in) {
        return {};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string text = buffer.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        std::fprintf(stderr, "[OfflineQueue] Ignoring corrupt action store: %s\n", path_.c_str());
        return {};
    }

    std::vector<PendingAction> actions;
    try {
        for (const auto &item : doc) {
            actions.push_back(pending_action_from_json(item));
        }
    } catch (const std::runtime_error &e) {
        std::fprintf(stderr, "[OfflineQueue] Ignoring corrupt action store %s: %s\n",
                     path_.c_str(), e.what());
        return {};
    }
    return actions;
}

void FileActionStore::save(const std::vector<PendingAction> &actions) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto &action : actions) {
        doc.push_back(to_json(action));
    }

    const std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write action store: " + tmp);
        }
        out << doc.dump();
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed writing action store: " + tmp);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace action store " + path_ + ": " + ec.message());
    }
}

} // namespace agentlink::data
