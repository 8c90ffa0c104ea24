#pragma once

#include "agentlink/clock.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace agentlink::data {

/// A permission decision made while offline, waiting to be sent.
struct PendingAction {
    std::string id; // UUID
    std::string request_id;
    bool approved = false;
    TimePoint timestamp;

    bool operator==(const PendingAction &) const = default;
};

/// {"id", "requestId", "approved", "timestamp"}; timestamp in epoch milliseconds.
nlohmann::json to_json(const PendingAction &action);

/// Throws std::runtime_error on a missing or mistyped field.
PendingAction pending_action_from_json(const nlohmann::json &j);

/// Durable storage for the ordered pending-action list.
class ActionStore {
  public:
    virtual ~ActionStore() = default;

    /// Stored list in insertion order. Missing or empty storage yields an empty list.
    virtual std::vector<PendingAction> load() = 0;

    /// Replace the stored list. Throws std::runtime_error on failure.
    virtual void save(const std::vector<PendingAction> &actions) = 0;
};

/// Stores the list as a JSON array file. save() writes a sibling temp file and
/// renames it over the target. A corrupt file is logged and loads as empty.
class FileActionStore : public ActionStore {
  public:
    explicit FileActionStore(std::string path);

    std::vector<PendingAction> load() override;
    void save(const std::vector<PendingAction> &actions) override;

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace agentlink::data
