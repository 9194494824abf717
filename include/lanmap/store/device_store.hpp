#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lanmap/model/device.hpp"
#include "lanmap/model/edge.hpp"
#include "lanmap/model/topology_view.hpp"

namespace lanmap::store {

enum class MergeResult {
    Created,
    Updated
};

struct SnapshotResult {
    std::size_t created{0};
    std::size_t updated{0};
};

// Holds the canonical device records. Every operation is total and
// internally synchronised; callers that need a consistent multi-step view take
// snapshot() and work on the copy.
class DeviceStore {
public:
    DeviceStore() = default;

    DeviceStore(const DeviceStore&) = delete;
    DeviceStore& operator=(const DeviceStore&) = delete;

    // Resolves identity by id, then by address. Non-empty incoming fields
    // overwrite, absent ones are kept.
    MergeResult merge(const model::Device& device);
    bool remove(std::string_view id);
    // Merges every entry; devices missing from the snapshot are kept.
    SnapshotResult replace_snapshot(const std::vector<model::Device>& devices);
    void clear();

    model::AggregateCounters counters(const std::vector<model::Edge>& edges = {}) const;

    std::optional<model::Device> find(std::string_view id) const;
    std::optional<model::Device> find_by_address(std::string_view address) const;
    std::vector<model::Device> snapshot() const;
    std::size_t size() const;
    // Incremented only when a mutation actually changed stored data.
    std::uint64_t revision() const;

private:
    MergeResult merge_locked(const model::Device& incoming);
    bool apply_fields_locked(model::Device& target, const model::Device& incoming) const;
    void rekey_locked(const std::string& old_id, const std::string& new_id);
    void absorb_address_holder_locked(const std::string& keeper_id);
    void index_address_locked(const model::Device& device);
    void unindex_address_locked(const std::string& address, const std::string& id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, model::Device> devices_;
    std::unordered_map<std::string, std::string> address_to_id_;
    std::uint64_t revision_{0};
};

}  // namespace lanmap::store
