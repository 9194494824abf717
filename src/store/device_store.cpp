#include "lanmap/store/device_store.hpp"

#include <algorithm>
#include <utility>

namespace lanmap::store {

namespace {

template <typename T>
bool assign_if_changed(T& target, const T& value) {
    if (target == value) {
        return false;
    }
    target = value;
    return true;
}

bool merge_string(std::string& target, const std::string& incoming) {
    if (incoming.empty()) {
        return false;
    }
    return assign_if_changed(target, incoming);
}

template <typename T>
bool merge_optional(std::optional<T>& target, const std::optional<T>& incoming) {
    if (!incoming) {
        return false;
    }
    return assign_if_changed(target, incoming);
}

bool merge_metrics(nlohmann::json& target, const nlohmann::json& incoming) {
    if (!incoming.is_object() || incoming.empty()) {
        return false;
    }
    if (!target.is_object()) {
        target = nlohmann::json::object();
    }
    bool changed = false;
    for (const auto& [key, value] : incoming.items()) {
        auto it = target.find(key);
        if (it != target.end() && *it == value) {
            continue;
        }
        target[key] = value;
        changed = true;
    }
    return changed;
}

// Copies fields the keeper lacks from a record that is about to be dropped.
void backfill(model::Device& keeper, const model::Device& donor) {
    if (keeper.display_name.empty()) {
        keeper.display_name = donor.display_name;
    }
    if (keeper.mac.empty()) {
        keeper.mac = donor.mac;
    }
    if (keeper.vendor.empty()) {
        keeper.vendor = donor.vendor;
    }
    if (!keeper.kind) {
        keeper.kind = donor.kind;
    }
    if (!keeper.status) {
        keeper.status = donor.status;
    }
    if (!keeper.last_seen) {
        keeper.last_seen = donor.last_seen;
    }
    if (donor.metrics.is_object()) {
        for (const auto& [key, value] : donor.metrics.items()) {
            if (!keeper.metrics.contains(key)) {
                keeper.metrics[key] = value;
            }
        }
    }
}

}  // namespace

MergeResult DeviceStore::merge(const model::Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    return merge_locked(device);
}

SnapshotResult DeviceStore::replace_snapshot(const std::vector<model::Device>& devices) {
    SnapshotResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& device : devices) {
        if (merge_locked(device) == MergeResult::Created) {
            ++result.created;
        } else {
            ++result.updated;
        }
    }
    return result;
}

bool DeviceStore::remove(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(std::string(id));
    if (it == devices_.end()) {
        return false;
    }
    const std::string address = it->second.address;
    const std::string key = it->first;
    devices_.erase(it);
    unindex_address_locked(address, key);
    ++revision_;
    return true;
}

void DeviceStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.empty()) {
        return;
    }
    devices_.clear();
    address_to_id_.clear();
    ++revision_;
}

model::AggregateCounters DeviceStore::counters(const std::vector<model::Edge>& edges) const {
    model::AggregateCounters counters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters.total = devices_.size();
        for (const auto& [_, device] : devices_) {
            if (device.status == model::DeviceStatus::Online) {
                ++counters.online;
            } else if (device.status == model::DeviceStatus::Offline) {
                ++counters.offline;
            }
        }
    }
    counters.active_edges = static_cast<std::size_t>(
        std::count_if(edges.begin(), edges.end(), [](const model::Edge& edge) { return edge.active(); }));
    return counters;
}

std::optional<model::Device> DeviceStore::find(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(std::string(id));
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<model::Device> DeviceStore::find_by_address(std::string_view address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it_id = address_to_id_.find(std::string(address));
    if (it_id == address_to_id_.end()) {
        return std::nullopt;
    }
    auto it_device = devices_.find(it_id->second);
    if (it_device == devices_.end()) {
        return std::nullopt;
    }
    return it_device->second;
}

std::vector<model::Device> DeviceStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::Device> out;
    out.reserve(devices_.size());
    for (const auto& [_, device] : devices_) {
        out.push_back(device);
    }
    std::sort(out.begin(), out.end(), [](const model::Device& a, const model::Device& b) { return a.id < b.id; });
    return out;
}

std::size_t DeviceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

std::uint64_t DeviceStore::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

MergeResult DeviceStore::merge_locked(const model::Device& incoming) {
    std::string match_id;
    if (!incoming.id.empty() && devices_.count(incoming.id) != 0) {
        match_id = incoming.id;
    } else if (!incoming.address.empty()) {
        auto it = address_to_id_.find(incoming.address);
        if (it != address_to_id_.end()) {
            match_id = it->second;
        }
    }

    if (match_id.empty()) {
        model::Device stored = incoming;
        stored.layout_position.reset();
        if (!stored.metrics.is_object()) {
            stored.metrics = nlohmann::json::object();
        }
        const std::string key = stored.id;
        auto it = devices_.emplace(key, std::move(stored)).first;
        index_address_locked(it->second);
        ++revision_;
        return MergeResult::Created;
    }

    auto& target = devices_.at(match_id);
    const std::string previous_address = target.address;
    bool changed = apply_fields_locked(target, incoming);

    if (target.address != previous_address) {
        unindex_address_locked(previous_address, match_id);
        index_address_locked(target);
    }

    // A server-assigned id replaces an address-derived one (or an older server
    // id when the address was matched).
    if (!incoming.provisional_id && !incoming.id.empty() && incoming.id != match_id) {
        rekey_locked(match_id, incoming.id);
        match_id = incoming.id;
        changed = true;
    }

    if (target.address != previous_address || changed) {
        absorb_address_holder_locked(match_id);
    }

    if (changed) {
        ++revision_;
    }
    return MergeResult::Updated;
}

bool DeviceStore::apply_fields_locked(model::Device& target, const model::Device& incoming) const {
    bool changed = false;
    changed |= merge_string(target.address, incoming.address);
    changed |= merge_string(target.display_name, incoming.display_name);
    changed |= merge_string(target.mac, incoming.mac);
    changed |= merge_string(target.vendor, incoming.vendor);
    changed |= merge_optional(target.kind, incoming.kind);
    changed |= merge_optional(target.status, incoming.status);
    changed |= merge_optional(target.last_seen, incoming.last_seen);
    changed |= merge_metrics(target.metrics, incoming.metrics);
    return changed;
}

void DeviceStore::rekey_locked(const std::string& old_id, const std::string& new_id) {
    auto node = devices_.extract(old_id);
    if (node.empty()) {
        return;
    }
    node.key() = new_id;
    node.mapped().id = new_id;
    node.mapped().provisional_id = false;
    devices_.insert(std::move(node));
    for (auto& [address, id] : address_to_id_) {
        if (id == old_id) {
            id = new_id;
        }
    }
}

void DeviceStore::absorb_address_holder_locked(const std::string& keeper_id) {
    auto keeper_it = devices_.find(keeper_id);
    if (keeper_it == devices_.end() || keeper_it->second.address.empty()) {
        return;
    }
    auto& keeper = keeper_it->second;

    // Only address-keyed records are folded; two server ids on one address
    // stay distinct devices.
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (it->first != keeper_id && it->second.provisional_id && it->second.address == keeper.address) {
            backfill(keeper, it->second);
            it = devices_.erase(it);
            ++revision_;
        } else {
            ++it;
        }
    }
    address_to_id_[keeper.address] = keeper_id;
}

void DeviceStore::index_address_locked(const model::Device& device) {
    if (!device.address.empty()) {
        address_to_id_[device.address] = device.id;
    }
}

void DeviceStore::unindex_address_locked(const std::string& address, const std::string& id) {
    if (address.empty()) {
        return;
    }
    auto it = address_to_id_.find(address);
    if (it == address_to_id_.end() || it->second != id) {
        return;
    }
    address_to_id_.erase(it);
    // Another record may still carry the address.
    for (const auto& [other_id, device] : devices_) {
        if (other_id != id && device.address == address) {
            address_to_id_[address] = other_id;
            break;
        }
    }
}

}  // namespace lanmap::store
