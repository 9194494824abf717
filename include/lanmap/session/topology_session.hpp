#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "lanmap/identity/event_decoder.hpp"
#include "lanmap/layout/layout_engine.hpp"
#include "lanmap/model/topology_view.hpp"
#include "lanmap/store/device_store.hpp"
#include "lanmap/topology/inferencer.hpp"
#include "lanmap/transport/transport_adapter.hpp"

namespace lanmap::session {

struct SessionSettings {
    model::LayoutStrategy strategy{model::LayoutStrategy::Hierarchical};
    layout::Bounds bounds{};
    std::uint32_t seed{layout::LayoutEngine::kDefaultSeed};
};

/**
 * @brief Owns the device store and everything derived from it for one
 * monitoring session.
 *
 * Mutations from the push stream, the pull and direct callers are applied one
 * at a time. Whenever a mutation changes the store, inference and layout run
 * over a copy of the store and a new immutable TopologyView is published to
 * subscribers. Listeners are called outside the mutation lock.
 *
 * stop() is final: input is ignored afterwards, the transport is torn down
 * and late network results are discarded.
 */
class TopologySession {
public:
    using Listener = std::function<void(const model::TopologyView&)>;
    using ListenerId = std::uint64_t;
    using ViewPtr = std::shared_ptr<const model::TopologyView>;

    explicit TopologySession(SessionSettings settings = {});
    ~TopologySession();

    TopologySession(const TopologySession&) = delete;
    TopologySession& operator=(const TopologySession&) = delete;

    void start(transport::TransportSettings settings);
    // Must not be called from a listener running on the transport thread.
    void stop();
    bool accepting() const noexcept { return accepting_.load(); }

    void ingest_message(const nlohmann::json& envelope);
    void ingest_snapshot(const nlohmann::json& body);
    void apply(const identity::Event& event);

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);
    ViewPtr view() const;

    void set_layout_strategy(model::LayoutStrategy strategy);
    void force_resync();
    void reconnect();

    const store::DeviceStore& store() const noexcept { return store_; }

private:
    void apply_locked(const identity::Event& event);
    void rebuild_locked();
    void relayout_locked();
    void on_connection_status(const model::ConnectionStatus& status);
    void publish(ViewPtr view);
    void notify();

    SessionSettings settings_;
    store::DeviceStore store_;
    topology::TopologyInferencer inferencer_;
    layout::LayoutEngine layout_;
    std::unique_ptr<transport::TransportAdapter> transport_;

    std::atomic_bool accepting_{true};
    std::atomic_bool stopped_{false};

    std::mutex mutation_mutex_;
    model::LayoutStrategy strategy_;
    model::ConnectionStatus connection_;
    std::uint64_t built_revision_{0};

    mutable std::mutex view_mutex_;
    ViewPtr view_;

    // Recursive so a listener may feed the session again.
    std::recursive_mutex notify_mutex_;
    ViewPtr last_notified_;

    std::mutex listeners_mutex_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_id_{1};
};

}  // namespace lanmap::session
