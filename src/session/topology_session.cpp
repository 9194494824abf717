#include "lanmap/session/topology_session.hpp"

#include <utility>
#include <vector>

#include "lanmap/util/logging.hpp"

namespace lanmap::session {

using model::TopologyView;

namespace {

std::shared_ptr<TopologyView> empty_view(model::LayoutStrategy strategy) {
    auto view = std::make_shared<TopologyView>();
    view->strategy = strategy;
    return view;
}

}  // namespace

TopologySession::TopologySession(SessionSettings settings)
    : settings_(settings),
      layout_(settings.seed),
      strategy_(settings.strategy),
      view_(empty_view(settings.strategy)) {}

TopologySession::~TopologySession() {
    stop();
}

void TopologySession::start(transport::TransportSettings settings) {
    if (stopped_) {
        util::log::warn("Session already stopped; start() ignored");
        return;
    }
    if (transport_) {
        util::log::warn("Session transport already started");
        return;
    }

    transport_ = std::make_unique<transport::TransportAdapter>(std::move(settings));
    transport_->set_message_handler([this](const nlohmann::json& message) { ingest_message(message); });
    transport_->set_snapshot_handler([this](const nlohmann::json& body) { ingest_snapshot(body); });
    transport_->set_status_handler(
        [this](const model::ConnectionStatus& status) { on_connection_status(status); });

    const auto& push = transport_->settings().push;
    const auto& pull = transport_->settings().pull;
    util::log::info("Session starting: push ws://" + push.host + ":" + push.port + push.endpoint + ", pull http://" +
                    pull.host + ":" + pull.port + pull.target);
    transport_->start();
}

void TopologySession::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    accepting_ = false;

    if (transport_) {
        transport_->stop();
    }
    {
        std::lock_guard lock(mutation_mutex_);
        store_.clear();
        built_revision_ = store_.revision();
        connection_ = {};
        publish(empty_view(strategy_));
    }
    {
        std::lock_guard lock(listeners_mutex_);
        listeners_.clear();
    }
    util::log::info("Topology session stopped");
}

void TopologySession::ingest_message(const nlohmann::json& envelope) {
    if (!accepting_) {
        return;
    }
    apply(identity::decode_message(envelope));
}

void TopologySession::ingest_snapshot(const nlohmann::json& body) {
    if (!accepting_) {
        return;
    }
    auto snapshot = identity::decode_snapshot(body);
    if (!snapshot) {
        util::log::warn("Pulled document has no device list; ignored");
        return;
    }
    apply(identity::Event{std::move(*snapshot)});
}

void TopologySession::apply(const identity::Event& event) {
    {
        std::lock_guard lock(mutation_mutex_);
        if (!accepting_) {
            return;
        }
        apply_locked(event);
        if (store_.revision() == built_revision_) {
            return;
        }
        rebuild_locked();
    }
    notify();
}

TopologySession::ListenerId TopologySession::subscribe(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    const auto id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void TopologySession::unsubscribe(ListenerId id) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.erase(id);
}

TopologySession::ViewPtr TopologySession::view() const {
    std::lock_guard lock(view_mutex_);
    return view_;
}

void TopologySession::set_layout_strategy(model::LayoutStrategy strategy) {
    {
        std::lock_guard lock(mutation_mutex_);
        if (!accepting_ || strategy == strategy_) {
            return;
        }
        strategy_ = strategy;
        relayout_locked();
    }
    util::log::info("Layout strategy set to " + std::string(model::to_string(strategy)));
    notify();
}

void TopologySession::force_resync() {
    if (!accepting_ || !transport_) {
        util::log::debug("Resync requested without an active transport");
        return;
    }
    transport_->request_pull();
}

void TopologySession::reconnect() {
    if (!accepting_ || !transport_) {
        util::log::debug("Reconnect requested without an active transport");
        return;
    }
    transport_->reconnect();
}

void TopologySession::apply_locked(const identity::Event& event) {
    if (const auto* sighted = std::get_if<identity::DeviceSighted>(&event)) {
        const auto result = store_.merge(sighted->device);
        util::log::debug(std::string(result == store::MergeResult::Created ? "Added" : "Updated") + " device " +
                         sighted->device.id);
    } else if (const auto* removed = std::get_if<identity::DeviceRemoved>(&event)) {
        bool erased = !removed->id.empty() && store_.remove(removed->id);
        if (!erased && !removed->address.empty()) {
            if (auto holder = store_.find_by_address(removed->address)) {
                erased = store_.remove(holder->id);
            }
        }
        if (!erased) {
            util::log::debug("Removal for unknown device " + (removed->id.empty() ? removed->address : removed->id));
        }
    } else if (const auto* snapshot = std::get_if<identity::SnapshotReceived>(&event)) {
        const auto result = store_.replace_snapshot(snapshot->devices);
        util::log::debug("Snapshot merged: " + std::to_string(result.created) + " new, " +
                         std::to_string(result.updated) + " updated, " + std::to_string(snapshot->rejected) +
                         " rejected");
    } else if (const auto* unknown = std::get_if<identity::UnrecognizedEvent>(&event)) {
        util::log::debug("Dropped event '" + unknown->type + "': " + unknown->reason);
    }
}

void TopologySession::rebuild_locked() {
    auto devices = store_.snapshot();
    auto report = inferencer_.analyze(devices);

    auto next = std::make_shared<TopologyView>();
    next->devices = layout_.position(std::move(devices), strategy_, settings_.bounds);
    next->counters = store_.counters(report.edges);
    next->edges = std::move(report.edges);
    next->groups = std::move(report.groups);
    next->connection = connection_;
    next->strategy = strategy_;
    next->revision = store_.revision();

    built_revision_ = next->revision;
    publish(std::move(next));
}

void TopologySession::relayout_locked() {
    auto next = std::make_shared<TopologyView>(*view());
    next->devices = layout_.position(std::move(next->devices), strategy_, settings_.bounds);
    next->strategy = strategy_;
    publish(std::move(next));
}

void TopologySession::on_connection_status(const model::ConnectionStatus& status) {
    {
        std::lock_guard lock(mutation_mutex_);
        if (!accepting_) {
            return;
        }
        connection_ = status;
        auto next = std::make_shared<TopologyView>(*view());
        next->connection = status;
        publish(std::move(next));
    }
    notify();
}

void TopologySession::publish(ViewPtr view) {
    std::lock_guard lock(view_mutex_);
    view_ = std::move(view);
}

void TopologySession::notify() {
    std::lock_guard notify_lock(notify_mutex_);
    auto current = view();
    if (current == last_notified_) {
        return;
    }
    last_notified_ = current;

    std::vector<Listener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [_, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        // A re-entrant update already delivered a newer view.
        if (last_notified_ != current) {
            break;
        }
        try {
            listener(*current);
        } catch (const std::exception& ex) {
            util::log::warn(std::string("View listener failed: ") + ex.what());
        }
    }
}

}  // namespace lanmap::session
