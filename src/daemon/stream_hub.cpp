#include "stream_hub.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <print>
#include <ranges>
#include <string_view>

namespace {

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    for (auto part : s | std::views::split(',')) {
        std::string item(part.begin(), part.end());
        auto first = item.find_first_not_of(' ');
        if (first == std::string::npos) continue;
        auto last = item.find_last_not_of(' ');
        out.push_back(item.substr(first, last - first + 1));
    }
    return out;
}

} // namespace

SubscriptionFilter SubscriptionFilter::from_query(const std::string& types,
                                                  const std::string& min_signal,
                                                  const std::string& device_types) {
    SubscriptionFilter f;
    for (const auto& name : split_csv(types)) {
        if (auto t = event_type_from_name(name)) f.wanted_types.insert(*t);
    }
    if (!min_signal.empty()) {
        double v = 0.0;
        auto [ptr, ec] = std::from_chars(min_signal.data(), min_signal.data() + min_signal.size(), v);
        if (ec == std::errc{} && ptr == min_signal.data() + min_signal.size()) f.min_signal_db = v;
    }
    for (auto& dev : split_csv(device_types)) {
        f.device_types.insert(std::move(dev));
    }
    return f;
}

StreamHub::StreamHub(Scheduler& scheduler, Config::Stream config, bool verbose)
    : scheduler_(scheduler), config_(std::move(config)), verbose_(verbose),
      started_at_(scheduler_.now()) {}

StreamHub::~StreamHub() {
    for (auto& [id, sub] : subscriptions_) {
        scheduler_.cancel(sub.heartbeat_timer);
    }
}

std::string StreamHub::subscribe(std::shared_ptr<StreamSink> sink, SubscriptionFilter filter) {
    auto id = next_connection_id();
    auto now = scheduler_.now();

    Subscription sub{
        .connection_id = id,
        .filter = std::move(filter),
        .sink = std::move(sink),
        .connected_at = now,
        .last_progress_at = now,
    };
    sub.last_delivered = sub.sink->delivered();
    sub.heartbeat_timer = scheduler_.schedule_every(
        std::chrono::milliseconds(config_.heartbeat_interval_ms), [this, id] { on_heartbeat(id); });

    auto [it, inserted] = subscriptions_.emplace(id, std::move(sub));
    log(std::format("Stream client {} connected ({} total)", id, subscriptions_.size()));

    StreamEvent hello = ConnectedEvent{.connection_id = id};
    if (deliver(it->second, EventType::Connected, event_payload(hello).dump()) == SinkResult::Closed) {
        evict(id, "closed before connect");
    }
    return id;
}

void StreamHub::unsubscribe(const std::string& connection_id) {
    auto it = subscriptions_.find(connection_id);
    if (it == subscriptions_.end()) return;
    scheduler_.cancel(it->second.heartbeat_timer);
    subscriptions_.erase(it);
    log(std::format("Stream client {} disconnected ({} remaining)", connection_id, subscriptions_.size()));
}

size_t StreamHub::publish(const StreamEvent& event) {
    if (subscriptions_.empty()) return 0;

    auto type = event_type(event);
    auto payload = event_payload(event).dump();

    size_t queued = 0;
    std::vector<std::string> closed;
    for (auto& [id, sub] : subscriptions_) {
        if (!accepts(sub, event, type)) continue;
        switch (deliver(sub, type, payload)) {
            case SinkResult::Queued: ++queued; break;
            case SinkResult::Dropped: break;
            case SinkResult::Closed: closed.push_back(id); break;
        }
    }
    for (const auto& id : closed) evict(id, "connection closed");
    return queued;
}

bool StreamHub::send_to(const std::string& connection_id, const StreamEvent& event) {
    auto it = subscriptions_.find(connection_id);
    if (it == subscriptions_.end()) return false;

    auto result = deliver(it->second, event_type(event), event_payload(event).dump());
    if (result == SinkResult::Closed) {
        evict(connection_id, "connection closed");
        return false;
    }
    return result == SinkResult::Queued;
}

size_t StreamHub::close_all() {
    size_t n = subscriptions_.size();
    for (auto& [id, sub] : subscriptions_) {
        scheduler_.cancel(sub.heartbeat_timer);
        sub.sink->close();
    }
    subscriptions_.clear();
    return n;
}

const Subscription* StreamHub::find(const std::string& connection_id) const {
    auto it = subscriptions_.find(connection_id);
    return it != subscriptions_.end() ? &it->second : nullptr;
}

bool StreamHub::accepts(const Subscription& sub, const StreamEvent& event, EventType type) const {
    if (type == EventType::Connected || type == EventType::Heartbeat) return true;

    const auto& f = sub.filter;
    if (!f.wanted_types.empty() && !f.wanted_types.contains(type)) return false;

    if (const auto* data = std::get_if<SweepDataEvent>(&event)) {
        if (f.min_signal_db && data->sample.peak_power_db < *f.min_signal_db) return false;
        if (!f.device_types.empty() && !f.device_types.contains(data->sample.source)) return false;
        if (config_.spectrum_throttle_ms > 0 && sub.last_sweep_data_at &&
            scheduler_.now() - *sub.last_sweep_data_at <
                std::chrono::milliseconds(config_.spectrum_throttle_ms)) {
            return false;
        }
    }
    return true;
}

SinkResult StreamHub::deliver(Subscription& sub, EventType type, const std::string& payload) {
    auto result = sub.sink->send(std::string(event_name(type)), payload);
    if (result == SinkResult::Queued) {
        auto now = scheduler_.now();
        sub.last_sent_at = now;
        if (type == EventType::SweepData) sub.last_sweep_data_at = now;
    } else if (result == SinkResult::Dropped) {
        if (sub.dropped++ == 0) {
            std::println(stderr, "stream: queue full for {}, dropping events", sub.connection_id);
        }
    }
    return result;
}

void StreamHub::on_heartbeat(const std::string& connection_id) {
    auto it = subscriptions_.find(connection_id);
    if (it == subscriptions_.end()) return;
    auto& sub = it->second;
    auto now = scheduler_.now();

    if (sub.sink->closed()) {
        evict(connection_id, "connection closed");
        return;
    }

    uint64_t delivered = sub.sink->delivered();
    if (delivered != sub.last_delivered) {
        sub.last_delivered = delivered;
        sub.last_progress_at = now;
    } else if (now - sub.last_progress_at >= std::chrono::milliseconds(config_.eviction_timeout_ms())) {
        evict(connection_id, "stale, no delivery progress");
        return;
    }

    auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at_);
    StreamEvent beat = HeartbeatEvent{
        .uptime_ms = static_cast<uint64_t>(uptime.count()),
        .connection_id = connection_id,
    };
    if (deliver(sub, EventType::Heartbeat, event_payload(beat).dump()) == SinkResult::Closed) {
        evict(connection_id, "connection closed");
    }
}

void StreamHub::evict(const std::string& connection_id, const std::string& reason) {
    auto it = subscriptions_.find(connection_id);
    if (it == subscriptions_.end()) return;
    scheduler_.cancel(it->second.heartbeat_timer);
    it->second.sink->close();
    subscriptions_.erase(it);
    log(std::format("Evicted stream client {}: {}", connection_id, reason));
}

std::string StreamHub::next_connection_id() {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return std::format("sse-{}-{}", ms, ++next_id_);
}

void StreamHub::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
