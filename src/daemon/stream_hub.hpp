#pragma once

#include "config.hpp"
#include "platform/scheduler.hpp"
#include "platform/stream_sink.hpp"
#include "stream_event.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct SubscriptionFilter {
    // Empty means every type.
    std::set<EventType> wanted_types;
    std::optional<double> min_signal_db;
    std::set<std::string> device_types;

    // Parses the stream query parameters: "types=a,b", "min_signal=-60",
    // "device_types=hackrf". Unknown type names are ignored.
    static SubscriptionFilter from_query(const std::string& types, const std::string& min_signal,
                                         const std::string& device_types);
};

struct Subscription {
    std::string connection_id;
    SubscriptionFilter filter;
    std::shared_ptr<StreamSink> sink;
    Scheduler::Clock::time_point connected_at;
    std::optional<Scheduler::Clock::time_point> last_sent_at;
    std::optional<Scheduler::Clock::time_point> last_sweep_data_at;
    Scheduler::Clock::time_point last_progress_at;
    uint64_t last_delivered = 0;
    uint64_t dropped = 0;
    Scheduler::TimerId heartbeat_timer = Scheduler::kInvalidTimer;
};

// Fan-out of typed events to streaming subscribers. Scheduler thread only.
class StreamHub {
public:
    StreamHub(Scheduler& scheduler, Config::Stream config, bool verbose = false);
    ~StreamHub();

    StreamHub(const StreamHub&) = delete;
    StreamHub& operator=(const StreamHub&) = delete;

    // Registers the sink and sends it Connected. Returns the connection id.
    std::string subscribe(std::shared_ptr<StreamSink> sink, SubscriptionFilter filter = {});
    void unsubscribe(const std::string& connection_id);

    // Returns the number of subscribers the event was queued for.
    size_t publish(const StreamEvent& event);
    bool send_to(const std::string& connection_id, const StreamEvent& event);

    // Closes and drops every subscriber; returns how many there were.
    size_t close_all();

    size_t subscriber_count() const { return subscriptions_.size(); }
    const Subscription* find(const std::string& connection_id) const;

private:
    bool accepts(const Subscription& sub, const StreamEvent& event, EventType type) const;
    SinkResult deliver(Subscription& sub, EventType type, const std::string& payload);
    void on_heartbeat(const std::string& connection_id);
    void evict(const std::string& connection_id, const std::string& reason);
    std::string next_connection_id();
    void log(const std::string& msg);

    Scheduler& scheduler_;
    Config::Stream config_;
    bool verbose_;
    Scheduler::Clock::time_point started_at_;
    uint64_t next_id_ = 0;
    std::map<std::string, Subscription> subscriptions_;
};
