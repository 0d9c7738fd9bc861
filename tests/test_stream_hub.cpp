#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "stream_hub.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

SweepDataEvent sample_at(double peak_db, std::string source = "hackrf") {
    SweepSample s;
    s.hz_low = 100000000.0;
    s.hz_high = 105000000.0;
    s.bin_width_hz = 1000000.0;
    s.power_db = {peak_db};
    s.peak_power_db = peak_db;
    s.peak_frequency_mhz = 100.5;
    s.signal_strength = signal_strength_label(peak_db);
    s.source = std::move(source);
    return SweepDataEvent{.sample = s};
}

} // namespace

TEST_CASE("Stream hub", "[hub]") {
    FakeScheduler sched;
    StreamHub hub(sched, Config::Stream{});

    SECTION("SubscribeSendsConnected") {
        auto sink = std::make_shared<FakeSink>();
        auto id = hub.subscribe(sink);
        REQUIRE(id.starts_with("sse-"));
        REQUIRE(hub.subscriber_count() == 1);
        REQUIRE(sink->sent.size() == 1);
        REQUIRE(sink->sent[0].event == "connected");
        REQUIRE(sink->sent[0].data["connection_id"] == id);
        REQUIRE(sink->sent[0].data.contains("timestamp"));
    }

    SECTION("ConnectionIdsAreUnique") {
        auto a = hub.subscribe(std::make_shared<FakeSink>());
        auto b = hub.subscribe(std::make_shared<FakeSink>());
        REQUIRE(a != b);
    }

    SECTION("PublishFansOut") {
        auto a = std::make_shared<FakeSink>();
        auto b = std::make_shared<FakeSink>();
        hub.subscribe(a);
        hub.subscribe(b);

        size_t n = hub.publish(ErrorEvent{.message = "boom", .kind = "unexpected_exit"});
        REQUIRE(n == 2);
        REQUIRE(a->count("error") == 1);
        REQUIRE(b->last("error")->data["message"] == "boom");
    }

    SECTION("PublishWithoutSubscribers") {
        REQUIRE(hub.publish(ServerResetEvent{.reason = "x"}) == 0);
    }

    SECTION("TypeFilter") {
        auto sink = std::make_shared<FakeSink>();
        hub.subscribe(sink, SubscriptionFilter::from_query("status, error", "", ""));

        hub.publish(StatusEvent{});
        hub.publish(sample_at(-40.0));
        hub.publish(ErrorEvent{.message = "e"});
        REQUIRE(sink->count("status") == 1);
        REQUIRE(sink->count("error") == 1);
        REQUIRE(sink->count("sweep_data") == 0);
        // Connected always goes through
        REQUIRE(sink->count("connected") == 1);
    }

    SECTION("MinSignalFilter") {
        auto sink = std::make_shared<FakeSink>();
        hub.subscribe(sink, SubscriptionFilter::from_query("", "-60", ""));

        hub.publish(sample_at(-75.0));
        sched.advance(100ms);
        hub.publish(sample_at(-45.0));
        REQUIRE(sink->count("sweep_data") == 1);
        REQUIRE(sink->last("sweep_data")->data["power"] == -45.0);
    }

    SECTION("DeviceTypeFilter") {
        auto sink = std::make_shared<FakeSink>();
        hub.subscribe(sink, SubscriptionFilter::from_query("", "", "rtlsdr"));
        hub.publish(sample_at(-40.0));
        REQUIRE(sink->count("sweep_data") == 0);
        // Non-spectrum events are unaffected
        hub.publish(StatusEvent{});
        REQUIRE(sink->count("status") == 1);
    }

    SECTION("SpectrumThrottle") {
        auto sink = std::make_shared<FakeSink>();
        hub.subscribe(sink);
        hub.publish(sample_at(-40.0));
        hub.publish(sample_at(-41.0));
        REQUIRE(sink->count("sweep_data") == 1);

        sched.advance(50ms);
        hub.publish(sample_at(-42.0));
        REQUIRE(sink->count("sweep_data") == 2);
        // Status is never throttled
        hub.publish(StatusEvent{});
        hub.publish(StatusEvent{});
        REQUIRE(sink->count("status") == 2);
    }

    SECTION("Heartbeat") {
        auto sink = std::make_shared<FakeSink>();
        auto id = hub.subscribe(sink);
        sched.advance(15000ms);
        REQUIRE(sink->count("heartbeat") == 1);
        REQUIRE(sink->last("heartbeat")->data["connection_id"] == id);
        REQUIRE(sink->last("heartbeat")->data["uptime_ms"] == 15000);
        sched.advance(30000ms);
        REQUIRE(sink->count("heartbeat") == 3);
    }

    SECTION("StalledClientEvicted") {
        auto stalled = std::make_shared<FakeSink>();
        stalled->auto_deliver = false;
        auto healthy = std::make_shared<FakeSink>();
        auto stalled_id = hub.subscribe(stalled);
        hub.subscribe(healthy);

        sched.advance(45000ms);
        REQUIRE(hub.subscriber_count() == 2);
        sched.advance(15000ms);
        REQUIRE(hub.subscriber_count() == 1);
        REQUIRE_FALSE(hub.find(stalled_id));
        REQUIRE(stalled->close_calls == 1);
        REQUIRE_FALSE(healthy->is_closed);
    }

    SECTION("SlowClientKeepsPublishOrder") {
        auto slow = std::make_shared<FakeSink>();
        slow->auto_deliver = false;
        auto fast = std::make_shared<FakeSink>();
        auto slow_id = hub.subscribe(slow);
        hub.subscribe(fast);

        hub.publish(StatusEvent{.detail = "a"});
        hub.publish(sample_at(-40.0));
        hub.publish(StatusEvent{.detail = "b"});
        hub.publish(ErrorEvent{.message = "e"});
        sched.advance(50ms);
        hub.publish(sample_at(-41.0));
        hub.publish(StatusEvent{.detail = "c"});

        std::vector<std::string> order;
        for (const auto& s : slow->sent) order.push_back(s.event);
        REQUIRE(order == std::vector<std::string>{"connected", "status", "sweep_data", "status", "error",
                                                  "sweep_data", "status"});
        REQUIRE(slow->sent[1].data["detail"] == "a");
        REQUIRE(slow->sent[3].data["detail"] == "b");
        REQUIRE(slow->sent[5].data["power"] == -41.0);
        REQUIRE(slow->sent[6].data["detail"] == "c");

        REQUIRE(fast->sent.size() == slow->sent.size());
        for (size_t i = 0; i < fast->sent.size(); ++i) {
            REQUIRE(fast->sent[i].event == slow->sent[i].event);
        }

        // Catching up before the stall deadline keeps the client
        sched.advance(30000ms);
        slow->delivered_count = slow->sent.size();
        sched.advance(45000ms);
        REQUIRE(hub.find(slow_id));
    }

    SECTION("ClosedSinkDroppedOnPublish") {
        auto sink = std::make_shared<FakeSink>();
        hub.subscribe(sink);
        sink->is_closed = true;
        REQUIRE(hub.publish(StatusEvent{}) == 0);
        REQUIRE(hub.subscriber_count() == 0);
    }

    SECTION("FullQueueDropsButKeepsClient") {
        auto sink = std::make_shared<FakeSink>();
        auto id = hub.subscribe(sink);
        sink->full = true;
        REQUIRE(hub.publish(StatusEvent{}) == 0);
        REQUIRE(hub.subscriber_count() == 1);
        REQUIRE(hub.find(id)->dropped == 1);
    }

    SECTION("SendToOneClient") {
        auto a = std::make_shared<FakeSink>();
        auto b = std::make_shared<FakeSink>();
        auto id = hub.subscribe(a);
        hub.subscribe(b);
        REQUIRE(hub.send_to(id, StatusEvent{.detail = "initial state"}));
        REQUIRE(a->count("status") == 1);
        REQUIRE(b->count("status") == 0);
        REQUIRE_FALSE(hub.send_to("sse-unknown", StatusEvent{}));
    }

    SECTION("Unsubscribe") {
        auto sink = std::make_shared<FakeSink>();
        auto id = hub.subscribe(sink);
        hub.unsubscribe(id);
        REQUIRE(hub.subscriber_count() == 0);
        REQUIRE(sched.timer_count() == 0);
        // Unknown ids are ignored
        hub.unsubscribe(id);
    }

    SECTION("CloseAll") {
        auto a = std::make_shared<FakeSink>();
        auto b = std::make_shared<FakeSink>();
        hub.subscribe(a);
        hub.subscribe(b);
        REQUIRE(hub.close_all() == 2);
        REQUIRE(a->is_closed);
        REQUIRE(b->is_closed);
        REQUIRE(hub.subscriber_count() == 0);
        REQUIRE(sched.timer_count() == 0);
    }
}

TEST_CASE("Subscription filter parsing", "[hub]") {
    auto f = SubscriptionFilter::from_query("sweep_data,status,nonsense", "-72.5", "hackrf, rtlsdr");
    REQUIRE(f.wanted_types == std::set<EventType>{EventType::SweepData, EventType::Status});
    REQUIRE(f.min_signal_db == -72.5);
    REQUIRE(f.device_types == std::set<std::string>{"hackrf", "rtlsdr"});

    auto empty = SubscriptionFilter::from_query("", "loud", "");
    REQUIRE(empty.wanted_types.empty());
    REQUIRE_FALSE(empty.min_signal_db);
    REQUIRE(empty.device_types.empty());
}
