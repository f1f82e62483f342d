#include <doctest/doctest.h>

#include <statuscast/status/BroadcastChannel.hpp>
#include <statuscast/status/HeartbeatConfig.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace SC;

namespace {

auto as_status(ChannelEvent const& event) -> StatusPayload const* {
    return std::get_if<StatusPayload>(&event);
}

auto make_channel(std::size_t max_pending = BroadcastChannel::kDefaultMaxPending) {
    return BroadcastChannel::Create(ResourceKey{"default", "api"}, max_pending);
}

} // namespace

TEST_SUITE("status.broadcast_channel") {

TEST_CASE("new channel reports running") {
    auto channel = make_channel();
    CHECK(channel->current() == StatusPayload::Running());
    CHECK(channel->subscriber_count() == 0);
    CHECK(channel->key() == ResourceKey{"default", "api"});
}

TEST_CASE("first event is the state current at subscribe time") {
    auto channel = make_channel();
    channel->publish(StatusPayload::Restarting());

    auto subscription = channel->subscribe();
    auto event        = subscription.next_event();
    auto status       = as_status(event);
    REQUIRE(status != nullptr);
    CHECK(status->state() == StatusState::Restarting);

    SUBCASE("later publishes follow in order") {
        channel->publish(StatusPayload::Failure("boom"));
        channel->publish(StatusPayload::Running());

        auto second = subscription.next_event();
        REQUIRE(as_status(second) != nullptr);
        CHECK(*as_status(second) == StatusPayload::Failure("boom"));

        auto third = subscription.next_event();
        REQUIRE(as_status(third) != nullptr);
        CHECK(*as_status(third) == StatusPayload::Running());
    }
}

TEST_CASE("every subscriber receives every publish") {
    auto channel = make_channel();
    auto first   = channel->subscribe();
    auto second  = channel->subscribe();
    CHECK(channel->subscriber_count() == 2);

    channel->publish(StatusPayload::Restarting());
    channel->publish(StatusPayload::Running());

    for (auto* subscription : {&first, &second}) {
        auto snapshot = subscription->next_event();
        REQUIRE(as_status(snapshot) != nullptr);
        CHECK(*as_status(snapshot) == StatusPayload::Running());

        auto restarting = subscription->next_event();
        REQUIRE(as_status(restarting) != nullptr);
        CHECK(as_status(restarting)->state() == StatusState::Restarting);

        auto running = subscription->next_event();
        REQUIRE(as_status(running) != nullptr);
        CHECK(as_status(running)->state() == StatusState::Running);
    }
}

TEST_CASE("publish wakes a blocked consumer") {
    auto channel      = make_channel();
    auto subscription = channel->subscribe();
    (void)subscription.next_event();

    std::atomic<bool> received{false};
    std::thread       consumer([&] {
        auto event = subscription.next_event();
        if (auto status = as_status(event); status && status->state() == StatusState::Restarting) {
            received.store(true);
        }
    });

    std::this_thread::sleep_for(20ms);
    channel->publish(StatusPayload::Restarting());
    consumer.join();
    CHECK(received.load());
}

TEST_CASE("idle subscription yields a heartbeat after the interval") {
    auto channel      = make_channel();
    auto subscription = channel->subscribe();
    (void)subscription.next_event(100ms);

    auto start   = std::chrono::steady_clock::now();
    auto event   = subscription.next_event(100ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(std::holds_alternative<HeartbeatEvent>(event));
    CHECK(elapsed >= 90ms);
    CHECK(elapsed < 1000ms);
}

TEST_CASE("heartbeats repeat at each interval while idle") {
    auto const interval     = 100ms;
    auto       channel      = make_channel();
    auto       subscription = channel->subscribe();

    auto snapshot = subscription.next_event(interval);
    REQUIRE(as_status(snapshot) != nullptr);

    auto const start = std::chrono::steady_clock::now();
    for (int beat = 1; beat <= 3; ++beat) {
        auto event = subscription.next_event(interval);
        CHECK(std::holds_alternative<HeartbeatEvent>(event));
        auto elapsed = std::chrono::steady_clock::now() - start;
        CHECK(elapsed >= interval * beat - 10ms);
        CHECK(elapsed < interval * beat + 500ms);
    }
}

TEST_CASE("longest accepted interval still waits for a publish") {
    auto config = HeartbeatConfig::FromSeconds(HeartbeatConfig::kMaxIntervalSeconds);
    REQUIRE(config.has_value());

    auto channel      = make_channel();
    auto subscription = channel->subscribe();
    auto snapshot     = subscription.next_event(config->interval());
    REQUIRE(as_status(snapshot) != nullptr);

    std::atomic<bool> returned{false};
    ChannelEvent      result = ClosedEvent{};
    std::thread       consumer([&] {
        result = subscription.next_event(config->interval());
        returned.store(true);
    });

    std::this_thread::sleep_for(100ms);
    CHECK_FALSE(returned.load());
    channel->publish(StatusPayload::Restarting());
    consumer.join();

    REQUIRE(as_status(result) != nullptr);
    CHECK(*as_status(result) == StatusPayload::Restarting());
}

TEST_CASE("a publish postpones the next heartbeat") {
    auto channel      = make_channel();
    auto subscription = channel->subscribe();
    (void)subscription.next_event(150ms);

    std::this_thread::sleep_for(100ms);
    channel->publish(StatusPayload::Restarting());
    auto status = subscription.next_event(150ms);
    REQUIRE(as_status(status) != nullptr);

    auto start   = std::chrono::steady_clock::now();
    auto event   = subscription.next_event(150ms);
    auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(std::holds_alternative<HeartbeatEvent>(event));
    CHECK(elapsed >= 140ms);
}

TEST_CASE("unsubscribe wakes the consumer with closed") {
    auto channel      = make_channel();
    auto subscription = channel->subscribe();
    (void)subscription.next_event();

    ChannelEvent result = HeartbeatEvent{};
    std::thread  consumer([&] { result = channel->next_event(subscription.id(), std::nullopt); });

    std::this_thread::sleep_for(20ms);
    channel->unsubscribe(subscription.id());
    consumer.join();

    CHECK(std::holds_alternative<ClosedEvent>(result));
    CHECK(channel->subscriber_count() == 0);

    // Releasing an already removed registration is harmless.
    channel->unsubscribe(subscription.id());
    subscription.close();
    CHECK_FALSE(subscription.active());
    CHECK(std::holds_alternative<ClosedEvent>(subscription.next_event()));
}

TEST_CASE("unsubscribe while another thread publishes") {
    auto channel  = make_channel();
    auto leaving  = channel->subscribe();
    auto watching = channel->subscribe();
    (void)leaving.next_event();
    (void)watching.next_event();

    auto const leaving_id = leaving.id();

    std::atomic<bool> stop{false};
    std::atomic<int>  published{0};
    std::thread       publisher([&] {
        while (!stop.load()) {
            channel->publish(StatusPayload::Failure(std::to_string(published.fetch_add(1))));
        }
    });

    std::vector<ChannelEvent> drained;
    for (int i = 0; i < 20; ++i) {
        drained.push_back(leaving.next_event(50ms));
    }
    leaving.close();
    auto const published_at_close = published.load();

    while (published.load() < published_at_close + 200) {
        std::this_thread::yield();
    }
    stop.store(true);
    publisher.join();

    CHECK(channel->subscriber_count() == 1);
    CHECK(std::holds_alternative<ClosedEvent>(leaving.next_event(10ms)));
    CHECK(std::holds_alternative<ClosedEvent>(channel->next_event(leaving_id, 10ms)));
    for (auto const& event : drained) {
        CHECK_FALSE(std::holds_alternative<ClosedEvent>(event));
    }

    // The remaining subscriber still sees the latest state.
    channel->publish(StatusPayload::Running());
    ChannelEvent latest = ClosedEvent{};
    for (auto event = watching.next_event(50ms); as_status(event) != nullptr; event = watching.next_event(50ms)) {
        latest = event;
    }
    REQUIRE(as_status(latest) != nullptr);
    CHECK(*as_status(latest) == StatusPayload::Running());
}

TEST_CASE("dropping the subscription releases the registration") {
    auto channel = make_channel();
    {
        auto subscription = channel->subscribe();
        CHECK(channel->subscriber_count() == 1);

        auto moved = std::move(subscription);
        CHECK_FALSE(subscription.active());
        CHECK(moved.active());
        CHECK(channel->subscriber_count() == 1);
    }
    CHECK(channel->subscriber_count() == 0);

    channel->publish(StatusPayload::Restarting());
    CHECK(channel->current() == StatusPayload::Restarting());
}

TEST_CASE("close_all ends every subscription and accepts new ones") {
    auto channel = make_channel();
    auto first   = channel->subscribe();
    auto second  = channel->subscribe();
    (void)first.next_event();

    channel->close_all();
    CHECK(channel->subscriber_count() == 0);
    CHECK(std::holds_alternative<ClosedEvent>(first.next_event()));
    CHECK(std::holds_alternative<ClosedEvent>(second.next_event(50ms)));

    auto late = channel->subscribe();
    CHECK(as_status(late.next_event()) != nullptr);
}

TEST_CASE("full queue drops the oldest update but keeps the snapshot") {
    auto channel      = make_channel(4);
    auto subscription = channel->subscribe();
    for (int i = 1; i <= 10; ++i) {
        channel->publish(StatusPayload::Failure(std::to_string(i)));
    }

    std::vector<StatusPayload> delivered;
    for (int i = 0; i < 4; ++i) {
        auto event = subscription.next_event(50ms);
        REQUIRE(as_status(event) != nullptr);
        delivered.push_back(*as_status(event));
    }
    CHECK(delivered[0] == StatusPayload::Running());
    CHECK(delivered[1] == StatusPayload::Failure("8"));
    CHECK(delivered[2] == StatusPayload::Failure("9"));
    CHECK(delivered[3] == StatusPayload::Failure("10"));

    SUBCASE("after the snapshot the head is dropped") {
        for (int i = 11; i <= 16; ++i) {
            channel->publish(StatusPayload::Failure(std::to_string(i)));
        }
        auto oldest = subscription.next_event(50ms);
        REQUIRE(as_status(oldest) != nullptr);
        CHECK(*as_status(oldest) == StatusPayload::Failure("13"));
    }
}

TEST_CASE("failure payload always carries a message") {
    CHECK(StatusPayload::Failure("").message() == std::optional<std::string>{"unknown error"});
    CHECK_FALSE(StatusPayload::Running().message().has_value());
    CHECK(status_state_name(StatusState::Error) == "error");
    CHECK(status_state_name(StatusState::Restarting) == "restarting");
}

}
