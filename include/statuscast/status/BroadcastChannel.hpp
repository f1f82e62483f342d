#pragma once

#include <statuscast/status/ResourceKey.hpp>
#include <statuscast/status/StatusPayload.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

#include <parallel_hashmap/phmap.h>

namespace SC {

struct HeartbeatEvent {
    auto operator==(HeartbeatEvent const&) const -> bool = default;
};

struct ClosedEvent {
    auto operator==(ClosedEvent const&) const -> bool = default;
};

using ChannelEvent = std::variant<StatusPayload, HeartbeatEvent, ClosedEvent>;

using SubscriptionId = std::uint64_t;

class StatusSubscription;

/**
 * Last-known-state broadcast channel for a single resource.
 *
 * Every subscriber first receives the state that was current when it
 * subscribed, followed by every later publish in publish order. Each
 * subscription has its own bounded delivery queue. When a queue is full
 * the oldest pending event is dropped, except for an undelivered initial
 * snapshot.
 *
 * All state is guarded by one mutex per channel. Consumers wait on a
 * per-subscription condition variable so a publish wakes every waiter
 * without a shared timer.
 */
class BroadcastChannel : public std::enable_shared_from_this<BroadcastChannel> {
public:
    static constexpr std::size_t kDefaultMaxPending = 64;

    static auto Create(ResourceKey key, std::size_t max_pending = kDefaultMaxPending)
        -> std::shared_ptr<BroadcastChannel>;

    BroadcastChannel(BroadcastChannel const&)            = delete;
    BroadcastChannel& operator=(BroadcastChannel const&) = delete;

    auto subscribe() -> StatusSubscription;
    void publish(StatusPayload state);

    // Blocks until an event is queued, the heartbeat interval elapses since the
    // last delivery, or the subscription is closed. Without an interval the
    // wait only ends on an event or on close.
    auto next_event(SubscriptionId id, std::optional<std::chrono::milliseconds> heartbeat_interval)
        -> ChannelEvent;

    // Idempotent. Wakes a consumer blocked in next_event with ClosedEvent.
    void unsubscribe(SubscriptionId id);

    // Ends every active subscription. Later subscriptions are accepted normally.
    void close_all();

    [[nodiscard]] auto current() const -> StatusPayload;
    [[nodiscard]] auto subscriber_count() const -> std::size_t;
    [[nodiscard]] auto key() const -> ResourceKey const& { return key_; }

private:
    struct SubscriberState {
        std::deque<StatusPayload>             pending;
        std::condition_variable               ready;
        std::chrono::steady_clock::time_point last_delivery;
        bool                                  snapshot_delivered = false;
        bool                                  closed             = false;
    };

    BroadcastChannel(ResourceKey key, std::size_t max_pending);

    void enqueue_locked(SubscriberState& subscriber, StatusPayload const& state);

    ResourceKey       key_;
    std::size_t const max_pending_;

    mutable std::mutex                                                   mutex_;
    StatusPayload                                                        current_;
    phmap::flat_hash_map<SubscriptionId, std::shared_ptr<SubscriberState>> subscribers_;
    SubscriptionId                                                       next_id_ = 1;
};

/**
 * Move-only handle owning one registration on a BroadcastChannel. The
 * registration is released exactly once, by close() or by the destructor,
 * whichever runs first.
 */
class StatusSubscription {
public:
    StatusSubscription() = default;
    StatusSubscription(std::shared_ptr<BroadcastChannel> channel, SubscriptionId id);
    ~StatusSubscription();

    StatusSubscription(StatusSubscription const&)            = delete;
    StatusSubscription& operator=(StatusSubscription const&) = delete;
    StatusSubscription(StatusSubscription&& other) noexcept;
    StatusSubscription& operator=(StatusSubscription&& other) noexcept;

    auto next_event(std::optional<std::chrono::milliseconds> heartbeat_interval = std::nullopt) -> ChannelEvent;
    void close();

    [[nodiscard]] auto id() const -> SubscriptionId { return id_; }
    [[nodiscard]] auto active() const -> bool { return channel_ != nullptr; }
    [[nodiscard]] auto channel() const -> std::shared_ptr<BroadcastChannel> const& { return channel_; }

private:
    std::shared_ptr<BroadcastChannel> channel_;
    SubscriptionId                    id_ = 0;
};

} // namespace SC
