#include <statuscast/status/BroadcastChannel.hpp>

#include <statuscast/util/TimeUtils.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace SC {

auto BroadcastChannel::Create(ResourceKey key, std::size_t max_pending) -> std::shared_ptr<BroadcastChannel> {
    return std::shared_ptr<BroadcastChannel>(new BroadcastChannel(std::move(key), max_pending));
}

BroadcastChannel::BroadcastChannel(ResourceKey key, std::size_t max_pending)
    : key_{std::move(key)}
    , max_pending_{std::max<std::size_t>(max_pending, 2)}
    , current_{StatusPayload::Running()} {}

auto BroadcastChannel::subscribe() -> StatusSubscription {
    SubscriptionId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id              = next_id_++;
        auto subscriber = std::make_shared<SubscriberState>();
        subscriber->pending.push_back(current_);
        subscriber->last_delivery = std::chrono::steady_clock::now();
        subscribers_.emplace(id, std::move(subscriber));
    }
    sc_log("Subscribed " + std::to_string(id) + " to " + key_.to_string(), "Channel", "DEBUG");
    return StatusSubscription{shared_from_this(), id};
}

void BroadcastChannel::enqueue_locked(SubscriberState& subscriber, StatusPayload const& state) {
    if (subscriber.pending.size() >= max_pending_) {
        // Keep an undelivered initial snapshot at the head of the queue.
        auto const drop_index = subscriber.snapshot_delivered ? 0u : 1u;
        subscriber.pending.erase(subscriber.pending.begin() + static_cast<std::ptrdiff_t>(drop_index));
    }
    subscriber.pending.push_back(state);
}

void BroadcastChannel::publish(StatusPayload state) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(state);
    for (auto& [id, subscriber] : subscribers_) {
        enqueue_locked(*subscriber, current_);
        subscriber->ready.notify_one();
    }
}

auto BroadcastChannel::next_event(SubscriptionId id, std::optional<std::chrono::milliseconds> heartbeat_interval)
    -> ChannelEvent {
    std::unique_lock<std::mutex> lock(mutex_);
    auto                         it = subscribers_.find(id);
    if (it == subscribers_.end()) {
        return ClosedEvent{};
    }
    // Holding our own reference keeps the state alive if unsubscribe erases it while we wait.
    auto subscriber = it->second;
    auto has_work   = [&subscriber] { return subscriber->closed || !subscriber->pending.empty(); };

    if (heartbeat_interval) {
        auto const deadline = saturating_deadline(subscriber->last_delivery, *heartbeat_interval);
        if (!subscriber->ready.wait_until(lock, deadline, has_work)) {
            subscriber->last_delivery = std::chrono::steady_clock::now();
            return HeartbeatEvent{};
        }
    } else {
        subscriber->ready.wait(lock, has_work);
    }

    if (!subscriber->pending.empty()) {
        auto event = std::move(subscriber->pending.front());
        subscriber->pending.pop_front();
        subscriber->snapshot_delivered = true;
        subscriber->last_delivery      = std::chrono::steady_clock::now();
        return event;
    }
    return ClosedEvent{};
}

void BroadcastChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = subscribers_.find(id);
    if (it == subscribers_.end()) {
        return;
    }
    it->second->closed = true;
    it->second->pending.clear();
    it->second->ready.notify_all();
    subscribers_.erase(it);
    sc_log("Unsubscribed " + std::to_string(id) + " from " + key_.to_string(), "Channel", "DEBUG");
}

void BroadcastChannel::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, subscriber] : subscribers_) {
        subscriber->closed = true;
        subscriber->pending.clear();
        subscriber->ready.notify_all();
    }
    subscribers_.clear();
}

auto BroadcastChannel::current() const -> StatusPayload {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

auto BroadcastChannel::subscriber_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

StatusSubscription::StatusSubscription(std::shared_ptr<BroadcastChannel> channel, SubscriptionId id)
    : channel_{std::move(channel)}
    , id_{id} {}

StatusSubscription::~StatusSubscription() {
    close();
}

StatusSubscription::StatusSubscription(StatusSubscription&& other) noexcept
    : channel_{std::move(other.channel_)}
    , id_{std::exchange(other.id_, 0)} {
    other.channel_.reset();
}

StatusSubscription& StatusSubscription::operator=(StatusSubscription&& other) noexcept {
    if (this != &other) {
        close();
        channel_ = std::move(other.channel_);
        id_      = std::exchange(other.id_, 0);
        other.channel_.reset();
    }
    return *this;
}

auto StatusSubscription::next_event(std::optional<std::chrono::milliseconds> heartbeat_interval) -> ChannelEvent {
    if (!channel_) {
        return ClosedEvent{};
    }
    return channel_->next_event(id_, heartbeat_interval);
}

void StatusSubscription::close() {
    if (!channel_) {
        return;
    }
    auto channel = std::move(channel_);
    channel_.reset();
    channel->unsubscribe(id_);
}

} // namespace SC
