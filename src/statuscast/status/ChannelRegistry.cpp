#include <statuscast/status/ChannelRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <vector>

namespace SC {

ChannelRegistry::ChannelRegistry(std::size_t max_pending)
    : max_pending_{max_pending} {}

auto ChannelRegistry::get_or_create(ResourceKey const& key) -> std::shared_ptr<BroadcastChannel> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = channels_.find(key);
    if (it != channels_.end()) {
        return it->second;
    }
    auto channel = BroadcastChannel::Create(key, max_pending_);
    channels_.emplace(key, channel);
    sc_log("Created channel " + key.to_string(), "Registry", "DEBUG");
    return channel;
}

auto ChannelRegistry::find(ResourceKey const& key) const -> std::shared_ptr<BroadcastChannel> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = channels_.find(key);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second;
}

auto ChannelRegistry::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

void ChannelRegistry::close_all() {
    std::vector<std::shared_ptr<BroadcastChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.reserve(channels_.size());
        for (auto const& [key, channel] : channels_) {
            channels.push_back(channel);
        }
    }
    for (auto& channel : channels) {
        channel->close_all();
    }
}

} // namespace SC
