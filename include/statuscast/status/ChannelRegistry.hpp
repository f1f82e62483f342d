#pragma once

#include <statuscast/status/BroadcastChannel.hpp>
#include <statuscast/status/ResourceKey.hpp>

#include <cstddef>
#include <memory>
#include <mutex>

#include <parallel_hashmap/phmap.h>

namespace SC {

/**
 * Process-wide map from resource key to its broadcast channel.
 *
 * Channels are created on first lookup and live until the registry is
 * destroyed. Concurrent first lookups of the same key observe one channel.
 */
class ChannelRegistry {
public:
    explicit ChannelRegistry(std::size_t max_pending = BroadcastChannel::kDefaultMaxPending);

    ChannelRegistry(ChannelRegistry const&)            = delete;
    ChannelRegistry& operator=(ChannelRegistry const&) = delete;

    auto get_or_create(ResourceKey const& key) -> std::shared_ptr<BroadcastChannel>;
    [[nodiscard]] auto find(ResourceKey const& key) const -> std::shared_ptr<BroadcastChannel>;
    [[nodiscard]] auto size() const -> std::size_t;

    // Ends every subscription on every channel; used during shutdown.
    void close_all();

private:
    std::size_t const                                                       max_pending_;
    mutable std::mutex                                                      mutex_;
    phmap::flat_hash_map<ResourceKey, std::shared_ptr<BroadcastChannel>> channels_;
};

} // namespace SC
