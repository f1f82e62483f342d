#pragma once

#include <cstddef>
#include <string>

#include <parallel_hashmap/phmap_utils.h>

namespace SC {

/**
 * Identifies one managed workload. For orchestrated tabs this is the
 * (namespace, deployment) pair; static tabs use ("tabs", "<index>").
 *
 * Two keys are equal when both components are equal. The key is used both for
 * channel lookup and for restart deduplication.
 */
struct ResourceKey {
    std::string scope;
    std::string name;

    auto operator==(ResourceKey const&) const -> bool = default;

    [[nodiscard]] auto to_string() const -> std::string {
        return scope + "/" + name;
    }

    friend auto hash_value(ResourceKey const& key) -> std::size_t {
        return phmap::HashState().combine(0, key.scope, key.name);
    }
};

} // namespace SC
