#ifndef MCPRT_PROTOCOL_CAPABILITIES_HPP
#define MCPRT_PROTOCOL_CAPABILITIES_HPP

#include "mcprt/protocol/json_rpc.hpp"

#include <array>
#include <map>
#include <optional>
#include <string_view>

namespace mcprt {

// ═══════════════════════════════════════════════════════════════════════════
// Capability keys
// ═══════════════════════════════════════════════════════════════════════════
// Client-side keys: experimental, roots, sampling.
// Server-side keys: experimental, logging, completions, prompts, resources, tools.

enum class CapabilityKey {
    Experimental,
    Roots,
    Sampling,
    Logging,
    Completions,
    Prompts,
    Resources,
    Tools
};

inline constexpr std::array<CapabilityKey, 8> kAllCapabilityKeys{
    CapabilityKey::Experimental,
    CapabilityKey::Roots,
    CapabilityKey::Sampling,
    CapabilityKey::Logging,
    CapabilityKey::Completions,
    CapabilityKey::Prompts,
    CapabilityKey::Resources,
    CapabilityKey::Tools,
};

[[nodiscard]] constexpr std::string_view to_string(CapabilityKey key) noexcept {
    switch (key) {
        case CapabilityKey::Experimental: return "experimental";
        case CapabilityKey::Roots:        return "roots";
        case CapabilityKey::Sampling:     return "sampling";
        case CapabilityKey::Logging:      return "logging";
        case CapabilityKey::Completions:  return "completions";
        case CapabilityKey::Prompts:      return "prompts";
        case CapabilityKey::Resources:    return "resources";
        case CapabilityKey::Tools:        return "tools";
    }
    return "unknown";
}

[[nodiscard]] std::optional<CapabilityKey> capability_key_from_string(std::string_view name) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════
// Each declared key holds an open options object, e.g.
//   tools      -> {"listChanged": true}
//   resources  -> {"subscribe": true, "listChanged": false}

class Capabilities {
public:
    Capabilities() = default;

    /// Declare `key`; options replace any previous options for it.
    Capabilities& set(CapabilityKey key, Json options = Json::object());

    Capabilities& remove(CapabilityKey key);

    [[nodiscard]] bool has(CapabilityKey key) const noexcept;

    /// True when `key` is declared and its `option` is boolean true.
    [[nodiscard]] bool flag(CapabilityKey key, std::string_view option) const;

    /// Null when `key` is not declared.
    [[nodiscard]] const Json* options(CapabilityKey key) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Union of keys; within a shared key, union of option names with
    /// `other`'s value winning.
    Capabilities& merge(const Capabilities& other);

    [[nodiscard]] Json to_json() const;

    /// Unknown keys are skipped; non-object option values are treated as
    /// empty options.
    [[nodiscard]] static Capabilities from_json(const Json& node);

    friend bool operator==(const Capabilities&, const Capabilities&) = default;

private:
    std::map<CapabilityKey, Json> entries_;
};

using ClientCapabilities = Capabilities;
using ServerCapabilities = Capabilities;

}  // namespace mcprt

#endif  // MCPRT_PROTOCOL_CAPABILITIES_HPP
