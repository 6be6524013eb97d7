#include "mcprt/protocol/capabilities.hpp"

namespace mcprt {

std::optional<CapabilityKey> capability_key_from_string(std::string_view name) noexcept {
    for (const CapabilityKey key : kAllCapabilityKeys) {
        if (to_string(key) == name) {
            return key;
        }
    }
    return std::nullopt;
}

Capabilities& Capabilities::set(CapabilityKey key, Json options) {
    if (options.is_object() == false) {
        options = Json::object();
    }
    entries_[key] = std::move(options);
    return *this;
}

Capabilities& Capabilities::remove(CapabilityKey key) {
    entries_.erase(key);
    return *this;
}

bool Capabilities::has(CapabilityKey key) const noexcept {
    return entries_.contains(key);
}

bool Capabilities::flag(CapabilityKey key, std::string_view option) const {
    const Json* opts = options(key);
    if (opts == nullptr) {
        return false;
    }
    const auto it = opts->find(std::string(option));
    return (it != opts->end()) && it->is_boolean() && it->get<bool>();
}

const Json* Capabilities::options(CapabilityKey key) const noexcept {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

Capabilities& Capabilities::merge(const Capabilities& other) {
    for (const auto& [key, options] : other.entries_) {
        auto [slot, inserted] = entries_.try_emplace(key, options);
        if (inserted) {
            continue;
        }
        for (const auto& [name, value] : options.items()) {
            slot->second[name] = value;
        }
    }
    return *this;
}

Json Capabilities::to_json() const {
    Json node = Json::object();
    for (const auto& [key, options] : entries_) {
        node[std::string(to_string(key))] = options;
    }
    return node;
}

Capabilities Capabilities::from_json(const Json& node) {
    Capabilities caps;
    if (node.is_object() == false) {
        return caps;
    }
    for (const auto& [name, value] : node.items()) {
        const auto key = capability_key_from_string(name);
        if (!key) {
            continue;
        }
        caps.set(*key, value);
    }
    return caps;
}

}  // namespace mcprt
