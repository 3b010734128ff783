#ifndef NFTMART_REGISTRY_HPP
#define NFTMART_REGISTRY_HPP

#include <map>
#include <string>
#include <vector>

#include "types.hpp"

namespace nftmart {

// =============================================================================
// PoolRegistry<T> - (owner, name) -> pool, one registry per owner
//
// An owner's registry is created on its first insert and is never removed;
// only individual pool entries are erased.
// =============================================================================

template <typename T>
class PoolRegistry {
public:
    PoolRegistry() = default;

    // Non-copyable
    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    bool has_registry(const Address& owner) const {
        return registries_.find(owner) != registries_.end();
    }

    // OK, REGISTRY_NOT_FOUND or POOL_NOT_FOUND
    int32_t status(const Address& owner, const std::string& name) const {
        auto reg = registries_.find(owner);
        if (reg == registries_.end()) {
            return errors::REGISTRY_NOT_FOUND;
        }
        if (reg->second.find(name) == reg->second.end()) {
            return errors::POOL_NOT_FOUND;
        }
        return errors::OK;
    }

    bool contains(const Address& owner, const std::string& name) const {
        return status(owner, name) == errors::OK;
    }

    int32_t insert(const Address& owner, const std::string& name, T&& pool) {
        auto& registry = registries_[owner];
        if (registry.find(name) != registry.end()) {
            return errors::POOL_ALREADY_EXISTS;
        }
        registry.emplace(name, std::move(pool));
        return errors::OK;
    }

    T* find(const Address& owner, const std::string& name) {
        auto reg = registries_.find(owner);
        if (reg == registries_.end()) return nullptr;
        auto it = reg->second.find(name);
        return (it != reg->second.end()) ? &it->second : nullptr;
    }

    const T* find(const Address& owner, const std::string& name) const {
        auto reg = registries_.find(owner);
        if (reg == registries_.end()) return nullptr;
        auto it = reg->second.find(name);
        return (it != reg->second.end()) ? &it->second : nullptr;
    }

    int32_t erase(const Address& owner, const std::string& name) {
        int32_t rc = status(owner, name);
        if (rc != errors::OK) {
            return rc;
        }
        registries_[owner].erase(name);
        return errors::OK;
    }

    // Pool names held by an owner, in name order
    std::vector<std::string> names(const Address& owner) const {
        std::vector<std::string> out;
        auto reg = registries_.find(owner);
        if (reg == registries_.end()) return out;
        out.reserve(reg->second.size());
        for (const auto& entry : reg->second) {
            out.push_back(entry.first);
        }
        return out;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& reg : registries_) total += reg.second.size();
        return total;
    }

private:
    std::map<Address, std::map<std::string, T>> registries_;
};

} // namespace nftmart

#endif // NFTMART_REGISTRY_HPP
