#pragma once

#include "vconf/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace vconf {

/**
 * @brief Typed handle into a ResourceTable
 *
 * The representation is the table slot. A handle is valid until the
 * resource is taken or removed; stale handles are never reused.
 */
template<typename T>
struct Resource {
    uint32_t rep = 0;

    bool operator==(const Resource& other) const { return rep == other.rep; }
    bool operator!=(const Resource& other) const { return rep != other.rep; }
};

/**
 * @brief Owner of guest-visible resources
 *
 * Lookups check both the slot and the stored type, so a handle of the
 * wrong type fails the same way a stale one does.
 */
class ResourceTable {
public:
    ResourceTable() = default;
    ResourceTable(const ResourceTable&) = delete;
    ResourceTable& operator=(const ResourceTable&) = delete;
    ResourceTable(ResourceTable&&) = default;
    ResourceTable& operator=(ResourceTable&&) = default;

    template<typename T>
    Resource<T> push(T value) {
        uint32_t rep = next_rep_++;
        entries_.emplace(rep, std::make_unique<TypedEntry<T>>(std::move(value)));
        return Resource<T>{rep};
    }

    template<typename T>
    Result<T*> get(Resource<T> handle) {
        auto* entry = find<T>(handle);
        if (!entry) return Result<T*>::err(not_found<T>(handle));
        return Result<T*>::ok(&entry->value);
    }

    // Remove the resource and hand its value to the caller
    template<typename T>
    Result<T> take(Resource<T> handle) {
        auto* entry = find<T>(handle);
        if (!entry) return Result<T>::err(not_found<T>(handle));
        T value = std::move(entry->value);
        entries_.erase(handle.rep);
        return Result<T>::ok(std::move(value));
    }

    template<typename T>
    Result<void> remove(Resource<T> handle) {
        if (!find<T>(handle)) return Result<void>::err(not_found<T>(handle));
        entries_.erase(handle.rep);
        return Result<void>::ok();
    }

    template<typename T>
    bool contains(Resource<T> handle) const {
        auto it = entries_.find(handle.rep);
        return it != entries_.end() && dynamic_cast<const TypedEntry<T>*>(it->second.get()) != nullptr;
    }

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        virtual ~Entry() = default;
    };

    template<typename T>
    struct TypedEntry : Entry {
        explicit TypedEntry(T v) : value(std::move(v)) {}
        T value;
    };

    template<typename T>
    TypedEntry<T>* find(Resource<T> handle) {
        auto it = entries_.find(handle.rep);
        if (it == entries_.end()) return nullptr;
        return dynamic_cast<TypedEntry<T>*>(it->second.get());
    }

    template<typename T>
    Error not_found(Resource<T> handle) const {
        return Error(ErrorCode::RESOURCE_NOT_FOUND,
                     "no resource of type " + std::string(typeid(T).name()) +
                     " with handle " + std::to_string(handle.rep));
    }

    // 0 is never handed out
    uint32_t next_rep_ = 1;
    std::unordered_map<uint32_t, std::unique_ptr<Entry>> entries_;
};

} // namespace vconf
