#pragma once

#include "custom_funcs.hpp"
#include "encoder_config.hpp"
#include "type_info.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace urlform {

struct CachedField {
    std::string name;
    std::size_t index{0};  // position in the declared field list
    bool anonymous{false};
    bool omit_empty{false};
    const CustomFunc* custom{nullptr};
    std::function<ValueRef(const void*)> access;
};

struct CachedStruct {
    const TypeInfo* type{nullptr};
    std::vector<CachedField> fields;
};

// Per-type field tables, built once on first use and kept for the cache's lifetime.
// Lookups read an immutable snapshot; only misses take the build mutex.
class StructCache {
public:
    explicit StructCache(const EncoderConfig& config)
        : config_(config), structs_(std::make_shared<const Map>()) {}

    StructCache(const StructCache&) = delete;
    StructCache& operator=(const StructCache&) = delete;

    std::shared_ptr<const CachedStruct> get_or_build(const TypeInfo& type) {
        auto snapshot = structs_.load(std::memory_order_acquire);
        auto it = snapshot->find(type.id);
        if (it != snapshot->end()) {
            return it->second;
        }

        std::shared_ptr<const CachedStruct> built;
        {
            std::lock_guard<std::mutex> lock(build_mutex_);

            // Another thread may have built it while we waited
            snapshot = structs_.load(std::memory_order_acquire);
            it = snapshot->find(type.id);
            if (it != snapshot->end()) {
                return it->second;
            }

            built = build(type);

            auto next = std::make_shared<Map>(*snapshot);
            next->emplace(type.id, built);
            structs_.store(std::shared_ptr<const Map>(std::move(next)), std::memory_order_release);
        }

        // Hooks run unlocked so they may encode other types
        if (config_.hooks.has_struct_cached_hooks()) {
            config_.hooks.notify_struct_cached(type.name, built->fields.size());
        }
        return built;
    }

    std::shared_ptr<const CachedStruct> find(std::type_index type) const {
        auto snapshot = structs_.load(std::memory_order_acquire);
        auto it = snapshot->find(type);
        return it != snapshot->end() ? it->second : nullptr;
    }

    std::size_t size() const {
        return structs_.load(std::memory_order_acquire)->size();
    }

private:
    using Map = std::unordered_map<std::type_index, std::shared_ptr<const CachedStruct>>;

    std::shared_ptr<const CachedStruct> build(const TypeInfo& type) const {
        auto cached = std::make_shared<CachedStruct>();
        cached->type = &type;

        std::vector<DeclaredField> declared;
        if (type.describe) {
            type.describe(declared);
        }

        for (std::size_t i = 0; i < declared.size(); ++i) {
            const DeclaredField& field = declared[i];

            std::string name = config_.tag_name_func
                ? config_.tag_name_func(field)
                : field.tag(config_.tag_name);

            if (name == "-") {
                continue;
            }

            if (config_.mode == Mode::Explicit && name.empty()) {
                continue;
            }

            bool omit_empty = false;
            auto comma = name.find(',');
            if (comma != std::string::npos) {
                omit_empty = name.find("omitempty", comma) != std::string::npos;
                name.resize(comma);
            }

            if (name.empty()) {
                name = field.name;
            }

            CachedField cf;
            cf.name = std::move(name);
            cf.index = i;
            cf.anonymous = field.anonymous;
            cf.omit_empty = omit_empty;
            cf.access = field.access;

            const TypeInfo& field_type = field.type();
            if (field_type.kind != Kind::Pointer) {
                cf.custom = config_.custom_funcs.lookup(field_type.id);
            }

            cached->fields.push_back(std::move(cf));
        }

        return cached;
    }

    const EncoderConfig& config_;
    std::atomic<std::shared_ptr<const Map>> structs_;
    std::mutex build_mutex_;
};

}  // namespace urlform
