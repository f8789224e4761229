#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace urlform {

// Field error hook - called with the failing path and the error message
using FieldErrorHook = std::function<void(const std::string&, const std::string&)>;

// Struct cached hook - called once per struct type with its name and encoded field count
using StructCachedHook = std::function<void(const std::string&, std::size_t)>;

class HookChain {
public:
    HookChain() = default;

    void add_field_error_hook(FieldErrorHook hook) {
        field_error_hooks_.push_back(std::move(hook));
    }

    void add_struct_cached_hook(StructCachedHook hook) {
        struct_cached_hooks_.push_back(std::move(hook));
    }

    void notify_field_error(const std::string& path, const std::string& message) const {
        for (const auto& hook : field_error_hooks_) {
            hook(path, message);
        }
    }

    void notify_struct_cached(const std::string& type_name, std::size_t field_count) const {
        for (const auto& hook : struct_cached_hooks_) {
            hook(type_name, field_count);
        }
    }

    bool has_field_error_hooks() const {
        return !field_error_hooks_.empty();
    }

    bool has_struct_cached_hooks() const {
        return !struct_cached_hooks_.empty();
    }

private:
    std::vector<FieldErrorHook> field_error_hooks_;
    std::vector<StructCachedHook> struct_cached_hooks_;
};

// Common hook factories

namespace hooks {

// Log every per-field error as "<path>: <message>"
inline FieldErrorHook log_field_errors(std::function<void(const std::string&)> logger) {
    return [logger](const std::string& path, const std::string& message) {
        logger((path.empty() ? std::string("<root>") : path) + ": " + message);
    };
}

// Log each struct type the first time its field table is built
inline StructCachedHook log_struct_cache(std::function<void(const std::string&)> logger) {
    return [logger](const std::string& type_name, std::size_t field_count) {
        logger("cached " + type_name + " (" + std::to_string(field_count) + " fields)");
    };
}

}  // namespace hooks

}  // namespace urlform
