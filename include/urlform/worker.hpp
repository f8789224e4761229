#pragma once

#include "custom_funcs.hpp"
#include "encoder_config.hpp"
#include "errors.hpp"
#include "form_values.hpp"
#include "namespace_builder.hpp"
#include "struct_cache.hpp"
#include "type_info.hpp"
#include <any>
#include <cstddef>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace urlform {

// Scratch state and traversal for one encode call. Never shared between threads;
// the pool hands out one worker per call and resets it on return.
class Worker {
public:
    Worker(const EncoderConfig& config, StructCache& cache)
        : config_(config), cache_(cache), namespace_(config.namespace_capacity) {}

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void begin(bool track_columns, NativeValues* natives) {
        track_columns_ = track_columns;
        natives_ = natives;
    }

    // Walk `root`, which must already be extracted
    void encode_root(ValueRef root) {
        namespace_.clear();
        if (root.kind() == Kind::Struct) {
            traverse_struct(root, 0);
        } else {
            set_field_by_type(root, false, nullptr, 0);
        }
    }

    FormValues take_values() { return std::exchange(values_, FormValues()); }
    std::vector<std::string> take_columns() { return std::exchange(columns_, std::vector<std::string>()); }
    EncodeErrors take_errors() { return std::exchange(errors_, EncodeErrors()); }

    // Drop everything from the last call; the key buffer keeps its capacity
    void reset() {
        values_.clear();
        columns_.clear();
        errors_.clear();
        namespace_.clear();
        natives_ = nullptr;
        track_columns_ = false;
    }

    const NamespaceBuilder& key_buffer() const { return namespace_; }

private:
    // Depth counts enclosing structs, sequences and maps below the root
    bool enter(std::size_t depth) {
        if (depth > config_.max_depth) {
            set_error(std::make_exception_ptr(DepthLimitError(config_.max_depth)));
            return false;
        }
        return true;
    }

    void traverse_struct(ValueRef current, std::size_t depth) {
        if (!enter(depth)) {
            return;
        }

        auto cached = cache_.get_or_build(current.type());
        bool embed = config_.anonymous_mode == AnonymousMode::Embed;

        for (const auto& field : cached->fields) {
            ValueRef value = field.access(current.get());

            if (field.anonymous && embed) {
                set_field_by_type(value, field.omit_empty, field.custom, depth);
                continue;
            }

            NamespaceBuilder::Scope scope(namespace_);
            namespace_.push_field(field.name);
            set_field_by_type(value, field.omit_empty, field.custom, depth);
        }
    }

    void set_field_by_type(ValueRef current, bool omit_empty, const CustomFunc* custom,
                           std::size_t depth) {
        if (omit_empty && current.type().is_zero && current.type().is_zero(current.get())) {
            return;
        }

        ValueRef value = extract(current);
        if (!value.valid()) {
            return;
        }

        if (custom == nullptr) {
            custom = config_.custom_funcs.lookup(value.type().id);
        }
        if (custom != nullptr) {
            encode_custom(value, *custom);
            return;
        }

        switch (value.kind()) {
            case Kind::Primitive:
            case Kind::Time:
                encode_primitive(value);
                return;

            case Kind::Struct:
                traverse_struct(value, depth + 1);
                return;

            case Kind::Sequence:
                if (!enter(depth + 1)) {
                    return;
                }
                value.type().for_each_element(value.get(), [&](std::size_t i, ValueRef element) {
                    NamespaceBuilder::Scope scope(namespace_);
                    namespace_.push_index(i);
                    set_field_by_type(element, false, nullptr, depth + 1);
                });
                return;

            case Kind::Map:
                if (!enter(depth + 1)) {
                    return;
                }
                value.type().for_each_entry(value.get(), [&](ValueRef key, ValueRef element) {
                    std::string key_text;
                    if (!map_key(key, key_text)) {
                        return;
                    }
                    NamespaceBuilder::Scope scope(namespace_);
                    namespace_.push_key(key_text);
                    set_field_by_type(element, false, nullptr, depth + 1);
                });
                return;

            case Kind::Unsupported:
                set_error(std::make_exception_ptr(UnsupportedTypeError(value.type().name)));
                return;

            case Kind::Pointer:
            case Kind::Invalid:
            default:
                return;
        }
    }

    // Errors on a key are recorded against the map's own path
    bool map_key(ValueRef key, std::string& out) {
        key = extract(key);
        if (!key.valid()) {
            set_error(std::make_exception_ptr(UnsupportedTypeError("Unsupported map key: null", "null")));
            return false;
        }

        try {
            if (const CustomFunc* fn = config_.custom_funcs.lookup(key.type().id)) {
                out = fn->encode(key);
                return true;
            }
            if (key.kind() == Kind::Primitive || key.kind() == Kind::Time) {
                out = key.type().format(key.get());
                return true;
            }
        } catch (...) {
            set_error(std::current_exception());
            return false;
        }

        set_error(std::make_exception_ptr(UnsupportedTypeError(
            "Unsupported map key type '" + key.type().name + "'", key.type().name)));
        return false;
    }

    void encode_custom(ValueRef value, const CustomFunc& fn) {
        std::string text;
        try {
            text = fn.encode(value);
        } catch (...) {
            set_error(std::current_exception());
            return;
        }
        set_value(std::move(text), value, fn.native);
    }

    void encode_primitive(ValueRef value) {
        std::string text;
        try {
            text = value.type().format(value.get());
        } catch (...) {
            set_error(std::current_exception());
            return;
        }
        set_value(std::move(text), value, value.type().native);
    }

    void set_value(std::string text, ValueRef original, std::any (*native)(const void*)) {
        std::string key = namespace_.str();

        if (track_columns_ && !values_.has(key)) {
            columns_.push_back(key);
        }
        values_.add(key, text);

        if (natives_ != nullptr && native != nullptr) {
            std::any copy = native(original.get());
            if (copy.has_value()) {
                (*natives_)[key] = std::move(copy);
            }
        }
    }

    void set_error(std::exception_ptr error) {
        std::string path = namespace_.str();
        errors_.add(path, error);
        if (config_.hooks.has_field_error_hooks()) {
            config_.hooks.notify_field_error(path, describe_exception(error));
        }
    }

    const EncoderConfig& config_;
    StructCache& cache_;

    FormValues values_;
    std::vector<std::string> columns_;
    EncodeErrors errors_;
    NamespaceBuilder namespace_;
    NativeValues* natives_{nullptr};
    bool track_columns_{false};
};

}  // namespace urlform
