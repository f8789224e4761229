#pragma once

#include "encoder_config.hpp"
#include "errors.hpp"
#include "form_values.hpp"
#include "struct_cache.hpp"
#include "type_info.hpp"
#include "worker_pool.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace urlform {

struct EncodeResult {
    FormValues values;
    std::vector<std::string> columns;  // only filled by encode_with_columns
    EncodeErrors errors;

    bool ok() const { return errors.empty(); }

    void throw_if_failed() const {
        if (!errors.empty()) {
            throw EncodeError(errors);
        }
    }
};

namespace detail {

// Owns everything shared by copies of one Encoder; never moves once created
struct EncoderState {
    explicit EncoderState(EncoderConfig cfg)
        : config(std::move(cfg)), cache(config), pool(config, cache) {}

    const EncoderConfig config;
    StructCache cache;
    WorkerPool pool;
};

}  // namespace detail

class Encoder {
public:
    Encoder() : Encoder(EncoderConfig{}) {}

    explicit Encoder(EncoderConfig config)
        : state_(std::make_shared<detail::EncoderState>(std::move(config))) {}

    // Throws InvalidEncodeError for a nil or null pointer-like root
    template <typename T>
    EncodeResult encode(const T& value) const {
        return run(root_of(value), false, nullptr);
    }

    // Also stores each leaf's original value in `natives`, keyed by path
    template <typename T>
    EncodeResult encode(const T& value, NativeValues& natives) const {
        return run(root_of(value), false, &natives);
    }

    // Also reports the first-seen order of keys in `columns`
    template <typename T>
    EncodeResult encode_with_columns(const T& value) const {
        return run(root_of(value), true, nullptr);
    }

    const EncoderConfig& config() const { return state_->config; }
    WorkerPool::Stats pool_stats() const { return state_->pool.get_stats(); }
    std::size_t cached_struct_count() const { return state_->cache.size(); }

private:
    template <typename T>
    static ValueRef root_of(const T& value) {
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            throw InvalidEncodeError();
        } else {
            ValueRef root = extract(value_ref(value));
            if (!root.valid() || root.kind() == Kind::Invalid) {
                throw InvalidEncodeError(type_info_of<std::remove_cv_t<T>>().name);
            }
            return root;
        }
    }

    EncodeResult run(ValueRef root, bool with_columns, NativeValues* natives) const {
        auto worker = state_->pool.acquire();
        worker->begin(with_columns, natives);
        worker->encode_root(root);

        EncodeResult result;
        result.values = worker->take_values();
        result.columns = worker->take_columns();
        result.errors = worker->take_errors();
        return result;
    }

    std::shared_ptr<detail::EncoderState> state_;
};

// Collects configuration, then freezes it into an Encoder
class EncoderBuilder {
public:
    EncoderBuilder() = default;

    // Default is "form"
    EncoderBuilder& set_tag_name(const std::string& tag_name) {
        config_.tag_name = tag_name;
        return *this;
    }

    // Default is Mode::Implicit
    EncoderBuilder& set_mode(Mode mode) {
        config_.mode = mode;
        return *this;
    }

    // Default is AnonymousMode::Embed
    EncoderBuilder& set_anonymous_mode(AnonymousMode mode) {
        config_.anonymous_mode = mode;
        return *this;
    }

    // Once set, the tag name is ignored and every field name comes from `fn`.
    // Results are cached per type, so `fn` must return the same name every time.
    EncoderBuilder& register_tag_name_func(TagNameFunc fn) {
        config_.tag_name_func = std::move(fn);
        return *this;
    }

    template <typename... Ts>
    EncoderBuilder& register_func(const EncodeFunc& fn) {
        config_.custom_funcs.add<Ts...>(fn);
        return *this;
    }

    template <typename T, typename F>
    EncoderBuilder& register_type_func(F fn) {
        config_.custom_funcs.add_typed<T>(std::move(fn));
        return *this;
    }

    EncoderBuilder& set_max_depth(std::size_t max_depth) {
        config_.max_depth = max_depth;
        return *this;
    }

    EncoderBuilder& set_max_idle_workers(std::size_t max_idle) {
        config_.max_idle_workers = max_idle;
        return *this;
    }

    EncoderBuilder& on_field_error(FieldErrorHook hook) {
        config_.hooks.add_field_error_hook(std::move(hook));
        return *this;
    }

    EncoderBuilder& on_struct_cached(StructCachedHook hook) {
        config_.hooks.add_struct_cached_hook(std::move(hook));
        return *this;
    }

    const EncoderConfig& config() const { return config_; }

    Encoder build() const {
        return Encoder(config_);
    }

private:
    EncoderConfig config_;
};

}  // namespace urlform
