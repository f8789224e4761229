#pragma once

#include "type_info.hpp"
#include <any>
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace urlform {

// Converts a value to its form string; throws to report a per-field error
using EncodeFunc = std::function<std::string(const ValueRef&)>;

// A registered function with the copier used for the native side channel
struct CustomFunc {
    EncodeFunc encode;
    std::any (*native)(const void*) = nullptr;
};

// Exact-type overrides consulted before the default handling of any value
class CustomFuncRegistry {
public:
    CustomFuncRegistry() = default;

    // Register one function for every type in Ts
    template <typename... Ts>
    void add(const EncodeFunc& fn) {
        (funcs_.insert_or_assign(std::type_index(typeid(std::remove_cvref_t<Ts>)),
                                 CustomFunc{fn, &detail::copy_native<std::remove_cvref_t<Ts>>}),
         ...);
    }

    // Register a function taking the concrete type
    template <typename T, typename F>
    void add_typed(F fn) {
        add<T>([fn = std::move(fn)](const ValueRef& value) -> std::string {
            return fn(value.as<std::remove_cvref_t<T>>());
        });
    }

    const CustomFunc* lookup(std::type_index type) const {
        auto it = funcs_.find(type);
        return it != funcs_.end() ? &it->second : nullptr;
    }

    bool contains(std::type_index type) const { return funcs_.count(type) > 0; }
    bool empty() const { return funcs_.empty(); }
    std::size_t size() const { return funcs_.size(); }

private:
    std::unordered_map<std::type_index, CustomFunc> funcs_;
};

}  // namespace urlform
