#pragma once

#include "primitives.hpp"
#include <any>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <cxxabi.h>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace urlform {

enum class Kind {
    Invalid,
    Primitive,
    Time,
    Struct,
    Sequence,
    Map,
    Pointer,
    Unsupported
};

struct TypeInfo;
struct DeclaredField;

// Non-owning view of a value together with its runtime type record.
class ValueRef {
public:
    ValueRef() = default;
    ValueRef(const void* ptr, const TypeInfo* type) : ptr_(ptr), type_(type) {}

    bool valid() const { return ptr_ != nullptr && type_ != nullptr; }
    const void* get() const { return ptr_; }
    const TypeInfo& type() const { return *type_; }
    Kind kind() const;

    // Typed access; throws std::bad_cast when T is not the referenced type
    template <typename T>
    const T& as() const;

private:
    const void* ptr_{nullptr};
    const TypeInfo* type_{nullptr};
};

using ElementVisitor = std::function<void(std::size_t, ValueRef)>;
using EntryVisitor = std::function<void(ValueRef, ValueRef)>;

// Runtime description of one C++ type, built once per type by type_info_of<T>().
// Only the operations matching `kind` are set.
struct TypeInfo {
    TypeInfo(std::type_index type_id, std::string type_name, Kind type_kind)
        : id(type_id), name(std::move(type_name)), kind(type_kind) {}

    std::type_index id;
    std::string name;
    Kind kind;

    std::string (*format)(const void*) = nullptr;
    std::any (*native)(const void*) = nullptr;
    bool (*is_zero)(const void*) = nullptr;
    void (*for_each_element)(const void*, const ElementVisitor&) = nullptr;
    void (*for_each_entry)(const void*, const EntryVisitor&) = nullptr;
    ValueRef (*deref)(const void*) = nullptr;
    void (*describe)(std::vector<DeclaredField>&) = nullptr;
};

inline Kind ValueRef::kind() const {
    return type_ ? type_->kind : Kind::Invalid;
}

template <typename T>
const T& ValueRef::as() const {
    if (!valid() || type_->id != std::type_index(typeid(T))) {
        throw std::bad_cast();
    }
    return *static_cast<const T*>(ptr_);
}

// A field as declared by Reflect<T>::describe, before tag resolution.
struct DeclaredField {
    std::string name;
    std::map<std::string, std::string> tags;
    bool anonymous{false};
    const TypeInfo& (*type)() = nullptr;
    std::function<ValueRef(const void*)> access;

    // Tag value under `key`, empty when absent
    std::string tag(const std::string& key) const {
        auto it = tags.find(key);
        return it != tags.end() ? it->second : std::string();
    }
};

// Specialise with `static void describe(FieldList<T>&)` to make T a struct
// that the encoder can traverse.
template <typename T>
struct Reflect {};

template <typename T>
const TypeInfo& type_info_of();

template <typename T>
ValueRef value_ref(const T& value) {
    return ValueRef(std::addressof(value), &type_info_of<std::remove_cv_t<T>>());
}

// Chained tag setter returned by FieldList; stays valid while the list grows.
class FieldRef {
public:
    FieldRef(std::vector<DeclaredField>& fields, std::size_t index)
        : fields_(fields), index_(index) {}

    FieldRef& tag(const std::string& key, const std::string& value) {
        fields_[index_].tags[key] = value;
        return *this;
    }

private:
    std::vector<DeclaredField>& fields_;
    std::size_t index_;
};

template <typename T>
class FieldList {
public:
    explicit FieldList(std::vector<DeclaredField>& fields) : fields_(fields) {}

    template <typename M>
    FieldRef field(const std::string& name, M T::*member) {
        return add<M>(name, false, [member](const void* owner) {
            return value_ref(static_cast<const T*>(owner)->*member);
        });
    }

    // Anonymous member, expanded into the parent under AnonymousMode::Embed
    template <typename M>
    FieldRef embed(const std::string& name, M T::*member) {
        return add<M>(name, true, [member](const void* owner) {
            return value_ref(static_cast<const T*>(owner)->*member);
        });
    }

    // Base class subobject, treated as an anonymous field
    template <typename Base>
    FieldRef base(const std::string& name) {
        static_assert(std::is_base_of_v<Base, T>, "base<B>() requires B to be a base of T");
        return add<Base>(name, true, [](const void* owner) {
            return value_ref(static_cast<const Base&>(*static_cast<const T*>(owner)));
        });
    }

private:
    template <typename M, typename F>
    FieldRef add(const std::string& name, bool anonymous, F access) {
        DeclaredField field;
        field.name = name;
        field.anonymous = anonymous;
        field.type = &type_info_of<std::remove_cv_t<M>>;
        field.access = std::move(access);
        fields_.push_back(std::move(field));
        return FieldRef(fields_, fields_.size() - 1);
    }

    std::vector<DeclaredField>& fields_;
};

namespace detail {

inline std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> result(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    return (status == 0 && result) ? std::string(result.get()) : std::string(mangled);
}

template <typename T>
struct is_time_point : std::false_type {};

template <typename D>
struct is_time_point<std::chrono::time_point<std::chrono::system_clock, D>> : std::true_type {};

template <typename T>
struct is_smart_pointer : std::false_type {};

template <typename T, typename D>
struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};

template <typename T>
struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
concept Reflected = requires(FieldList<T>& fields) { Reflect<T>::describe(fields); };

template <typename T>
concept TimeLike = is_time_point<T>::value;

template <typename T>
concept PrimitiveLike = StringLike<T> || ScalarLike<T>;

template <typename T>
concept PointerLike = (std::is_pointer_v<T> && !StringLike<T>) ||
                      is_smart_pointer<T>::value || is_optional<T>::value;

template <typename T>
concept MapLike = requires(const T& t) {
    typename T::key_type;
    typename T::mapped_type;
    t.begin();
    t.end();
};

template <typename T>
concept SequenceLike = !StringLike<T> && !MapLike<T> && requires(const T& t) {
    std::begin(t);
    std::end(t);
    std::size(t);
};

template <typename T>
constexpr Kind classify() {
    if constexpr (std::is_same_v<T, std::nullptr_t>) {
        return Kind::Invalid;
    } else if constexpr (TimeLike<T>) {
        return Kind::Time;
    } else if constexpr (PrimitiveLike<T>) {
        return Kind::Primitive;
    } else if constexpr (Reflected<T>) {
        return Kind::Struct;
    } else if constexpr (PointerLike<T>) {
        return Kind::Pointer;
    } else if constexpr (MapLike<T>) {
        return Kind::Map;
    } else if constexpr (SequenceLike<T>) {
        return Kind::Sequence;
    } else {
        return Kind::Unsupported;
    }
}

template <typename T>
bool struct_is_zero(const void* ptr) {
    if constexpr (std::equality_comparable<T> && std::default_initializable<T>) {
        return *static_cast<const T*>(ptr) == T{};
    } else {
        return false;
    }
}

template <typename T>
std::any copy_native(const void* ptr) {
    if constexpr (CharArray<T>) {
        return std::any(char_array_string(static_cast<const char*>(ptr), std::extent_v<T>));
    } else if constexpr (std::is_copy_constructible_v<T>) {
        if constexpr (std::is_same_v<T, const char*> || std::is_same_v<T, char*>) {
            const char* s = *static_cast<const T*>(ptr);
            return std::any(std::string(s ? s : ""));
        } else {
            return std::any(*static_cast<const T*>(ptr));
        }
    } else {
        return std::any();
    }
}

template <typename T>
ValueRef deref_pointer(const void* ptr) {
    const T& holder = *static_cast<const T*>(ptr);
    if constexpr (is_optional<T>::value) {
        if (!holder.has_value()) {
            return ValueRef();
        }
        return value_ref(*holder);
    } else {
        if (!holder) {
            return ValueRef();
        }
        return value_ref(*holder);
    }
}

template <typename T>
TypeInfo make_type_info() {
    constexpr Kind kind = classify<T>();
    TypeInfo info(std::type_index(typeid(T)), demangle(typeid(T).name()), kind);

    // Natives of custom-handled values come from the custom function registry
    if constexpr (CharArray<T>) {
        info.format = [](const void* ptr) {
            return char_array_string(static_cast<const char*>(ptr), std::extent_v<T>);
        };
        info.is_zero = [](const void* ptr) { return *static_cast<const char*>(ptr) == '\0'; };
        info.native = &copy_native<T>;
    } else if constexpr (kind == Kind::Primitive || kind == Kind::Time) {
        info.format = [](const void* ptr) { return to_form_string(*static_cast<const T*>(ptr)); };
        info.is_zero = [](const void* ptr) { return is_zero_value(*static_cast<const T*>(ptr)); };
        info.native = &copy_native<T>;
    } else if constexpr (kind == Kind::Struct) {
        info.is_zero = &struct_is_zero<T>;
        info.describe = [](std::vector<DeclaredField>& fields) {
            FieldList<T> list(fields);
            Reflect<T>::describe(list);
        };
    } else if constexpr (kind == Kind::Pointer) {
        info.is_zero = [](const void* ptr) { return !deref_pointer<T>(ptr).valid(); };
        info.deref = &deref_pointer<T>;
    } else if constexpr (kind == Kind::Sequence) {
        info.is_zero = [](const void* ptr) { return std::size(*static_cast<const T*>(ptr)) == 0; };
        info.for_each_element = [](const void* ptr, const ElementVisitor& visit) {
            std::size_t i = 0;
            for (const auto& element : *static_cast<const T*>(ptr)) {
                visit(i++, value_ref(element));
            }
        };
    } else if constexpr (kind == Kind::Map) {
        info.is_zero = [](const void* ptr) {
            const T& map = *static_cast<const T*>(ptr);
            return map.begin() == map.end();
        };
        info.for_each_entry = [](const void* ptr, const EntryVisitor& visit) {
            for (const auto& [key, value] : *static_cast<const T*>(ptr)) {
                visit(value_ref(key), value_ref(value));
            }
        };
    }

    return info;
}

}  // namespace detail

template <typename T>
const TypeInfo& type_info_of() {
    static const TypeInfo info = detail::make_type_info<T>();
    return info;
}

// Strips pointer-like wrappers; returns an invalid ref when one of them is empty.
inline ValueRef extract(ValueRef value) {
    while (value.valid() && value.kind() == Kind::Pointer) {
        value = value.type().deref(value.get());
    }
    return value;
}

}  // namespace urlform
