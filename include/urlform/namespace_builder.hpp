#pragma once

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>

namespace urlform {

// Builds key paths such as "user.addresses[2].city" in one reusable buffer.
class NamespaceBuilder {
public:
    // Restores the buffer to its length at construction when it goes out of scope
    class Scope {
    public:
        explicit Scope(NamespaceBuilder& ns) : ns_(ns), mark_(ns.size()) {}
        ~Scope() { ns_.truncate(mark_); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        NamespaceBuilder& ns_;
        std::size_t mark_;
    };

    explicit NamespaceBuilder(std::size_t capacity = 64) {
        buffer_.reserve(capacity);
    }

    void push_field(std::string_view name) {
        if (!buffer_.empty()) {
            buffer_.push_back('.');
        }
        buffer_.append(name);
    }

    void push_index(std::size_t index) {
        char digits[24];
        auto result = std::to_chars(digits, digits + sizeof(digits), index);
        buffer_.push_back('[');
        buffer_.append(digits, result.ptr);
        buffer_.push_back(']');
    }

    void push_key(std::string_view key) {
        buffer_.push_back('[');
        buffer_.append(key);
        buffer_.push_back(']');
    }

    void truncate(std::size_t length) {
        if (length < buffer_.size()) {
            buffer_.resize(length);
        }
    }

    // Empties the path but keeps the allocation
    void clear() { buffer_.clear(); }

    std::size_t size() const { return buffer_.size(); }
    bool empty() const { return buffer_.empty(); }
    std::size_t capacity() const { return buffer_.capacity(); }
    std::string str() const { return buffer_; }

private:
    std::string buffer_;
};

}  // namespace urlform
