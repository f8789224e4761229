#pragma once

#include <cstddef>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace urlform {

// Rejected root value: nil, or a null pointer-like wrapper
class InvalidEncodeError : public std::invalid_argument {
public:
    InvalidEncodeError()
        : std::invalid_argument("urlform: encode(nil)"), has_type_(false) {}

    explicit InvalidEncodeError(const std::string& type_name)
        : std::invalid_argument("urlform: encode(nil " + type_name + ")"),
          type_name_(type_name),
          has_type_(true) {}

    const std::string& type_name() const { return type_name_; }
    bool has_type() const { return has_type_; }

private:
    std::string type_name_;
    bool has_type_;
};

// Leaf or map key whose type has neither a formatter nor a custom function
class UnsupportedTypeError : public std::runtime_error {
public:
    UnsupportedTypeError(const std::string& what_arg, const std::string& type_name)
        : std::runtime_error(what_arg), type_name_(type_name) {}

    explicit UnsupportedTypeError(const std::string& type_name)
        : UnsupportedTypeError("Unsupported type '" + type_name + "'", type_name) {}

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

class DepthLimitError : public std::runtime_error {
public:
    explicit DepthLimitError(std::size_t limit)
        : std::runtime_error("Maximum nesting depth of " + std::to_string(limit) + " exceeded"),
          limit_(limit) {}

    std::size_t limit() const { return limit_; }

private:
    std::size_t limit_;
};

inline std::string describe_exception(const std::exception_ptr& error) {
    if (!error) {
        return "unknown error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

// Per-path errors collected during one encode call, in the order they occurred
class EncodeErrors {
public:
    struct Entry {
        std::string path;
        std::exception_ptr error;
        std::string message;
    };

    EncodeErrors() = default;

    // Record an error; a later error on the same path replaces the earlier one
    void add(const std::string& path, std::exception_ptr error) {
        std::string message = describe_exception(error);
        auto [it, inserted] = index_.emplace(path, entries_.size());
        if (!inserted) {
            Entry& entry = entries_[it->second];
            entry.error = std::move(error);
            entry.message = std::move(message);
            return;
        }
        entries_.push_back(Entry{path, std::move(error), std::move(message)});
    }

    const Entry* find(std::string_view path) const {
        auto it = index_.find(std::string(path));
        return it != index_.end() ? &entries_[it->second] : nullptr;
    }

    bool contains(std::string_view path) const { return find(path) != nullptr; }

    // Rethrows the original exception recorded for `path`
    void rethrow(std::string_view path) const {
        const Entry* entry = find(path);
        if (entry == nullptr) {
            throw std::out_of_range("No error recorded for path '" + std::string(path) + "'");
        }
        std::rethrow_exception(entry->error);
    }

    std::vector<std::string> paths() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.path);
        }
        return result;
    }

    // One line per failing path
    std::string message() const {
        std::ostringstream out;
        bool first = true;
        for (const auto& entry : entries_) {
            if (!first) {
                out << '\n';
            }
            out << "Field Namespace:" << entry.path << " ERROR:" << entry.message;
            first = false;
        }
        return out.str();
    }

    const std::vector<Entry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    void clear() {
        entries_.clear();
        index_.clear();
    }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;  // path -> position in entries_
};

// Thrown by EncodeResult::throw_if_failed()
class EncodeError : public std::runtime_error {
public:
    explicit EncodeError(EncodeErrors errors)
        : std::runtime_error(errors.message()), errors_(std::move(errors)) {}

    const EncodeErrors& errors() const { return errors_; }

private:
    EncodeErrors errors_;
};

}  // namespace urlform
