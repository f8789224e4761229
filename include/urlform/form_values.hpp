#pragma once

#include <any>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace urlform {

// Form encoding of a single key or value: unreserved characters are kept,
// space becomes '+', everything else is percent-encoded
inline std::string url_encode(std::string_view value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

inline std::string url_decode(std::string_view value) {
    std::string result;
    result.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= value.size()) {
                throw std::invalid_argument("Truncated percent escape in '" + std::string(value) + "'");
            }
            auto hex = [&](char h) -> int {
                if (h >= '0' && h <= '9') return h - '0';
                if (h >= 'a' && h <= 'f') return h - 'a' + 10;
                if (h >= 'A' && h <= 'F') return h - 'A' + 10;
                throw std::invalid_argument("Invalid percent escape in '" + std::string(value) + "'");
            };
            result.push_back(static_cast<char>(hex(value[i + 1]) * 16 + hex(value[i + 2])));
            i += 2;
        } else {
            result.push_back(c);
        }
    }

    return result;
}

// Encoded form: each key maps to the ordered list of its values
class FormValues {
public:
    using Storage = std::map<std::string, std::vector<std::string>>;

    FormValues() = default;

    // Append a value to a key
    FormValues& add(const std::string& key, const std::string& value) {
        fields_[key].push_back(value);
        return *this;
    }

    // Replace all values of a key
    FormValues& set(const std::string& key, const std::string& value) {
        fields_[key] = {value};
        return *this;
    }

    // First value of a key, empty when absent
    std::string get(const std::string& key) const {
        auto it = fields_.find(key);
        if (it == fields_.end() || it->second.empty()) {
            return "";
        }
        return it->second.front();
    }

    const std::vector<std::string>* find(const std::string& key) const {
        auto it = fields_.find(key);
        return it != fields_.end() ? &it->second : nullptr;
    }

    bool has(const std::string& key) const {
        return fields_.count(key) > 0;
    }

    void erase(const std::string& key) {
        fields_.erase(key);
    }

    // Encode to application/x-www-form-urlencoded, keys in sorted order
    std::string encode() const {
        std::ostringstream result;
        bool first = true;

        for (const auto& [key, values] : fields_) {
            std::string encoded_key = url_encode(key);
            for (const auto& value : values) {
                if (!first) {
                    result << '&';
                }
                result << encoded_key << '=' << url_encode(value);
                first = false;
            }
        }

        return result.str();
    }

    static std::string content_type() {
        return "application/x-www-form-urlencoded";
    }

    const Storage& fields() const { return fields_; }
    Storage::const_iterator begin() const { return fields_.begin(); }
    Storage::const_iterator end() const { return fields_.end(); }
    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    void clear() { fields_.clear(); }

    bool operator==(const FormValues& other) const { return fields_ == other.fields_; }

private:
    Storage fields_;
};

// Original leaf values keyed by the same paths as FormValues
using NativeValues = std::map<std::string, std::any>;

}  // namespace urlform
