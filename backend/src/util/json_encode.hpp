#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <sstream>

#include "market/types.hpp"

// Basic JSON string escaper
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char hex[] = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xf];
                    out += hex[c & 0xf];
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// Writes the members of one flat JSON object: {"a":..,"b":..}
// Amounts are encoded as decimal strings; 256-bit values do not fit a JSON number.
class JsonObjectWriter {
public:
    explicit JsonObjectWriter(std::ostringstream& os) : os_(os) { os_ << "{"; }

    JsonObjectWriter& field(std::string_view key, std::string_view value) {
        key_(key);
        os_ << "\"" << json_escape(value) << "\"";
        return *this;
    }
    JsonObjectWriter& field(std::string_view key, const std::string& value) {
        return field(key, std::string_view(value));
    }
    JsonObjectWriter& field(std::string_view key, const char* value) {
        return field(key, std::string_view(value));
    }
    JsonObjectWriter& field(std::string_view key, std::uint64_t value) {
        key_(key);
        os_ << value;
        return *this;
    }
    JsonObjectWriter& field(std::string_view key, const Amount& value) {
        key_(key);
        os_ << "\"" << value.str() << "\"";
        return *this;
    }

    void close() { os_ << "}"; }

private:
    void key_(std::string_view key) {
        if (!first_) os_ << ",";
        first_ = false;
        os_ << "\"" << json_escape(key) << "\":";
    }

    std::ostringstream& os_;
    bool first_{true};
};
