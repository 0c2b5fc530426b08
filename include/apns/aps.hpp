// include/apns/aps.hpp
// Standard payload builder, writes the "aps" dictionary as JSON directly.

#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace apns {

// Builder for the standard notification payload:
//   {"aps":{"alert":...,"badge":N,"sound":"...","content-available":1,"category":"..."}}
//
// Custom top-level keys added with extra() follow the "aps" dictionary.
// String values are escaped; the result is always valid JSON.
//
// Example:
//   auto payload = Aps().alert("Hello").badge(1).sound("default").to_json();
class Aps {
public:
    // Plain alert text.
    Aps& alert(std::string body) {
        alert_title_.reset();
        alert_body_ = std::move(body);
        return *this;
    }

    // Alert dictionary with a title and body.
    Aps& alert(std::string title, std::string body) {
        alert_title_ = std::move(title);
        alert_body_ = std::move(body);
        return *this;
    }

    Aps& badge(int value) {
        badge_ = value;
        return *this;
    }

    Aps& sound(std::string name) {
        sound_ = std::move(name);
        return *this;
    }

    // Marks a background update ("content-available": 1).
    Aps& content_available(bool value = true) {
        content_available_ = value;
        return *this;
    }

    Aps& category(std::string name) {
        category_ = std::move(name);
        return *this;
    }

    Aps& extra(const std::string& key, const std::string& value) {
        std::string json;
        append_string(json, value);
        extras_.emplace_back(key, std::move(json));
        return *this;
    }

    Aps& extra(const std::string& key, int64_t value) {
        extras_.emplace_back(key, std::to_string(value));
        return *this;
    }

    Aps& extra(const std::string& key, const char* value) {
        return extra(key, std::string(value));
    }

    std::string to_json() const {
        std::string out;
        out.reserve(128);
        out += "{\"aps\":{";
        size_t fields = 0;

        if (alert_body_) {
            begin_field(out, fields, "alert");
            if (alert_title_) {
                out += "{\"title\":";
                append_string(out, *alert_title_);
                out += ",\"body\":";
                append_string(out, *alert_body_);
                out += '}';
            } else {
                append_string(out, *alert_body_);
            }
        }
        if (badge_) {
            begin_field(out, fields, "badge");
            out += std::to_string(*badge_);
        }
        if (sound_) {
            begin_field(out, fields, "sound");
            append_string(out, *sound_);
        }
        if (content_available_) {
            begin_field(out, fields, "content-available");
            out += '1';
        }
        if (category_) {
            begin_field(out, fields, "category");
            append_string(out, *category_);
        }
        out += '}';

        for (const auto& [key, value] : extras_) {
            out += ',';
            append_string(out, key);
            out += ':';
            out += value;
        }
        out += '}';
        return out;
    }

    std::vector<uint8_t> to_json_bytes() const {
        std::string json = to_json();
        return std::vector<uint8_t>(json.begin(), json.end());
    }

private:
    std::optional<std::string> alert_title_;
    std::optional<std::string> alert_body_;
    std::optional<int> badge_;
    std::optional<std::string> sound_;
    bool content_available_ = false;
    std::optional<std::string> category_;
    std::vector<std::pair<std::string, std::string>> extras_;

    static void begin_field(std::string& out, size_t& fields, const char* key) {
        if (fields++ > 0) out += ',';
        out += '"';
        out += key;
        out += "\":";
    }

    static bool needs_escape(char c) {
        return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
    }

    static void append_string(std::string& out, const std::string& s) {
        out += '"';
        // Fast path: bulk-copy runs of safe characters.
        size_t i = 0;
        while (i < s.size()) {
            size_t run_start = i;
            while (i < s.size() && !needs_escape(s[i])) ++i;
            if (i > run_start) {
                out.append(s, run_start, i - run_start);
            }
            if (i < s.size()) {
                char c = s[i];
                switch (c) {
                    case '"':  out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\b': out += "\\b"; break;
                    case '\f': out += "\\f"; break;
                    case '\n': out += "\\n"; break;
                    case '\r': out += "\\r"; break;
                    case '\t': out += "\\t"; break;
                    default: {
                        char hex[7];
                        std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                        out.append(hex, 6);
                        break;
                    }
                }
                ++i;
            }
        }
        out += '"';
    }
};

} // namespace apns
