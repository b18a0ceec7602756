/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include "output_formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <type_traits>

namespace uuidcore::cli {

OutputFormatter::OutputFormatter(bool json_mode, std::ostream& out, std::ostream& err)
    : json_mode_(json_mode)
    , out_(out)
    , err_(err) {}

void OutputFormatter::set_json_mode(bool enabled) {
    json_mode_ = enabled;
}

void OutputFormatter::print_error(const std::string& message) {
    if (json_mode_) {
        out_ << R"({"error":")" << escape_json_string(message) << "\"}\n";
    } else {
        err_ << "(error) " << message << "\n";
    }
}

void OutputFormatter::print_string(const std::string& value) {
    if (json_mode_) {
        out_ << "\"" << escape_json_string(value) << "\"\n";
    } else {
        out_ << value << "\n";
    }
}

void OutputFormatter::print_array(const std::vector<std::string>& items) {
    if (json_mode_) {
        out_ << "[";
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out_ << ",";
            out_ << "\"" << escape_json_string(items[i]) << "\"";
        }
        out_ << "]\n";
    } else {
        for (const auto& item : items) {
            out_ << item << "\n";
        }
    }
}

void OutputFormatter::print_key_values(const std::vector<std::pair<std::string, std::string>>& pairs) {
    if (json_mode_) {
        out_ << "{";
        for (size_t i = 0; i < pairs.size(); ++i) {
            if (i > 0) out_ << ",";
            out_ << "\"" << escape_json_string(pairs[i].first) << "\":\""
                 << escape_json_string(pairs[i].second) << "\"";
        }
        out_ << "}\n";
    } else {
        size_t max_key_len = 0;
        for (const auto& [key, _] : pairs) {
            max_key_len = std::max(max_key_len, key.size());
        }
        for (const auto& [key, value] : pairs) {
            out_ << std::left << std::setw(static_cast<int>(max_key_len + 1)) << (key + ":")
                 << " " << value << "\n";
        }
    }
}

void OutputFormatter::print_json(const std::map<std::string, JsonObject>& obj) {
    if (json_mode_) {
        out_ << json_stringify(JsonObject(obj)) << "\n";
        return;
    }
    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& [key, value] : obj) {
        std::string text;
        if (auto s = std::get_if<std::string>(&value.value)) {
            text = *s;
        } else {
            text = json_stringify(value);
        }
        pairs.emplace_back(key, text);
    }
    print_key_values(pairs);
}

std::string OutputFormatter::escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::string OutputFormatter::json_stringify(const JsonObject& obj) {
    return std::visit([](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return val ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(val);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + escape_json_string(val) + "\"";
        } else if constexpr (std::is_same_v<T, std::vector<JsonObject>>) {
            std::string result = "[";
            for (size_t i = 0; i < val.size(); ++i) {
                if (i > 0) result += ",";
                result += json_stringify(val[i]);
            }
            return result + "]";
        } else {
            std::string result = "{";
            bool first = true;
            for (const auto& [k, v] : val) {
                if (!first) result += ",";
                first = false;
                result += "\"" + escape_json_string(k) + "\":" + json_stringify(v);
            }
            return result + "}";
        }
    }, obj.value);
}

} // namespace uuidcore::cli
