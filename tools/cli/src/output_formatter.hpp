/**
 * @file output_formatter.hpp
 * @brief Output formatting for CLI (plain text and JSON)
 */

#pragma once

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace uuidcore::cli {

struct JsonObject;

/**
 * @brief JSON value types for output
 */
using JsonValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    std::string,
    std::vector<JsonObject>,
    std::map<std::string, JsonObject>
>;

struct JsonObject {
    JsonValue value;

    JsonObject() : value(nullptr) {}
    JsonObject(std::nullptr_t) : value(nullptr) {}
    JsonObject(bool b) : value(b) {}
    JsonObject(int i) : value(static_cast<int64_t>(i)) {}
    JsonObject(int64_t i) : value(i) {}
    JsonObject(const char* s) : value(std::string(s)) {}
    JsonObject(const std::string& s) : value(s) {}
    JsonObject(std::vector<JsonObject> arr) : value(std::move(arr)) {}
    JsonObject(std::map<std::string, JsonObject> obj) : value(std::move(obj)) {}
};

/**
 * @brief Writes command results in text or JSON form
 *
 * Results go to @p out; in text mode errors go to @p err, in JSON mode
 * they are written to @p out as {"error": ...}.
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr);

    void set_json_mode(bool enabled);
    bool is_json_mode() const { return json_mode_; }

    void print_error(const std::string& message);

    // A single string result; quoted in JSON mode
    void print_string(const std::string& value);

    // One item per line in text mode, a JSON array otherwise
    void print_array(const std::vector<std::string>& items);

    // Aligned "key: value" lines; a JSON object of strings otherwise
    void print_key_values(const std::vector<std::pair<std::string, std::string>>& pairs);

    // Structured output; text mode prints one "key: value" line per member
    void print_json(const std::map<std::string, JsonObject>& obj);

    static std::string json_stringify(const JsonObject& obj);
    static std::string escape_json_string(const std::string& s);

private:
    bool json_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace uuidcore::cli
