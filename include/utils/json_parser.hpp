#ifndef JSON_PARSER_HPP
#define JSON_PARSER_HPP

#include <string>
#include <map>
#include <vector>
#include <cstdint>

namespace rendezvous {

/**
 * A top-level member of a JSON object.
 * Strings are stored unescaped; every other value (number, literal,
 * nested object or array) is kept as its raw JSON text so it can be
 * re-emitted verbatim.
 */
struct JsonField {
    std::string value;
    bool is_string = false;

    bool isNull() const { return !is_string && value == "null"; }
    bool isObject() const { return !is_string && !value.empty() && value.front() == '{'; }
    bool isArray() const { return !is_string && !value.empty() && value.front() == '['; }
};

class JsonParser {
public:
    // Throws std::invalid_argument if the input is not a single well-formed JSON object
    static std::map<std::string, JsonField> parseObject(const std::string& json);
    static std::map<std::string, std::string> parse(const std::string& json);

    // Raw JSON text of each element of a top-level array
    static std::vector<std::string> parseArray(const std::string& json);
    static std::vector<std::string> parseStringArray(const std::string& json);

    static bool isValid(const std::string& json);
    static bool isObject(const std::string& json);

    static std::string stringify(const std::map<std::string, std::string>& data);
    static std::string createResponse(bool success, const std::string& message, const std::map<std::string, std::string>& data = {});
    static std::string createErrorResponse(const std::string& code, const std::string& message);
    static std::string createSuccessResponse(const std::string& message, const std::map<std::string, std::string>& data = {});

    static std::string escapeJson(const std::string& str);
    static std::string unescapeJson(const std::string& str);
    static std::string quote(const std::string& str);

    // Field accessors; a missing key yields the fallback, a malformed value throws std::invalid_argument
    static std::string getString(const std::map<std::string, JsonField>& fields, const std::string& key,
                                 const std::string& fallback = "");
    static int64_t getInt(const std::map<std::string, JsonField>& fields, const std::string& key, int64_t fallback = 0);
    static bool getBool(const std::map<std::string, JsonField>& fields, const std::string& key, bool fallback = false);
    static std::string getRaw(const std::map<std::string, JsonField>& fields, const std::string& key,
                              const std::string& fallback = "null");
};

} // namespace rendezvous

#endif // JSON_PARSER_HPP
