#ifndef TICKLER_JSON_PARSER_HPP
#define TICKLER_JSON_PARSER_HPP

#include <string>
#include <map>
#include <vector>

namespace tickler {

// Flat JSON helpers: objects are string -> string maps, scalars keep their
// literal text ("42", "true"). Nested objects/arrays are not supported as values.
class JsonParser {
public:
    using Object = std::map<std::string, std::string>;

    // The whole input must be exactly one flat object / one array of flat
    // objects. Returns false (and leaves `out` unspecified) otherwise.
    static bool parseObject(const std::string& json, Object& out);
    static bool parseObjectArray(const std::string& json, std::vector<Object>& out);

    static std::string stringify(const Object& data);
    static std::string stringifyArray(const std::vector<Object>& items);
    static std::string createResponse(bool success, const std::string& message, const Object& data = {});
    static std::string createErrorResponse(const std::string& message);
    static std::string createSuccessResponse(const std::string& message, const Object& data = {});
    static std::string escapeJson(const std::string& str);
    static std::string unescapeJson(const std::string& str);
};

} // namespace tickler

#endif // TICKLER_JSON_PARSER_HPP
