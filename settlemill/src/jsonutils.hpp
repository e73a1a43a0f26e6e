#pragma once

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace settlemill::json {

// Simple JSON value extraction (no external dependencies)
// Handles flat objects and one level of arrays of flat objects

inline bool hasKey(const std::string& json, const std::string& key)
{
    return json.find("\"" + key + "\"") != std::string::npos;
}

inline std::string extractString(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return "";

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return "";

    auto startQuote = json.find('"', colonPos);
    if (startQuote == std::string::npos)
        return "";

    auto endQuote = json.find('"', startQuote + 1);
    if (endQuote == std::string::npos)
        return "";

    return json.substr(startQuote + 1, endQuote - startQuote - 1);
}

inline uint64_t extractUnsigned(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return 0;

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return 0;

    // Skip whitespace after colon
    auto valueStart = colonPos + 1;
    while (valueStart < json.size() && std::isspace(static_cast<unsigned char>(json[valueStart])))
        ++valueStart;

    std::string numStr;
    while (valueStart < json.size() && std::isdigit(static_cast<unsigned char>(json[valueStart]))) {
        numStr += json[valueStart];
        ++valueStart;
    }

    // A present key must hold a number
    if (numStr.empty())
        throw std::invalid_argument("\"" + key + "\" is not an unsigned number");

    return std::stoull(numStr);
}

// Raw text of each {...} object inside the array stored under key
inline std::vector<std::string> extractObjects(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;

    auto keyPos = json.find("\"" + key + "\"");
    if (keyPos == std::string::npos)
        return objects;

    auto arrayStart = json.find('[', keyPos);
    auto arrayEnd = json.find(']', keyPos);
    if (arrayStart == std::string::npos || arrayEnd == std::string::npos || arrayEnd < arrayStart)
        return objects;

    size_t pos = arrayStart;
    while (pos < arrayEnd) {
        auto objectStart = json.find('{', pos);
        if (objectStart == std::string::npos || objectStart > arrayEnd)
            break;

        auto objectEnd = json.find('}', objectStart);
        if (objectEnd == std::string::npos)
            break;

        objects.push_back(json.substr(objectStart, objectEnd - objectStart + 1));
        pos = objectEnd + 1;
    }

    return objects;
}

} // namespace settlemill::json
