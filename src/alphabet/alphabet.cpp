// alphabet.cpp
// 字符集资产的读写：JSON <-> Alphabet
#include "alphabet.h"
#include "utils/utf8.h"

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

u32string decodeField(const string& text, const char* what) {
    try {
        return Utf8::decode(text);
    } catch (const Utf8::DecodeError& e) {
        throw AlphabetFormatError(string("Invalid UTF-8 in ") + what + ": " + e.what());
    }
}

u32string charactersFromValue(const json& value, const char* key) {
    if (value.is_string()) {
        return decodeField(value.get<string>(), key);
    }
    if (value.is_array()) {
        u32string result;
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw AlphabetFormatError(string("Non-string member in '") + key + "' array");
            }
            result += decodeField(item.get<string>(), key);
        }
        return result;
    }
    throw AlphabetFormatError(string("'") + key + "' must be a string or an array of strings");
}

} // end anonymous namespace

Alphabet::Alphabet(u32string characters, string source)
    : m_characters(std::move(characters)), m_source(std::move(source)) {}

string Alphabet::toUtf8() const {
    return Utf8::encode(m_characters);
}

json Alphabet::toJson() const {
    json j;
    if (!m_source.empty()) {
        j["source"] = m_source;
    }
    j["characters"] = toUtf8();
    j["count"] = m_characters.size();
    return j;
}

u32string charactersFromJson(const json& j) {
    if (j.is_object()) {
        if (j.contains("characters")) {
            return charactersFromValue(j["characters"], "characters");
        }
        if (j.contains("chars")) {
            return charactersFromValue(j["chars"], "chars");
        }
        throw AlphabetFormatError("Unrecognized JSON format: object has neither 'characters' nor 'chars'");
    }
    if (j.is_array()) {
        return charactersFromValue(j, "array");
    }
    if (j.is_string()) {
        return charactersFromValue(j, "string");
    }
    throw AlphabetFormatError("Unrecognized JSON format: expected object, array or string");
}

Alphabet Alphabet::fromJson(const json& j, const string& sourceHint) {
    u32string chars = charactersFromJson(j);
    if (chars.empty()) {
        throw AlphabetFormatError("Alphabet contains no characters");
    }

    string source = sourceHint;
    if (j.is_object()) {
        if (j.contains("count")) {
            const auto& count = j["count"];
            if (!count.is_number_integer() || count.get<long long>() != static_cast<long long>(chars.size())) {
                throw AlphabetFormatError("Alphabet 'count' (" + count.dump() + ") does not match its "
                                          + std::to_string(chars.size()) + " characters");
            }
        }
        if (j.contains("source") && j["source"].is_string()) {
            source = j["source"].get<string>();
        }
    }
    return Alphabet(std::move(chars), std::move(source));
}

Alphabet loadAlphabet(const std::filesystem::path& assetPath) {
    std::ifstream file(assetPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open alphabet file '" + assetPath.string() + "'");
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw AlphabetFormatError("Failed to parse alphabet file '" + assetPath.string() + "': " + e.what());
    }

    try {
        return Alphabet::fromJson(j, assetPath.filename().string());
    } catch (const AlphabetFormatError& e) {
        throw AlphabetFormatError(assetPath.string() + ": " + e.what());
    }
}

void saveAlphabet(const Alphabet& alphabet, const std::filesystem::path& assetPath) {
    std::ofstream file(assetPath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open alphabet file for writing: " + assetPath.string());
    }
    file << alphabet.toJson().dump(2) << std::endl;
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write all data or close the alphabet file: " + assetPath.string());
    }
}
