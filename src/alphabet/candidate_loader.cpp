// candidate_loader.cpp
// 从 JSON 或 TXT 文件中提取候选字符
#include "candidate_loader.h"
#include "alphabet.h"
#include "utils/utf8.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace {

bool isControl(char32_t c) {
    return c < 0x20 || (c >= 0x7F && c < 0xA0);
}

} // end anonymous namespace

u32string uniqueCharacters(const u32string& input) {
    std::unordered_set<char32_t> seen;
    u32string result;
    result.reserve(input.size());
    for (char32_t c : input) {
        if (seen.insert(c).second) {
            result.push_back(c);
        }
    }
    return result;
}

u32string extractCandidatesFromText(const string& utf8Text, bool asciiOnly) {
    u32string decoded;
    try {
        decoded = Utf8::decode(utf8Text);
    } catch (const Utf8::DecodeError& e) {
        throw AlphabetFormatError(string("Invalid UTF-8 in candidate text: ") + e.what());
    }

    u32string filtered;
    filtered.reserve(decoded.size());
    for (char32_t c : decoded) {
        if (isControl(c) || c == SPACE_CHAR) continue;
        if (asciiOnly && c >= 0x80) continue;
        filtered.push_back(c);
    }
    return uniqueCharacters(filtered);
}

u32string loadCandidates(const std::filesystem::path& inputPath, bool asciiOnly) {
    std::ifstream file(inputPath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open candidate file '" + inputPath.string() + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    string content = buffer.str();

    if (toLower(inputPath.extension().string()) != ".json") {
        return extractCandidatesFromText(content, asciiOnly);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw AlphabetFormatError("Failed to parse candidate file '" + inputPath.string() + "': " + e.what());
    }
    // Same filtering as text input.
    return extractCandidatesFromText(Utf8::encode(charactersFromJson(j)), asciiOnly);
}
