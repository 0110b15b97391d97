// alphabet.h
#ifndef ALPHABET_H
#define ALPHABET_H

#include "common_types.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

class AlphabetFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Characters ordered from darkest (index 0) to lightest under one font/size.
class Alphabet {
public:
    Alphabet() = default;
    explicit Alphabet(u32string characters, string source = "");

    const u32string& characters() const { return m_characters; }
    const string& source() const { return m_source; }
    size_t size() const { return m_characters.size(); }
    bool empty() const { return m_characters.empty(); }
    char32_t operator[](size_t index) const { return m_characters[index]; }

    string toUtf8() const;

    // {"source": ..., "characters": ..., "count": N}; source omitted when unknown.
    nlohmann::json toJson() const;

    // Accepts {"characters": ...}, {"chars": ...}, a bare array of strings or a
    // bare string. Throws AlphabetFormatError for any other shape, for a count
    // that disagrees with the characters, and for an empty character set.
    static Alphabet fromJson(const nlohmann::json& j, const string& sourceHint = "");

private:
    u32string m_characters;
    string m_source;
};

// Decodes one of the accepted JSON shapes to code points without any
// emptiness check. Shared with candidate extraction.
u32string charactersFromJson(const nlohmann::json& j);

// Both throw AlphabetFormatError (parse/shape problems) or std::runtime_error (I/O).
Alphabet loadAlphabet(const std::filesystem::path& assetPath);
void saveAlphabet(const Alphabet& alphabet, const std::filesystem::path& assetPath);

#endif // ALPHABET_H
