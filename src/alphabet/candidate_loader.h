// candidate_loader.h
#ifndef CANDIDATE_LOADER_H
#define CANDIDATE_LOADER_H

#include "common_types.h"
#include <filesystem>

// Removes repeated characters, keeping the first occurrence of each.
u32string uniqueCharacters(const u32string& input);

// Unique characters of a UTF-8 text in first-occurrence order. Control
// characters (line breaks included) and space are dropped; with asciiOnly only
// printable code points below 128 are kept.
u32string extractCandidatesFromText(const string& utf8Text, bool asciiOnly);

// .json files use the alphabet asset shapes, anything else is read as text.
// Throws AlphabetFormatError or std::runtime_error.
u32string loadCandidates(const std::filesystem::path& inputPath, bool asciiOnly);

#endif // CANDIDATE_LOADER_H
