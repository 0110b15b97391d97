// alphabet_sorter.cpp
// 按视觉亮度对字符排序（从暗到亮）
#include "alphabet_sorter.h"
#include "candidate_loader.h"
#include "utils/utf8.h"

#include <algorithm>
#include <iomanip>
#include <iostream>

AlphabetSorter::AlphabetSorter(const GlyphBrightnessMeasurer& measurer, bool printBrightness)
    : m_measurer(measurer), m_printBrightness(printBrightness) {}

vector<GlyphMeasurement> AlphabetSorter::sortByBrightness(const u32string& candidates) const {
    vector<GlyphMeasurement> measured;
    measured.reserve(candidates.size());

    for (char32_t c : uniqueCharacters(candidates)) {
        if (c == SPACE_CHAR) continue;
        GlyphMeasurement m = m_measurer.measure(c);
        if (m_printBrightness) {
            std::cout << "  '" << Utf8::encode(c) << "': " << std::fixed << std::setprecision(2)
                      << m.brightness << std::endl;
        }
        measured.push_back(m);
    }

    std::stable_sort(measured.begin(), measured.end(),
                     [](const GlyphMeasurement& a, const GlyphMeasurement& b) {
                         return a.brightness < b.brightness;
                     });

    // Space is always darkest.
    GlyphMeasurement space;
    space.character = SPACE_CHAR;
    space.brightness = 0.0;
    measured.insert(measured.begin(), space);
    return measured;
}

Alphabet AlphabetSorter::buildAlphabet(const u32string& candidates, const string& source) const {
    vector<GlyphMeasurement> sorted = sortByBrightness(candidates);
    u32string characters;
    characters.reserve(sorted.size());
    for (const auto& m : sorted) {
        characters.push_back(m.character);
    }
    return Alphabet(std::move(characters), source);
}
