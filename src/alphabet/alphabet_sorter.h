// alphabet_sorter.h
#ifndef ALPHABET_SORTER_H
#define ALPHABET_SORTER_H

#include "alphabet.h"
#include "glyph_measurer.h"

// Orders candidate characters from darkest to lightest. The space character is
// always present, pinned to index 0 with brightness 0; the rest are ordered by
// a stable sort on measured brightness.
class AlphabetSorter {
public:
    explicit AlphabetSorter(const GlyphBrightnessMeasurer& measurer, bool printBrightness = false);

    // Duplicates in the input are dropped, keeping the first occurrence.
    vector<GlyphMeasurement> sortByBrightness(const u32string& candidates) const;

    Alphabet buildAlphabet(const u32string& candidates, const string& source = "") const;

private:
    const GlyphBrightnessMeasurer& m_measurer;
    bool m_printBrightness;
};

#endif // ALPHABET_SORTER_H
