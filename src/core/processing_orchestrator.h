#ifndef PROCESSING_ORCHESTRATOR_H
#define PROCESSING_ORCHESTRATOR_H

#include "common/common_types.h"
#include "alphabet/alphabet.h"
#include "conversion/pixel_mapper.h"
#include "font/IFont.h"
#include "rendering/grid_renderer.h"
#include "rendering/IFrameSink.h"
#include "source/IFrameSource.h"

// Runs frames through mapper and renderer into a sink. The alphabet and font
// are read-only here, so frames are converted concurrently.
class ProcessingOrchestrator {
public:
    // Fails fast: throws std::invalid_argument for an empty alphabet or an
    // unusable font metric, GlyphRenderError if the metric glyph is missing.
    ProcessingOrchestrator(const Config& config, const Alphabet& alphabet, const IFont& font);

    // Returns true when every frame was converted and written. The first
    // failed frame stops the run and no later frame is written, so the sink
    // always holds a gapless prefix of the sequence.
    bool process(IFrameSource& source, IFrameSink& sink);

    // Throws PipelineError tagged with the failing stage.
    GrayImage convertFrame(const Frame& frame) const;

    // Alphabet members (other than space) the font has no glyph for.
    u32string findUnrenderableCharacters() const;

    int getProcessedCount() const { return m_processedCount; }
    int getFailedCount() const { return m_failedCount; }
    const GridSize& getGridSize() const { return m_grid; }
    const FontMetric& getCellMetric() const { return m_cell; }

private:
    unsigned int workerCount() const;

    const Config& m_config;
    const Alphabet& m_alphabet;
    const IFont& m_font;
    FontMetric m_cell;
    GridSize m_grid;
    PixelToCharacterMapper m_mapper;
    CharacterGridRenderer m_renderer;
    int m_processedCount = 0;
    int m_failedCount = 0;
};

#endif // PROCESSING_ORCHESTRATOR_H
