#include "processing_orchestrator.h"
#include "pipeline_error.h"

#include <iostream>
#include <future>
#include <thread>
#include <utility>
#include <vector>

ProcessingOrchestrator::ProcessingOrchestrator(const Config& config, const Alphabet& alphabet, const IFont& font)
    : m_config(config),
      m_alphabet(alphabet),
      m_font(font),
      m_cell(measureFontMetric(font)),
      m_grid(computeGridSize(m_cell, config.outputSize)),
      m_mapper(alphabet),
      m_renderer(font, m_cell, config.outputSize) {}

unsigned int ProcessingOrchestrator::workerCount() const {
    if (m_config.workerCount > 0) {
        return static_cast<unsigned int>(m_config.workerCount);
    }
    unsigned int hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

u32string ProcessingOrchestrator::findUnrenderableCharacters() const {
    u32string missing;
    for (char32_t c : m_alphabet.characters()) {
        if (c != SPACE_CHAR && !m_font.hasGlyph(c)) {
            missing.push_back(c);
        }
    }
    return missing;
}

GrayImage ProcessingOrchestrator::convertFrame(const Frame& frame) const {
    CharacterGrid grid;
    try {
        grid = m_mapper.mapImage(frame.image, m_grid);
    } catch (const std::invalid_argument& e) {
        throw PipelineError(PipelineStage::MAPPING, frame.index, frame.label, e.what());
    } catch (const std::runtime_error& e) {
        throw PipelineError(PipelineStage::MAPPING, frame.index, frame.label, e.what());
    }

    // A non-rectangular grid (std::logic_error) is a mapper bug and is not wrapped.
    try {
        return m_renderer.render(grid);
    } catch (const GlyphRenderError& e) {
        throw PipelineError(PipelineStage::RENDERING, frame.index, frame.label, e.what());
    } catch (const std::invalid_argument& e) {
        throw PipelineError(PipelineStage::RENDERING, frame.index, frame.label, e.what());
    }
}

bool ProcessingOrchestrator::process(IFrameSource& source, IFrameSink& sink) {
    const unsigned int workers = workerCount();
    const auto total = source.sizeHint();
    std::cout << "Converting " << source.describe() << " -> " << sink.describe()
              << " (" << m_grid.cols << "x" << m_grid.rows << " characters, "
              << workers << " worker(s))" << std::endl;

    bool exhausted = false;
    bool stopped = false;
    std::optional<std::size_t> firstFailed;
    auto recordFailure = [&](const PipelineError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        m_failedCount++;
        stopped = true;
        if (!firstFailed || e.getFrameIndex() < *firstFailed) {
            firstFailed = e.getFrameIndex();
        }
    };

    while (!exhausted && !stopped) {
        std::vector<std::future<std::pair<Frame, GrayImage>>> futures;
        futures.reserve(workers);

        for (unsigned int k = 0; k < workers; ++k) {
            std::optional<Frame> frame;
            try {
                frame = source.next();
            } catch (const PipelineError& e) {
                recordFailure(e);
                break;
            }
            if (!frame) {
                exhausted = true;
                break;
            }

            futures.push_back(std::async(std::launch::async, [this](Frame f) {
                GrayImage output = convertFrame(f);
                return std::make_pair(std::move(f), std::move(output));
            }, std::move(*frame)));
        }

        // Written here in index order. Once a frame fails, the rest of the batch
        // is dropped unwritten; the futures' destructors wait for their tasks.
        // A load failure above only ends scheduling: every frame already in the
        // batch precedes it.
        bool dropRest = false;
        for (size_t i = 0; i < futures.size() && !dropRest; ++i) {
            try {
                auto [f, output] = futures[i].get();
                try {
                    sink.write(f.index, output);
                } catch (const std::runtime_error& e) {
                    throw PipelineError(PipelineStage::WRITING, f.index, f.label, e.what());
                }
                m_processedCount++;
                if (m_processedCount % 10 == 0) {
                    std::cout << "  " << m_processedCount;
                    if (total) std::cout << "/" << *total;
                    std::cout << " frames" << std::endl;
                }
            } catch (const PipelineError& e) {
                recordFailure(e);
                dropRest = true;
            } catch (const std::logic_error&) {
                throw; // Contract violation, not an input problem.
            } catch (const std::exception& e) {
                std::cerr << "Error retrieving result from frame task: " << e.what() << std::endl;
                m_failedCount++;
                stopped = true;
                dropRest = true;
            }
        }
    }

    if (firstFailed) {
        std::cerr << "Error: Conversion stopped at frame " << *firstFailed
                  << "; the output sequence is only complete before that frame." << std::endl;
    } else if (stopped) {
        std::cerr << "Error: Conversion stopped after a failed frame." << std::endl;
    }
    sink.finish(static_cast<std::size_t>(m_processedCount));
    return m_failedCount == 0;
}
