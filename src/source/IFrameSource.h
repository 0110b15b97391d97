#ifndef IFRAME_SOURCE_H
#define IFRAME_SOURCE_H

#include "common_types.h"
#include <cstddef>
#include <optional>
#include <string>

struct Frame {
    std::size_t index = 0; // Zero-based position in the sequence
    std::string label;     // File name or other identifier for diagnostics
    GrayImage image;
};

// Lazy, ordered, finite sequence of raw frames.
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    // Next frame in order, or nullopt when exhausted. Throws PipelineError
    // (stage LOADING) when a frame can't be produced.
    virtual std::optional<Frame> next() = 0;

    // Number of frames this source will yield, when known in advance.
    virtual std::optional<std::size_t> sizeHint() const { return std::nullopt; }

    virtual std::string describe() const = 0;
};

#endif // IFRAME_SOURCE_H
