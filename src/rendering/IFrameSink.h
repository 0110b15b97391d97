#ifndef IFRAME_SINK_H
#define IFRAME_SINK_H

#include "common_types.h"
#include <cstddef>
#include <string>

// Consumer of rendered frames. The orchestrator calls write() in index order
// from one thread; the index fixes the frame's place in the sequence.
class IFrameSink {
public:
    virtual ~IFrameSink() = default;

    // Throws std::runtime_error if the frame could not be stored.
    virtual void write(std::size_t frameIndex, const GrayImage& frame) = 0;

    // Called once after the last frame with the number of frames written.
    virtual void finish(std::size_t frameCount) { (void)frameCount; }

    virtual std::string describe() const = 0;
};

#endif // IFRAME_SINK_H
