#include "pipeline_error.h"

std::string pipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::LOADING:     return "loading";
        case PipelineStage::MEASUREMENT: return "measurement";
        case PipelineStage::MAPPING:     return "mapping";
        case PipelineStage::RENDERING:   return "rendering";
        case PipelineStage::WRITING:     return "writing";
        default:                         return "unknown";
    }
}

PipelineError::PipelineError(PipelineStage stage, std::size_t frameIndex, const std::string& input, const std::string& detail)
    : std::runtime_error("[" + pipelineStageToString(stage) + "] frame " + std::to_string(frameIndex)
                         + " (" + input + "): " + detail),
      m_stage(stage), m_frameIndex(frameIndex), m_input(input) {}
