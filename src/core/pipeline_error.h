#ifndef PIPELINE_ERROR_H
#define PIPELINE_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

enum class PipelineStage {
    LOADING,
    MEASUREMENT,
    MAPPING,
    RENDERING,
    WRITING,
};

std::string pipelineStageToString(PipelineStage stage);

// Failure of one frame, tagged with the stage and input that triggered it.
class PipelineError : public std::runtime_error {
public:
    PipelineError(PipelineStage stage, std::size_t frameIndex, const std::string& input, const std::string& detail);

    PipelineStage getStage() const { return m_stage; }
    std::size_t getFrameIndex() const { return m_frameIndex; }
    const std::string& getInput() const { return m_input; }

private:
    PipelineStage m_stage;
    std::size_t m_frameIndex;
    std::string m_input;
};

#endif // PIPELINE_ERROR_H
