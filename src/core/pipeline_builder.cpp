#include "core/pipeline_builder.hpp"
#include "core/pipeline.hpp"
#include <stdexcept>

namespace quill {

std::shared_ptr<Pipeline> PipelineBuilder::build() {
    if (!c_.themes) throw std::runtime_error("PipelineBuilder: theme host is required");
    if (!c_.dispatcher) throw std::runtime_error("PipelineBuilder: theme dispatcher is required");
    if (!c_.build) throw std::runtime_error("PipelineBuilder: context builder is required");

    return std::make_shared<Pipeline>(std::move(c_));
}

} // namespace quill
