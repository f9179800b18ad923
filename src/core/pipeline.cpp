#include <gnomon/core/pipeline.hpp>
#include <utility>

namespace gnomon::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<Frame, PhotoError> Pipeline::run(const Frame& input) {
  if (input.empty()) {
    return std::unexpected(PhotoError::InvalidFrame);
  }

  Frame current = input;

  for (const auto& stage : stages_) {
    auto result = stage->process(current);
    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
  }

  return current;
}

}  // namespace gnomon::core
