#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/frame.hpp>
#include <gnomon/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

namespace gnomon::core {

/// Runs a sequence of stages, feeding each stage's output Frame to the next.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one frame; returns the last stage's Frame or the first error.
  /// An empty pipeline returns a copy of the input. An empty input frame is
  /// rejected with InvalidFrame before any stage runs.
  [[nodiscard]] std::expected<Frame, PhotoError> run(const Frame& input);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace gnomon::core
