#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/frame.hpp>
#include <expected>

namespace gnomon::core {

/// Abstract pipeline stage: process one Frame, return the transformed Frame or an error.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<Frame, PhotoError> process(
      const Frame& input) = 0;
};

}  // namespace gnomon::core
