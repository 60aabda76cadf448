#pragma once
#include <cstdint>

namespace qc {

// What one Renderer::draw call submitted.
struct FrameStats {
  std::uint32_t passes = 0;        // 0 when the renderer was not ready
  std::uint32_t drawCalls = 0;     // 0 for a blank frame, otherwise 1
  std::uint32_t vertexCount = 0;

  // Vertex bytes uploaded this frame
  std::uint64_t uploadedBytes = 0;

  bool scissored = false;

  // Multisample target size used for the frame
  int targetWidth = 0;
  int targetHeight = 0;
};

} // namespace qc
