#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vindex {

  // False when any component is NaN or infinite.
  bool all_finite(const std::vector<float>& v);

  // Unit-length copy; a zero vector stays (near) zero.
  std::vector<float> normalized(const std::vector<float>& v);

  // Ledger encoding: D little-endian IEEE-754 floats.
  std::vector<uint8_t> encode_embedding(const std::vector<float>& v);
  std::vector<float> decode_embedding(const std::vector<uint8_t>& bytes);

} // namespace vindex
