#include "Distance.hpp"

#include <cmath>
#include <cstring>

#include "core/errors/Error.hpp"

namespace vindex {

  bool all_finite(const std::vector<float>& v) {
    for (float x : v) {
      if (!std::isfinite(x)) return false;
    }
    return true;
  }

  std::vector<float> normalized(const std::vector<float>& v) {
    double sq = 0.0;
    for (float x : v) sq += static_cast<double>(x) * x;
    const float denom = static_cast<float>(std::sqrt(sq) + 1e-8);
    std::vector<float> out(v.size());
    for (size_t i = 0; i < v.size(); ++i) out[i] = v[i] / denom;
    return out;
  }

  std::vector<uint8_t> encode_embedding(const std::vector<float>& v) {
    std::vector<uint8_t> out(v.size() * 4);
    for (size_t i = 0; i < v.size(); ++i) {
      uint32_t bits;
      std::memcpy(&bits, &v[i], sizeof(bits));
      out[4*i]   = static_cast<uint8_t>(bits);
      out[4*i+1] = static_cast<uint8_t>(bits >> 8);
      out[4*i+2] = static_cast<uint8_t>(bits >> 16);
      out[4*i+3] = static_cast<uint8_t>(bits >> 24);
    }
    return out;
  }

  std::vector<float> decode_embedding(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 4 != 0) {
      throw Error(ErrorCode::StorageIO, "ledger row is not a whole number of floats");
    }
    std::vector<float> out(bytes.size() / 4);
    for (size_t i = 0; i < out.size(); ++i) {
      uint32_t bits = static_cast<uint32_t>(bytes[4*i])
                    | static_cast<uint32_t>(bytes[4*i+1]) << 8
                    | static_cast<uint32_t>(bytes[4*i+2]) << 16
                    | static_cast<uint32_t>(bytes[4*i+3]) << 24;
      std::memcpy(&out[i], &bits, sizeof(bits));
    }
    return out;
  }

} // namespace vindex
