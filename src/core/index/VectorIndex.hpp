#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vindex {

using InternalId = int64_t;
using Embedding = std::vector<float>;

struct IndexHit {
  InternalId id;
  float similarity;  // 1 - cosine distance
};

// Derived nearest-neighbor structure keyed by internal id. It is a cache over
// the vector ledger and can be cleared and refilled at any time.
// Implementations are not thread-safe; the owning store serializes access.
class VectorIndex {
public:
  virtual ~VectorIndex() = default;

  virtual size_t dimension() const = 0;
  virtual size_t size() const = 0;
  virtual size_t capacity() const = 0;
  virtual bool contains(InternalId id) const = 0;
  // Raises capacity to at least n. Never shrinks.
  virtual void reserve(size_t n) = 0;

  // Replaces any previous vector for id. Throws DimensionMismatch or
  // CapacityExceeded; on throw the index is unchanged.
  virtual void upsert(InternalId id, const Embedding& v) = 0;
  // Unknown ids are ignored.
  virtual void remove(InternalId id) = 0;
  virtual void clear() = 0;

  // Top-k over every member, similarity non-increasing.
  virtual std::vector<IndexHit> search(const Embedding& query, size_t k) const = 0;
};

// Optional capability: members carry a scope (project id) and queries can be
// restricted to one scope without post-filtering.
class ScopedSearch {
public:
  virtual ~ScopedSearch() = default;

  virtual void upsertScoped(InternalId id, const std::string& scope, const Embedding& v) = 0;
  virtual std::vector<IndexHit> searchScope(const std::string& scope,
                                            const Embedding& query,
                                            size_t k) const = 0;
  virtual size_t scopeSize(const std::string& scope) const = 0;
};

} // namespace vindex
