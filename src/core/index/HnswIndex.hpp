#pragma once
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "hnswlib/hnswlib.h"

#include "VectorIndex.hpp"

namespace vindex {

// HNSW over inner product. Vectors are stored unit-normalized, so the
// similarity of a hit is 1 - distance (cosine). Deleted slots are recycled by
// later inserts. Equal similarities are ordered by ascending internal id.
class HnswIndex : public VectorIndex, public ScopedSearch {
public:
  static constexpr size_t kM = 16;
  static constexpr size_t kEfConstruction = 200;
  static constexpr size_t kEfSearch = 64;

  HnswIndex(size_t dimension, size_t capacity);

  size_t dimension() const override { return dim_; }
  size_t size() const override { return scopeOf_.size(); }
  size_t capacity() const override { return capacity_; }
  bool contains(InternalId id) const override;
  void reserve(size_t n) override;

  void upsert(InternalId id, const Embedding& v) override;
  void remove(InternalId id) override;
  void clear() override;
  std::vector<IndexHit> search(const Embedding& query, size_t k) const override;

  void upsertScoped(InternalId id, const std::string& scope, const Embedding& v) override;
  std::vector<IndexHit> searchScope(const std::string& scope,
                                    const Embedding& query,
                                    size_t k) const override;
  size_t scopeSize(const std::string& scope) const override;

private:
  void checkInsert(InternalId id, const Embedding& v) const;
  void checkQuery(const Embedding& query) const;
  void detachScope(InternalId id, const std::string& scope);
  std::vector<IndexHit> knn(const Embedding& query, size_t k,
                            hnswlib::BaseFilterFunctor* filter) const;

  size_t dim_;
  size_t capacity_;
  hnswlib::InnerProductSpace space_;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw_;
  // Live members only; hnswlib keeps deleted labels until their slot is reused.
  std::unordered_map<InternalId, std::string> scopeOf_;
  // Secondary index: scope -> members
  std::unordered_map<std::string, std::set<InternalId>> scopes_;
};

} // namespace vindex
