#include "HnswIndex.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "Distance.hpp"
#include "core/errors/Error.hpp"

namespace vindex {

namespace {

// Admits only labels that belong to one scope.
class ScopeFilter : public hnswlib::BaseFilterFunctor {
public:
  explicit ScopeFilter(const std::set<InternalId>& members) : members_(members) {}
  bool operator()(hnswlib::labeltype label) override {
    return members_.count(static_cast<InternalId>(label)) != 0;
  }

private:
  const std::set<InternalId>& members_;
};

hnswlib::labeltype to_label(InternalId id) {
  return static_cast<hnswlib::labeltype>(id);
}

} // namespace

HnswIndex::HnswIndex(size_t dimension, size_t capacity)
  : dim_(dimension), capacity_(capacity), space_(dimension) {
  if (dim_ == 0) throw Error(ErrorCode::InvalidArgument, "index dimension must be >= 1");
  if (capacity_ == 0) throw Error(ErrorCode::InvalidArgument, "index capacity must be >= 1");
  clear();
}

bool HnswIndex::contains(InternalId id) const {
  return scopeOf_.count(id) != 0;
}

void HnswIndex::reserve(size_t n) {
  if (n <= capacity_) return;
  try {
    hnsw_->resizeIndex(n);
  } catch (const std::exception& e) {
    throw Error(ErrorCode::Internal, "index resize failed", e.what());
  }
  capacity_ = n;
}

void HnswIndex::checkInsert(InternalId id, const Embedding& v) const {
  if (v.size() != dim_) {
    throw Error(ErrorCode::DimensionMismatch,
                "embedding has " + std::to_string(v.size()) + " components, index expects " +
                std::to_string(dim_));
  }
  if (!all_finite(v)) {
    throw Error(ErrorCode::InvalidArgument, "embedding has non-finite components");
  }
  if (id < 0) throw Error(ErrorCode::InvalidArgument, "internal id must be non-negative");
  if (!contains(id) && size() >= capacity_) {
    throw Error(ErrorCode::CapacityExceeded,
                "index is full (" + std::to_string(capacity_) + " elements)");
  }
}

void HnswIndex::checkQuery(const Embedding& query) const {
  if (query.size() != dim_) {
    throw Error(ErrorCode::DimensionMismatch,
                "query has " + std::to_string(query.size()) + " components, index expects " +
                std::to_string(dim_));
  }
  if (!all_finite(query)) {
    throw Error(ErrorCode::InvalidArgument, "query has non-finite components");
  }
}

void HnswIndex::upsert(InternalId id, const Embedding& v) {
  upsertScoped(id, std::string(), v);
}

void HnswIndex::upsertScoped(InternalId id, const std::string& scope, const Embedding& v) {
  checkInsert(id, v);

  const std::vector<float> unit = normalized(v);
  const hnswlib::labeltype label = to_label(id);
  try {
    if (contains(id)) {
      hnsw_->addPoint(unit.data(), label, false);
    } else if (hnsw_->label_lookup_.count(label) != 0) {
      // Removed earlier and its slot not yet recycled: revive it in place.
      hnsw_->unmarkDelete(label);
      hnsw_->addPoint(unit.data(), label, false);
    } else {
      hnsw_->addPoint(unit.data(), label, true);
    }
  } catch (const std::exception& e) {
    throw Error(ErrorCode::Internal, "index insert failed", e.what());
  }

  auto it = scopeOf_.find(id);
  if (it != scopeOf_.end() && it->second != scope) {
    detachScope(id, it->second);
  }
  scopeOf_[id] = scope;
  scopes_[scope].insert(id);
}

void HnswIndex::remove(InternalId id) {
  auto it = scopeOf_.find(id);
  if (it == scopeOf_.end()) return;
  try {
    hnsw_->markDelete(to_label(id));
  } catch (const std::exception& e) {
    throw Error(ErrorCode::Internal, "index delete failed", e.what());
  }
  detachScope(id, it->second);
  scopeOf_.erase(it);
}

void HnswIndex::detachScope(InternalId id, const std::string& scope) {
  auto sit = scopes_.find(scope);
  if (sit == scopes_.end()) return;
  sit->second.erase(id);
  if (sit->second.empty()) scopes_.erase(sit);
}

void HnswIndex::clear() {
  hnsw_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
    &space_, capacity_, kM, kEfConstruction, 100, true);
  scopeOf_.clear();
  scopes_.clear();
}

std::vector<IndexHit> HnswIndex::knn(const Embedding& query, size_t k,
                                     hnswlib::BaseFilterFunctor* filter) const {
  const std::vector<float> q = normalized(query);
  hnsw_->setEf(std::max(k, kEfSearch));

  auto result = hnsw_->searchKnn(q.data(), k, filter);
  std::vector<IndexHit> hits;
  hits.reserve(result.size());
  while (!result.empty()) {
    const auto& top = result.top();
    hits.push_back({static_cast<InternalId>(top.second), 1.0f - top.first});
    result.pop();
  }
  std::sort(hits.begin(), hits.end(), [](const IndexHit& a, const IndexHit& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.id < b.id;
  });
  return hits;
}

std::vector<IndexHit> HnswIndex::search(const Embedding& query, size_t k) const {
  checkQuery(query);
  if (k == 0 || scopeOf_.empty()) return {};
  return knn(query, k, nullptr);
}

std::vector<IndexHit> HnswIndex::searchScope(const std::string& scope,
                                             const Embedding& query,
                                             size_t k) const {
  checkQuery(query);
  auto sit = scopes_.find(scope);
  if (k == 0 || sit == scopes_.end()) return {};

  ScopeFilter filter(sit->second);
  return knn(query, std::min(k, sit->second.size()), &filter);
}

size_t HnswIndex::scopeSize(const std::string& scope) const {
  auto sit = scopes_.find(scope);
  return sit == scopes_.end() ? 0 : sit->second.size();
}

} // namespace vindex
