#pragma once
#include "cm/storage/AnnotationStore.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace cm {

struct RegistryConfig {
  std::size_t maxCachedContexts{16};
};

// Owns one AnnotationStore per context. Created by the composition root and
// passed to whoever needs stores. Stores nobody else holds are evicted
// least-recently-used first once more than maxCachedContexts are cached;
// close() drops a context immediately. Evicted stores lose nothing: their
// state is already persisted and is reloaded on the next acquire().
// At most one live store exists per context: a closed store that is still
// held is handed out again rather than reloaded, and registry stores refuse
// switchContext().
class AnnotationRegistry {
public:
  AnnotationRegistry(KeyValueStore& kv, const Clock& clock,
                     const RegistryConfig& cfg = RegistryConfig{},
                     const StoreConfig& storeCfg = StoreConfig{});

  // Returns the cached store for `ctx`, creating (and loading) it on first use.
  std::shared_ptr<AnnotationStore> acquire(const AnnotationContext& ctx);

  // Cached store or nullptr; does not create.
  std::shared_ptr<AnnotationStore> find(const AnnotationContext& ctx) const;

  // Forgets the context. Holders keep a working store, and acquire() returns
  // that same store while any holder remains. False if not cached.
  bool close(const AnnotationContext& ctx);

  bool contains(const AnnotationContext& ctx) const { return find(ctx) != nullptr; }
  std::size_t size() const { return entries_.size(); }

  void setConfig(const RegistryConfig& cfg);
  const RegistryConfig& config() const { return cfg_; }

private:
  struct Entry {
    std::shared_ptr<AnnotationStore> store;
    std::uint64_t lastUse{0};
  };

  void evict(const AnnotationStore* keep);

  KeyValueStore& kv_;
  const Clock& clock_;
  RegistryConfig cfg_;
  StoreConfig storeCfg_;
  std::vector<Entry> entries_;
  std::vector<std::weak_ptr<AnnotationStore>> closed_;
  std::uint64_t useCounter_{0};
};

} // namespace cm
