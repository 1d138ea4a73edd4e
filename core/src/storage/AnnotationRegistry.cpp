#include "cm/storage/AnnotationRegistry.hpp"

#include <algorithm>

namespace cm {

AnnotationRegistry::AnnotationRegistry(KeyValueStore& kv, const Clock& clock,
                                       const RegistryConfig& cfg,
                                       const StoreConfig& storeCfg)
  : kv_(kv), clock_(clock), cfg_(cfg), storeCfg_(storeCfg) {
  storeCfg_.fixedContext = true;
}

std::shared_ptr<AnnotationStore> AnnotationRegistry::acquire(const AnnotationContext& ctx) {
  for (auto& e : entries_) {
    if (e.store->context() == ctx) {
      e.lastUse = ++useCounter_;
      return e.store;
    }
  }

  Entry e;
  for (auto it = closed_.begin(); it != closed_.end();) {
    auto held = it->lock();
    if (!held) {
      it = closed_.erase(it);
    } else if (held->context() == ctx) {
      e.store = held;
      closed_.erase(it);
      break;
    } else {
      ++it;
    }
  }
  if (!e.store) e.store = std::make_shared<AnnotationStore>(kv_, clock_, ctx, storeCfg_);
  e.lastUse = ++useCounter_;
  entries_.push_back(e);

  std::shared_ptr<AnnotationStore> result = e.store;
  evict(result.get());
  return result;
}

std::shared_ptr<AnnotationStore> AnnotationRegistry::find(const AnnotationContext& ctx) const {
  for (const auto& e : entries_) {
    if (e.store->context() == ctx) return e.store;
  }
  return nullptr;
}

bool AnnotationRegistry::close(const AnnotationContext& ctx) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e) { return e.store->context() == ctx; });
  if (it == entries_.end()) return false;
  if (it->store.use_count() > 1) closed_.push_back(it->store);
  entries_.erase(it);
  return true;
}

void AnnotationRegistry::setConfig(const RegistryConfig& cfg) {
  cfg_ = cfg;
  evict(nullptr);
}

void AnnotationRegistry::evict(const AnnotationStore* keep) {
  while (entries_.size() > cfg_.maxCachedContexts) {
    // Oldest entry held only by the registry.
    auto victim = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->store.get() == keep) continue;
      if (it->store.use_count() > 1) continue;
      if (victim == entries_.end() || it->lastUse < victim->lastUse) victim = it;
    }
    if (victim == entries_.end()) return; // everything still referenced
    entries_.erase(victim);
  }
}

} // namespace cm
