#pragma once
#include "cm/annotation/Annotation.hpp"
#include "cm/annotation/AnnotationContext.hpp"
#include "cm/annotation/AnnotationPatch.hpp"
#include "cm/ids/AnnotationId.hpp"
#include "cm/storage/Clock.hpp"
#include "cm/storage/KeyValueStore.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cm {

struct StoreConfig {
  std::string keyPrefix{"annotations"};
  // Set for registry-owned stores, which are keyed by their context.
  bool fixedContext{false};
};

// Authoritative annotation set for one context. Every mutation stamps,
// persists synchronously and notifies subscribers before returning.
// Returned pointers stay valid until the next mutation or context switch.
class AnnotationStore {
public:
  using Listener = std::function<void(const std::vector<Annotation>&)>;

  AnnotationStore(KeyValueStore& kv, const Clock& clock,
                  const AnnotationContext& ctx,
                  const StoreConfig& cfg = StoreConfig{});

  // Assigns id, createdAt/updatedAt; ignores whatever the payload carries in
  // those fields. Returns nullptr (and stores nothing) on an invalid payload.
  const Annotation* create(const Annotation& payload);

  // Merges `patch`; id, type and createdAt are preserved. nullptr when `id`
  // is unknown or the merged annotation would be invalid.
  const Annotation* update(const AnnotationId& id, const AnnotationPatch& patch);

  bool remove(const AnnotationId& id);
  void clearAll();

  const Annotation* get(const AnnotationId& id) const;
  const std::vector<Annotation>& getAll() const { return annotations_; } // createdAt ascending
  std::size_t count() const { return annotations_.size(); }

  // Returns an unsubscribe function. Safe to call after the store is gone.
  std::function<void()> subscribe(Listener listener);

  // Drops the in-memory set and loads (or starts empty) the new context.
  // False (nothing changes) when the store was created with fixedContext.
  bool switchContext(const AnnotationContext& ctx);
  const AnnotationContext& context() const { return ctx_; }
  std::string storageKey() const { return storageKeyFor(ctx_, cfg_.keyPrefix); }

  // False when the most recent write could not be persisted; the in-memory
  // set is still current.
  bool lastPersistOk() const { return persistOk_; }

  // True when the stored record has a newer format version. Such a record is
  // never overwritten or removed; mutations stay in memory.
  bool readOnly() const { return readOnly_; }

  // Shorthands over the make*() payload constructors.
  const Annotation* createHorizontalLine(double price);
  const Annotation* createVerticalLine(const TimeValue& time);
  const Annotation* createTrendline(const DomainPoint& start, const DomainPoint& end);
  const Annotation* createRectangle(const DomainPoint& start, const DomainPoint& end);
  const Annotation* createFibonacci(const DomainPoint& start, const DomainPoint& end);
  const Annotation* createArrow(const DomainPoint& point, ArrowDirection direction);
  const Annotation* createText(const DomainPoint& point, const std::string& text);

private:
  struct ListenerSlot {
    std::uint32_t token;
    Listener fn;
  };
  using ListenerList = std::vector<ListenerSlot>;

  void load();
  void persist();
  void notify();
  std::int64_t nextStamp();
  Annotation* findMutable(const AnnotationId& id);

  KeyValueStore& kv_;
  const Clock& clock_;
  AnnotationContext ctx_;
  StoreConfig cfg_;

  std::vector<Annotation> annotations_;
  std::shared_ptr<ListenerList> listeners_;
  std::uint32_t nextToken_{1};
  AnnotationIdGenerator ids_;
  std::int64_t lastStamp_{0};
  bool persistOk_{true};
  bool readOnly_{false};
};

} // namespace cm
