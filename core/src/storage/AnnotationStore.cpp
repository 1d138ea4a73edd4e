#include "cm/storage/AnnotationStore.hpp"
#include "cm/annotation/AnnotationCodec.hpp"

#include <algorithm>
#include <cstdio>

namespace cm {

AnnotationStore::AnnotationStore(KeyValueStore& kv, const Clock& clock,
                                 const AnnotationContext& ctx,
                                 const StoreConfig& cfg)
  : kv_(kv), clock_(clock), ctx_(ctx), cfg_(cfg),
    listeners_(std::make_shared<ListenerList>()) {
  load();
}

// -------------------- Mutations --------------------

const Annotation* AnnotationStore::create(const Annotation& payload) {
  std::string reason;
  if (!validateAnnotation(payload, reason)) {
    std::fprintf(stderr, "[AnnotationStore] rejected %s: %s\n",
                 annotationTypeName(payload.type), reason.c_str());
    return nullptr;
  }

  Annotation a = payload;
  normalizeAnnotation(a);

  std::int64_t stamp = nextStamp();
  a.createdAt = stamp;
  a.updatedAt = stamp;
  do {
    a.id = ids_.next(stamp);
  } while (get(a.id) != nullptr);

  // Stamps are strictly increasing, so appending keeps createdAt order.
  AnnotationId id = a.id;
  annotations_.push_back(std::move(a));
  persist();
  notify();
  // Listeners may have mutated the set; back() is not necessarily ours.
  return get(id);
}

const Annotation* AnnotationStore::update(const AnnotationId& id,
                                          const AnnotationPatch& patch) {
  Annotation* target = findMutable(id);
  if (!target) return nullptr;

  Annotation merged = *target;
  applyPatch(merged, patch);
  merged.id = target->id;
  merged.type = target->type;
  merged.createdAt = target->createdAt;

  std::string reason;
  if (!validateAnnotation(merged, reason)) {
    std::fprintf(stderr, "[AnnotationStore] rejected update of %s: %s\n",
                 id.c_str(), reason.c_str());
    return nullptr;
  }
  normalizeAnnotation(merged);
  merged.updatedAt = nextStamp();

  *target = std::move(merged);
  persist();
  notify();
  return findMutable(id);
}

bool AnnotationStore::remove(const AnnotationId& id) {
  auto it = std::find_if(annotations_.begin(), annotations_.end(),
                         [&](const Annotation& a) { return a.id == id; });
  if (it == annotations_.end()) return false;
  annotations_.erase(it);
  persist();
  notify();
  return true;
}

void AnnotationStore::clearAll() {
  annotations_.clear();
  if (readOnly_) {
    std::fprintf(stderr, "[AnnotationStore] not removing newer record %s\n",
                 storageKey().c_str());
    persistOk_ = false;
    notify();
    return;
  }
  persistOk_ = kv_.remove(storageKey());
  if (!persistOk_) {
    std::fprintf(stderr, "[AnnotationStore] clear failed for key %s\n",
                 storageKey().c_str());
  }
  notify();
}

// -------------------- Queries --------------------

const Annotation* AnnotationStore::get(const AnnotationId& id) const {
  for (const auto& a : annotations_) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

Annotation* AnnotationStore::findMutable(const AnnotationId& id) {
  for (auto& a : annotations_) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

// -------------------- Subscription --------------------

std::function<void()> AnnotationStore::subscribe(Listener listener) {
  std::uint32_t token = nextToken_++;
  listeners_->push_back(ListenerSlot{token, std::move(listener)});

  std::weak_ptr<ListenerList> weak = listeners_;
  return [weak, token]() {
    auto list = weak.lock();
    if (!list) return;
    list->erase(std::remove_if(list->begin(), list->end(),
                               [token](const ListenerSlot& s) { return s.token == token; }),
                list->end());
  };
}

void AnnotationStore::notify() {
  // Listeners may unsubscribe (or subscribe) from inside the callback.
  ListenerList snapshot = *listeners_;
  for (const auto& slot : snapshot) {
    if (slot.fn) slot.fn(annotations_);
  }
}

// -------------------- Context --------------------

bool AnnotationStore::switchContext(const AnnotationContext& ctx) {
  if (cfg_.fixedContext) {
    std::fprintf(stderr, "[AnnotationStore] %s is bound to its context; acquire %s instead\n",
                 storageKey().c_str(), storageKeyFor(ctx, cfg_.keyPrefix).c_str());
    return false;
  }
  ctx_ = ctx;
  annotations_.clear();
  load();
  notify();
  return true;
}

void AnnotationStore::load() {
  annotations_.clear();
  persistOk_ = true;
  readOnly_ = false;

  std::string key = storageKey();
  std::string raw;
  if (!kv_.get(key, raw)) return; // never written: empty context

  std::vector<Annotation> loaded;
  DecodeReport report;
  if (!decodeAnnotationRecord(raw, loaded, report)) {
    std::fprintf(stderr, "[AnnotationStore] load failed for key %s: %s\n",
                 key.c_str(), report.error.c_str());
    readOnly_ = report.version > kAnnotationFormatVersion;
    return;
  }
  if (report.skipped > 0) {
    std::fprintf(stderr, "[AnnotationStore] skipped %zu malformed record(s) in %s\n",
                 report.skipped, key.c_str());
  }

  annotations_ = std::move(loaded);
  for (const auto& a : annotations_) {
    lastStamp_ = std::max(lastStamp_, a.updatedAt);
  }
}

void AnnotationStore::persist() {
  std::string key = storageKey();
  if (readOnly_) {
    std::fprintf(stderr, "[AnnotationStore] not overwriting newer record %s\n", key.c_str());
    persistOk_ = false;
    return;
  }
  persistOk_ = kv_.set(key, encodeAnnotationRecord(ctx_, annotations_));
  if (!persistOk_) {
    std::fprintf(stderr, "[AnnotationStore] write failed for key %s\n", key.c_str());
  }
}

std::int64_t AnnotationStore::nextStamp() {
  std::int64_t now = clock_.nowMs();
  lastStamp_ = std::max(now, lastStamp_ + 1);
  return lastStamp_;
}

// -------------------- Shorthands --------------------

const Annotation* AnnotationStore::createHorizontalLine(double price) {
  return create(makeHorizontalLine(price));
}

const Annotation* AnnotationStore::createVerticalLine(const TimeValue& time) {
  return create(makeVerticalLine(time));
}

const Annotation* AnnotationStore::createTrendline(const DomainPoint& start,
                                                   const DomainPoint& end) {
  return create(makeTrendline(start, end));
}

const Annotation* AnnotationStore::createRectangle(const DomainPoint& start,
                                                   const DomainPoint& end) {
  return create(makeRectangle(start, end));
}

const Annotation* AnnotationStore::createFibonacci(const DomainPoint& start,
                                                   const DomainPoint& end) {
  return create(makeFibonacci(start, end));
}

const Annotation* AnnotationStore::createArrow(const DomainPoint& point,
                                               ArrowDirection direction) {
  return create(makeArrow(point, direction));
}

const Annotation* AnnotationStore::createText(const DomainPoint& point,
                                              const std::string& text) {
  return create(makeText(point, text));
}

} // namespace cm
