#include "cm/surface/SurfaceCoordinator.hpp"

#include <algorithm>
#include <cstdio>

namespace cm {

SurfaceCoordinator::SurfaceCoordinator(AnnotationRegistry& registry,
                                       std::string symbol, std::string timeframe,
                                       const CoordinatorConfig& cfg,
                                       const InteractionConfig& interaction)
  : registry_(registry), symbol_(std::move(symbol)), timeframe_(std::move(timeframe)),
    config_(cfg), interaction_(interaction) {}

// -------------------- Surfaces --------------------

DrawingSurface* SurfaceCoordinator::addPrimary(const std::string& surfaceId, HostSurface& host) {
  for (const auto& e : surfaces_) {
    if (e.primary) {
      std::fprintf(stderr, "[SurfaceCoordinator] primary surface already registered\n");
      return nullptr;
    }
  }
  return addSurface(surfaceId, host, true);
}

DrawingSurface* SurfaceCoordinator::addAuxiliary(const std::string& surfaceId, HostSurface& host) {
  return addSurface(surfaceId, host, false);
}

DrawingSurface* SurfaceCoordinator::addSurface(const std::string& surfaceId,
                                               HostSurface& host, bool primary) {
  if (surfaceId.empty() || find(surfaceId)) {
    std::fprintf(stderr, "[SurfaceCoordinator] surface id '%s' rejected\n", surfaceId.c_str());
    return nullptr;
  }

  AnnotationContext ctx{symbol_, timeframe_, surfaceId};
  Entry e;
  e.primary = primary;
  e.surface = std::make_unique<DrawingSurface>(surfaceId, host, registry_.acquire(ctx), interaction_);

  InteractionController& ctrl = e.surface->controller();
  ctrl.setActiveTool(tool_);
  ctrl.onDrawCompleted([this](const Annotation& a) { onDrawCompleted(a); });

  surfaces_.push_back(std::move(e));
  DrawingSurface* added = surfaces_.back().surface.get();

  // The primary surface starts out active; otherwise the first one added.
  if (activeId_.empty() || primary) activeId_ = surfaceId;
  return added;
}

bool SurfaceCoordinator::removeSurface(const std::string& surfaceId) {
  auto it = std::find_if(surfaces_.begin(), surfaces_.end(), [&](const Entry& e) {
    return e.surface->id() == surfaceId;
  });
  if (it == surfaces_.end() || it->primary) return false;

  AnnotationContext ctx = it->surface->store().context();
  surfaces_.erase(it);
  registry_.close(ctx);

  if (activeId_ == surfaceId) {
    DrawingSurface* p = primary();
    activeId_ = p ? p->id() : (surfaces_.empty() ? std::string() : surfaces_.front().surface->id());
  }
  return true;
}

SurfaceCoordinator::Entry* SurfaceCoordinator::find(const std::string& surfaceId) {
  for (auto& e : surfaces_) {
    if (e.surface->id() == surfaceId) return &e;
  }
  return nullptr;
}

DrawingSurface* SurfaceCoordinator::surface(const std::string& surfaceId) {
  Entry* e = find(surfaceId);
  return e ? e->surface.get() : nullptr;
}

DrawingSurface* SurfaceCoordinator::primary() {
  for (auto& e : surfaces_) {
    if (e.primary) return e.surface.get();
  }
  return nullptr;
}

DrawingSurface* SurfaceCoordinator::activeSurface() {
  return surface(activeId_);
}

// -------------------- Shared tool --------------------

void SurfaceCoordinator::setActiveTool(ActiveTool tool) {
  if (tool == tool_) return;
  tool_ = tool;
  for (auto& e : surfaces_) e.surface->controller().setActiveTool(tool);
  if (toolCb_) toolCb_(tool);
}

void SurfaceCoordinator::onDrawCompleted(const Annotation& a) {
  (void)a;
  if (!config_.autoDeselectSingleClickTools) return;
  if (isSingleClickTool(tool_) || tool_ == ActiveTool::Text) {
    setActiveTool(ActiveTool::None);
  }
}

void SurfaceCoordinator::setInteractionConfig(const InteractionConfig& cfg) {
  interaction_ = cfg;
  for (auto& e : surfaces_) e.surface->controller().setConfig(cfg);
}

// -------------------- Activation --------------------

bool SurfaceCoordinator::activate(const std::string& surfaceId) {
  if (!find(surfaceId)) return false;
  if (activeId_ == surfaceId) return true;

  for (auto& e : surfaces_) {
    if (e.surface->id() != surfaceId) e.surface->controller().cancel();
  }
  activeId_ = surfaceId;
  return true;
}

// -------------------- Routing --------------------

bool SurfaceCoordinator::pointerDown(const std::string& surfaceId, const PointerEvent& e) {
  Entry* entry = find(surfaceId);
  if (!entry) return false;

  if (activeId_ != surfaceId) {
    activate(surfaceId);
    if (!entry->primary) {
      entry->swallowUp = true;
      return true;
    }
  }
  entry->swallowUp = false;
  return entry->surface->controller().pointerDown(e);
}

void SurfaceCoordinator::pointerMove(const std::string& surfaceId, const PointerEvent& e) {
  Entry* entry = find(surfaceId);
  if (!entry) return;
  entry->surface->controller().pointerMove(e);
}

void SurfaceCoordinator::pointerUp(const std::string& surfaceId, const PointerEvent& e) {
  Entry* entry = find(surfaceId);
  if (!entry) return;
  if (entry->swallowUp) {
    entry->swallowUp = false;
    return;
  }
  if (activeId_ != surfaceId) return;
  entry->surface->controller().pointerUp(e);
}

void SurfaceCoordinator::pointerLeave(const std::string& surfaceId) {
  Entry* entry = find(surfaceId);
  if (!entry) return;
  entry->swallowUp = false;
  entry->surface->controller().pointerLeave();
}

void SurfaceCoordinator::doubleClick(const std::string& surfaceId, const PointerEvent& e) {
  if (activeId_ != surfaceId) return;
  Entry* entry = find(surfaceId);
  if (entry) entry->surface->controller().doubleClick(e);
}

ContextMenuRequest SurfaceCoordinator::openContextMenu(const std::string& surfaceId,
                                                       double x, double y) {
  Entry* entry = find(surfaceId);
  if (!entry) return ContextMenuRequest{};
  activate(surfaceId);
  return entry->surface->controller().openContextMenu(x, y);
}

bool SurfaceCoordinator::keyDown(KeyCode key) {
  DrawingSurface* s = activeSurface();
  return s ? s->controller().keyDown(key) : false;
}

// -------------------- Context --------------------

void SurfaceCoordinator::switchContext(const std::string& symbol, const std::string& timeframe) {
  if (symbol == symbol_ && timeframe == timeframe_) return;
  symbol_ = symbol;
  timeframe_ = timeframe;

  for (auto& e : surfaces_) {
    AnnotationContext ctx{symbol_, timeframe_, e.surface->id()};
    e.swallowUp = false;
    e.surface->bindStore(registry_.acquire(ctx));
  }
}

} // namespace cm
