#include "cm/surface/DrawingSurface.hpp"

namespace cm {

DrawingSurface::DrawingSurface(std::string surfaceId, HostSurface& host,
                               std::shared_ptr<AnnotationStore> store,
                               const InteractionConfig& cfg,
                               const OverlayTheme& theme)
  : id_(std::move(surfaceId)), host_(host), store_(std::move(store)),
    controller_(*store_, host, cfg), renderer_(theme) {
  unsubStore_ = store_->subscribe([this](const std::vector<Annotation>&) { invalidate(); });
  unsubHost_ = host_.onVisibleRangeChanged([this]() { invalidate(); });
  controller_.onInteractionChanged([this]() { invalidate(); });
}

DrawingSurface::~DrawingSurface() {
  if (unsubStore_) unsubStore_();
  if (unsubHost_) unsubHost_();
}

void DrawingSurface::setTheme(const OverlayTheme& theme) {
  renderer_.setTheme(theme);
  invalidate();
}

void DrawingSurface::bindStore(std::shared_ptr<AnnotationStore> store) {
  if (!store || store == store_) return;
  if (unsubStore_) unsubStore_();
  store_ = std::move(store);
  controller_.setStore(*store_);
  unsubStore_ = store_->subscribe([this](const std::vector<Annotation>&) { invalidate(); });
  invalidate();
}

void DrawingSurface::invalidate() {
  dirty_ = true;
  invalidations_++;
}

RenderStats DrawingSurface::paint(PaintSurface& target) {
  InteractionPreview preview = controller_.preview();
  RenderStats stats = renderer_.render(target, controller_.mapper(), store_->getAll(),
                                       controller_.selection(), &preview);
  dirty_ = false;
  return stats;
}

} // namespace cm
