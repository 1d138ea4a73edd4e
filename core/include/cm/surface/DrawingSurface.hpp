#pragma once
#include "cm/host/HostSurface.hpp"
#include "cm/interaction/InteractionController.hpp"
#include "cm/render/AnnotationRenderer.hpp"
#include "cm/storage/AnnotationStore.hpp"

#include <functional>
#include <memory>
#include <string>

namespace cm {

// One annotatable chart viewport: host coordinates, the context's store,
// an interaction controller and a renderer. Marks itself dirty on store
// changes, interaction changes and host pan/zoom; paint() clears it.
class DrawingSurface {
public:
  DrawingSurface(std::string surfaceId, HostSurface& host,
                 std::shared_ptr<AnnotationStore> store,
                 const InteractionConfig& cfg = InteractionConfig{},
                 const OverlayTheme& theme = darkOverlayTheme());
  ~DrawingSurface();

  DrawingSurface(const DrawingSurface&) = delete;
  DrawingSurface& operator=(const DrawingSurface&) = delete;

  const std::string& id() const { return id_; }
  HostSurface& host() { return host_; }
  AnnotationStore& store() { return *store_; }
  const AnnotationStore& store() const { return *store_; }
  InteractionController& controller() { return controller_; }
  const InteractionController& controller() const { return controller_; }
  const AnnotationRenderer& renderer() const { return renderer_; }

  void setTheme(const OverlayTheme& theme);

  // Context switch: rebinds to `store`, abandoning pending work.
  void bindStore(std::shared_ptr<AnnotationStore> store);

  bool needsRepaint() const { return dirty_; }
  void invalidate();
  std::size_t invalidationCount() const { return invalidations_; }

  RenderStats paint(PaintSurface& target);

private:
  std::string id_;
  HostSurface& host_;
  std::shared_ptr<AnnotationStore> store_;
  InteractionController controller_;
  AnnotationRenderer renderer_;

  std::function<void()> unsubStore_;
  std::function<void()> unsubHost_;
  bool dirty_{true};
  std::size_t invalidations_{0};
};

} // namespace cm
