#pragma once
#include "cm/storage/AnnotationRegistry.hpp"
#include "cm/surface/DrawingSurface.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cm {

struct CoordinatorConfig {
  // Drop back to no tool after a single-click draw (horizontal/vertical
  // line, arrow, text). Two-click tools always stay active.
  bool autoDeselectSingleClickTools{false};
};

// Shares one active tool and tool-panel flag across a primary surface and
// any number of auxiliary surfaces, each with its own store. Exactly one
// surface is active for drawing. A press on an inactive auxiliary surface
// only activates it; the click is not used for drawing.
class SurfaceCoordinator {
public:
  using ToolCallback = std::function<void(ActiveTool)>;

  SurfaceCoordinator(AnnotationRegistry& registry, std::string symbol, std::string timeframe,
                     const CoordinatorConfig& cfg = CoordinatorConfig{},
                     const InteractionConfig& interaction = InteractionConfig{});

  // Returns nullptr if the id is taken or a primary already exists.
  DrawingSurface* addPrimary(const std::string& surfaceId, HostSurface& host);
  DrawingSurface* addAuxiliary(const std::string& surfaceId, HostSurface& host);
  // Auxiliary surfaces only.
  bool removeSurface(const std::string& surfaceId);

  DrawingSurface* surface(const std::string& surfaceId);
  DrawingSurface* primary();
  DrawingSurface* activeSurface();
  std::size_t surfaceCount() const { return surfaces_.size(); }

  void setActiveTool(ActiveTool tool);
  ActiveTool activeTool() const { return tool_; }
  void onToolChanged(ToolCallback cb) { toolCb_ = std::move(cb); }

  void setToolPanelVisible(bool visible) { toolPanelVisible_ = visible; }
  bool toolPanelVisible() const { return toolPanelVisible_; }

  const std::string& activeSurfaceId() const { return activeId_; }
  // Cancels pending draws on every other surface.
  bool activate(const std::string& surfaceId);

  // Event routing. pointerDown returns true when the press was taken by
  // activation or an annotation drag, i.e. the host should not pan.
  bool pointerDown(const std::string& surfaceId, const PointerEvent& e);
  void pointerMove(const std::string& surfaceId, const PointerEvent& e);
  void pointerUp(const std::string& surfaceId, const PointerEvent& e);
  void pointerLeave(const std::string& surfaceId);
  void doubleClick(const std::string& surfaceId, const PointerEvent& e);
  ContextMenuRequest openContextMenu(const std::string& surfaceId, double x, double y);

  // Delivered to the active surface only.
  bool keyDown(KeyCode key);

  // Moves every surface to (symbol, timeframe, its own surfaceId).
  void switchContext(const std::string& symbol, const std::string& timeframe);
  const std::string& symbol() const { return symbol_; }
  const std::string& timeframe() const { return timeframe_; }

  void setConfig(const CoordinatorConfig& cfg) { config_ = cfg; }
  const CoordinatorConfig& config() const { return config_; }
  void setInteractionConfig(const InteractionConfig& cfg);

private:
  struct Entry {
    std::unique_ptr<DrawingSurface> surface;
    bool primary{false};
    bool swallowUp{false}; // press consumed by activation
  };

  DrawingSurface* addSurface(const std::string& surfaceId, HostSurface& host, bool primary);
  Entry* find(const std::string& surfaceId);
  void onDrawCompleted(const Annotation& a);

  AnnotationRegistry& registry_;
  std::string symbol_;
  std::string timeframe_;
  CoordinatorConfig config_;
  InteractionConfig interaction_;

  std::vector<Entry> surfaces_;
  std::string activeId_;
  ActiveTool tool_{ActiveTool::None};
  bool toolPanelVisible_{false};
  ToolCallback toolCb_;
};

} // namespace cm
