#pragma once
#include "cm/geometry/CoordinateMapper.hpp"
#include "cm/interaction/HitTester.hpp"
#include "cm/interaction/InputEvents.hpp"
#include "cm/interaction/InteractionState.hpp"
#include "cm/interaction/Tool.hpp"
#include "cm/storage/AnnotationStore.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace cm {

struct InteractionConfig {
  double hitTolerancePx{8.0};
  double dragThresholdPx{5.0};     // larger movement = host pan, not a click
  std::int64_t clickTimeoutMs{500}; // longer press = not a click
  double handleSizePx{8.0};
};

enum class ContextAction : std::uint8_t { Edit = 0, ToggleVisibility, ToggleLock, Delete };

const char* contextActionName(ContextAction action);
bool parseContextAction(const std::string& name, ContextAction& out);

struct ContextMenuRequest {
  bool open{false};
  AnnotationId id;
  double x{0}, y{0};
};

// What the render pass needs to paint in-progress geometry.
struct InteractionPreview {
  InteractionPhase phase{InteractionPhase::Idle};
  ActiveTool tool{ActiveTool::None};
  DomainPoint anchor;
  bool hasPointer{false};
  PixelPoint pointer;
  const Annotation* dragged{nullptr}; // tentative geometry while Dragging
};

// Per-surface pointer/keyboard state machine. Turns clicks into store
// mutations according to the active tool. Gestures that move further than
// dragThresholdPx belong to the host chart (pan) unless an annotation drag
// was engaged on pointer-down.
class InteractionController {
public:
  using SelectionCallback = std::function<void(const AnnotationId&)>; // "" = cleared
  using DrawCallback = std::function<void(const Annotation&)>;
  using TextEntryCallback = std::function<void(const DomainPoint&)>;
  using EditCallback = std::function<void(const AnnotationId&)>;
  using ChangeCallback = std::function<void()>;

  InteractionController(AnnotationStore& store, const HostSurface& host,
                        const InteractionConfig& cfg = InteractionConfig{});
  ~InteractionController();

  InteractionController(const InteractionController&) = delete;
  InteractionController& operator=(const InteractionController&) = delete;

  void setConfig(const InteractionConfig& cfg);
  const InteractionConfig& config() const { return config_; }

  // Changing tool abandons any pending draw. Tools stay active after a draw.
  void setActiveTool(ActiveTool tool);
  ActiveTool activeTool() const { return tool_; }

  // Rebinds to another context's store; cancels pending work and clears the
  // selection.
  void setStore(AnnotationStore& store);
  AnnotationStore& store() const { return *store_; }

  // Pointer input. pointerDown returns true when it engaged an annotation
  // drag, in which case the host should not pan.
  bool pointerDown(const PointerEvent& e);
  void pointerMove(const PointerEvent& e);
  void pointerUp(const PointerEvent& e);
  void pointerLeave();
  void doubleClick(const PointerEvent& e);

  // Escape aborts pending work and clears the selection. Delete/Backspace
  // remove the selection unless a text input has focus. Returns true when
  // the key was handled.
  bool keyDown(KeyCode key);
  void setTextInputFocused(bool focused) { textFocused_ = focused; }
  bool textInputFocused() const { return textFocused_; }

  // Completes TextEntryPending. Blank text abandons the entry.
  const Annotation* submitText(const std::string& text);
  void cancelTextEntry();

  // Aborts a pending draw or drag. Selection is kept.
  void cancel();

  const AnnotationId& selection() const { return selection_; }
  bool setSelection(const AnnotationId& id);
  void clearSelection() { setSelectionInternal(AnnotationId()); }

  // Right-click: hit-test and select; the active tool is left alone.
  ContextMenuRequest openContextMenu(double x, double y);
  bool applyContextAction(const AnnotationId& id, ContextAction action);

  void onSelectionChanged(SelectionCallback cb) { selectionCb_ = std::move(cb); }
  void onDrawCompleted(DrawCallback cb) { drawCb_ = std::move(cb); }
  void onTextEntryRequested(TextEntryCallback cb) { textCb_ = std::move(cb); }
  void onEditRequested(EditCallback cb) { editCb_ = std::move(cb); }
  // Any interaction change worth a repaint (preview, selection, drag).
  void onInteractionChanged(ChangeCallback cb) { changeCb_ = std::move(cb); }

  const InteractionState& state() const { return state_; }
  InteractionPreview preview() const;

  const CoordinateMapper& mapper() const { return mapper_; }
  const HitTester& hitTester() const { return hitTester_; }

private:
  struct Press {
    bool active{false};
    PointerEvent down;
    bool exceeded{false};
    bool hasPrevY{false};
    double prevY{0};
  };

  void dispatch(const InteractionEvent& e);
  void handleClick(const PointerEvent& e, const Press& press);
  void handleDrawClick(const PointerEvent& e, const Press& press);
  void completeTwoClick(const DomainPoint& end);
  bool buildDragged(double x, double y, Annotation& out) const;
  void commitDrag(double x, double y);
  bool deleteAnnotation(const AnnotationId& id);
  void bindStore(AnnotationStore& store);
  void onAnnotationsChanged();
  void setSelectionInternal(const AnnotationId& id);
  void publishDrawn(const Annotation* created);
  void notifyChanged();

  AnnotationStore* store_;
  std::function<void()> unsubscribe_;
  CoordinateMapper mapper_;
  HitTester hitTester_;
  InteractionConfig config_;

  ActiveTool tool_{ActiveTool::None};
  InteractionState state_;
  AnnotationId selection_;
  Press press_;
  bool hasPointer_{false};
  PixelPoint pointer_;
  bool textFocused_{false};

  Annotation dragDraft_;
  bool dragDraftValid_{false};

  SelectionCallback selectionCb_;
  DrawCallback drawCb_;
  TextEntryCallback textCb_;
  EditCallback editCb_;
  ChangeCallback changeCb_;
};

} // namespace cm
