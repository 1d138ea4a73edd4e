#include "cm/interaction/InteractionController.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cm {

namespace {

HitTestConfig hitConfigFrom(const InteractionConfig& cfg) {
  HitTestConfig hc;
  hc.tolerancePx = cfg.hitTolerancePx;
  hc.handleSizePx = cfg.handleSizePx;
  return hc;
}

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  });
}

InteractionEvent eventOf(InteractionEventKind kind) {
  InteractionEvent e;
  e.kind = kind;
  return e;
}

} // namespace

const char* contextActionName(ContextAction action) {
  switch (action) {
    case ContextAction::Edit:             return "edit";
    case ContextAction::ToggleVisibility: return "toggleVisibility";
    case ContextAction::ToggleLock:       return "toggleLock";
    case ContextAction::Delete:           return "delete";
  }
  return "edit";
}

bool parseContextAction(const std::string& name, ContextAction& out) {
  if (name == "edit")             { out = ContextAction::Edit;             return true; }
  if (name == "toggleVisibility") { out = ContextAction::ToggleVisibility; return true; }
  if (name == "toggleLock")       { out = ContextAction::ToggleLock;       return true; }
  if (name == "delete")           { out = ContextAction::Delete;           return true; }
  return false;
}

InteractionController::InteractionController(AnnotationStore& store,
                                             const HostSurface& host,
                                             const InteractionConfig& cfg)
  : store_(&store), mapper_(host), hitTester_(mapper_), config_(cfg) {
  hitTester_.setConfig(hitConfigFrom(cfg));
  bindStore(store);
}

InteractionController::~InteractionController() {
  if (unsubscribe_) unsubscribe_();
}

void InteractionController::setConfig(const InteractionConfig& cfg) {
  config_ = cfg;
  hitTester_.setConfig(hitConfigFrom(cfg));
}

void InteractionController::bindStore(AnnotationStore& store) {
  if (unsubscribe_) unsubscribe_();
  store_ = &store;
  unsubscribe_ = store_->subscribe([this](const std::vector<Annotation>&) {
    onAnnotationsChanged();
  });
}

void InteractionController::setStore(AnnotationStore& store) {
  dispatch(eventOf(InteractionEventKind::Cancel));
  press_ = Press{};
  bindStore(store);
  setSelectionInternal(AnnotationId());
  notifyChanged();
}

void InteractionController::onAnnotationsChanged() {
  if (!selection_.empty() && !store_->get(selection_)) {
    setSelectionInternal(AnnotationId());
  }
  if (state_.phase == InteractionPhase::Dragging && !store_->get(state_.targetId)) {
    dispatch(eventOf(InteractionEventKind::Cancel));
  }
}

void InteractionController::dispatch(const InteractionEvent& e) {
  state_ = reduceInteraction(state_, e);
  if (state_.phase != InteractionPhase::Dragging) dragDraftValid_ = false;
}

// -------------------- Tool --------------------

void InteractionController::setActiveTool(ActiveTool tool) {
  if (tool == tool_) return;
  if (!state_.isIdle()) dispatch(eventOf(InteractionEventKind::Cancel));
  tool_ = tool;
  notifyChanged();
}

void InteractionController::cancel() {
  if (state_.isIdle()) return;
  dispatch(eventOf(InteractionEventKind::Cancel));
  notifyChanged();
}

// -------------------- Pointer --------------------

bool InteractionController::pointerDown(const PointerEvent& e) {
  if (e.button != PointerButton::Primary) return false;

  press_ = Press{};
  press_.active = true;
  press_.down = e;
  press_.hasPrevY = hasPointer_;
  press_.prevY = pointer_.y;

  hasPointer_ = true;
  pointer_ = PixelPoint{e.x, e.y};

  // Only the selected, unlocked annotation can be grabbed, and only with
  // the select tool.
  bool selecting = tool_ == ActiveTool::Select || tool_ == ActiveTool::None;
  if (!selecting || !state_.isIdle() || selection_.empty()) return false;

  const Annotation* sel = store_->get(selection_);
  if (!sel || !sel->visible || sel->locked) return false;

  DragHandle handle = hitTester_.hitHandle(*sel, e.x, e.y);
  if (handle == DragHandle::None) return false;

  InteractionEvent begin;
  begin.kind = InteractionEventKind::BeginDrag;
  begin.targetId = sel->id;
  begin.handle = handle;
  begin.pixel = PixelPoint{e.x, e.y};
  dispatch(begin);
  return true;
}

void InteractionController::pointerMove(const PointerEvent& e) {
  hasPointer_ = true;
  pointer_ = PixelPoint{e.x, e.y};

  if (press_.active && !press_.exceeded) {
    double dx = std::fabs(e.x - press_.down.x);
    double dy = std::fabs(e.y - press_.down.y);
    if (dx > config_.dragThresholdPx || dy > config_.dragThresholdPx) {
      press_.exceeded = true;
    }
  }

  if (state_.phase == InteractionPhase::Dragging) {
    if (press_.exceeded) {
      Annotation draft;
      dragDraftValid_ = buildDragged(e.x, e.y, draft);
      if (dragDraftValid_) dragDraft_ = std::move(draft);
      notifyChanged();
    }
    return;
  }

  if (state_.isDrawPending()) notifyChanged();
}

void InteractionController::pointerUp(const PointerEvent& e) {
  if (e.button != PointerButton::Primary || !press_.active) return;

  Press press = press_;
  press_ = Press{};
  hasPointer_ = true;
  pointer_ = PixelPoint{e.x, e.y};

  if (state_.phase == InteractionPhase::Dragging) {
    if (press.exceeded) {
      commitDrag(e.x, e.y);
      dispatch(eventOf(InteractionEventKind::EndDrag));
      notifyChanged();
      return;
    }
    // Grabbed but never moved: treat as an ordinary click.
    dispatch(eventOf(InteractionEventKind::EndDrag));
  }

  if (press.exceeded) return; // host pan
  if (e.timeMs - press.down.timeMs >= config_.clickTimeoutMs) return;

  handleClick(e, press);
}

void InteractionController::pointerLeave() {
  hasPointer_ = false;
  press_ = Press{};
  if (state_.phase == InteractionPhase::Dragging) {
    dispatch(eventOf(InteractionEventKind::Cancel));
  }
  notifyChanged();
}

void InteractionController::doubleClick(const PointerEvent& e) {
  if (!state_.isIdle()) return;
  AnnotationHit hit = hitTester_.hitTest(store_->getAll(), e.x, e.y);
  if (!hit.hit) return;
  setSelectionInternal(hit.id);
  if (editCb_) editCb_(hit.id);
}

// -------------------- Clicks --------------------

void InteractionController::handleClick(const PointerEvent& e, const Press& press) {
  switch (tool_) {
    case ActiveTool::None:
    case ActiveTool::Select: {
      AnnotationHit hit = hitTester_.hitTest(store_->getAll(), e.x, e.y);
      setSelectionInternal(hit.hit ? hit.id : AnnotationId());
      return;
    }

    case ActiveTool::Delete: {
      AnnotationHit hit = hitTester_.hitTest(store_->getAll(), e.x, e.y);
      if (hit.hit) deleteAnnotation(hit.id);
      return;
    }

    case ActiveTool::HorizontalLine:
    case ActiveTool::VerticalLine:
    case ActiveTool::Arrow:
    case ActiveTool::Text:
    case ActiveTool::Trendline:
    case ActiveTool::Rectangle:
    case ActiveTool::Fibonacci:
      handleDrawClick(e, press);
      return;
  }
}

void InteractionController::handleDrawClick(const PointerEvent& e, const Press& press) {
  DomainPoint p;
  if (!mapper_.pixelToDomain(e.x, e.y, p)) return;

  switch (tool_) {
    case ActiveTool::HorizontalLine:
      publishDrawn(store_->createHorizontalLine(p.price));
      return;

    case ActiveTool::VerticalLine:
      publishDrawn(store_->createVerticalLine(p.time));
      return;

    case ActiveTool::Arrow: {
      // Points up unless the click landed below the last known pointer.
      ArrowDirection dir = ArrowDirection::Up;
      if (press.hasPrevY && e.y > press.prevY) dir = ArrowDirection::Down;
      publishDrawn(store_->createArrow(p, dir));
      return;
    }

    case ActiveTool::Text: {
      if (state_.phase == InteractionPhase::TextEntryPending) {
        dispatch(eventOf(InteractionEventKind::Cancel));
      }
      InteractionEvent begin;
      begin.kind = InteractionEventKind::BeginText;
      begin.point = p;
      dispatch(begin);
      if (textCb_) textCb_(p);
      notifyChanged();
      return;
    }

    case ActiveTool::Trendline:
    case ActiveTool::Rectangle:
    case ActiveTool::Fibonacci:
      if (state_.phase == InteractionPhase::AwaitingSecondPoint && state_.tool == tool_) {
        completeTwoClick(p);
        return;
      }
      if (state_.isIdle()) {
        InteractionEvent begin;
        begin.kind = InteractionEventKind::BeginTwoClick;
        begin.tool = tool_;
        begin.point = p;
        dispatch(begin);
        notifyChanged();
      }
      return;

    case ActiveTool::None:
    case ActiveTool::Select:
    case ActiveTool::Delete:
      return;
  }
}

void InteractionController::completeTwoClick(const DomainPoint& end) {
  const DomainPoint start = state_.anchor;
  const Annotation* created = nullptr;
  switch (state_.tool) {
    case ActiveTool::Trendline: created = store_->createTrendline(start, end); break;
    case ActiveTool::Rectangle: created = store_->createRectangle(start, end); break;
    case ActiveTool::Fibonacci: created = store_->createFibonacci(start, end); break;
    default: break;
  }
  // A rejected payload leaves the first point pending.
  if (!created) return;

  Annotation copy = *created;
  dispatch(eventOf(InteractionEventKind::CompleteTwoClick));
  notifyChanged();
  if (drawCb_) drawCb_(copy);
}

void InteractionController::publishDrawn(const Annotation* created) {
  if (!created) return;
  Annotation copy = *created;
  notifyChanged();
  if (drawCb_) drawCb_(copy);
}

// -------------------- Text --------------------

const Annotation* InteractionController::submitText(const std::string& text) {
  if (state_.phase != InteractionPhase::TextEntryPending) return nullptr;

  if (isBlank(text)) {
    dispatch(eventOf(InteractionEventKind::SubmitText));
    notifyChanged();
    return nullptr;
  }

  const Annotation* created = store_->createText(state_.anchor, text);
  if (!created) return nullptr;

  AnnotationId id = created->id;
  Annotation copy = *created;
  dispatch(eventOf(InteractionEventKind::SubmitText));
  notifyChanged();
  if (drawCb_) drawCb_(copy);
  return store_->get(id);
}

void InteractionController::cancelTextEntry() {
  if (state_.phase != InteractionPhase::TextEntryPending) return;
  dispatch(eventOf(InteractionEventKind::Cancel));
  notifyChanged();
}

// -------------------- Keyboard --------------------

bool InteractionController::keyDown(KeyCode key) {
  switch (key) {
    case KeyCode::Escape:
      dispatch(eventOf(InteractionEventKind::Cancel));
      press_ = Press{};
      setSelectionInternal(AnnotationId());
      notifyChanged();
      return true;

    case KeyCode::Delete:
    case KeyCode::Backspace: {
      if (textFocused_ || selection_.empty()) return false;
      AnnotationId id = selection_;
      deleteAnnotation(id);
      setSelectionInternal(AnnotationId());
      return true;
    }

    case KeyCode::Enter:
    case KeyCode::None:
      return false;
  }
  return false;
}

// -------------------- Selection --------------------

bool InteractionController::setSelection(const AnnotationId& id) {
  if (!id.empty() && !store_->get(id)) return false;
  setSelectionInternal(id);
  return true;
}

void InteractionController::setSelectionInternal(const AnnotationId& id) {
  if (id == selection_) return;
  selection_ = id;
  if (selectionCb_) selectionCb_(selection_);
  notifyChanged();
}

bool InteractionController::deleteAnnotation(const AnnotationId& id) {
  if (!store_->remove(id)) return false;
  if (selection_ == id) setSelectionInternal(AnnotationId());
  return true;
}

// -------------------- Context menu --------------------

ContextMenuRequest InteractionController::openContextMenu(double x, double y) {
  ContextMenuRequest req;
  AnnotationHit hit = hitTester_.hitTest(store_->getAll(), x, y);
  if (!hit.hit) return req;

  setSelectionInternal(hit.id);
  req.open = true;
  req.id = hit.id;
  req.x = x;
  req.y = y;
  return req;
}

bool InteractionController::applyContextAction(const AnnotationId& id, ContextAction action) {
  const Annotation* a = store_->get(id);
  if (!a) return false;

  switch (action) {
    case ContextAction::Edit:
      if (editCb_) editCb_(id);
      return true;

    case ContextAction::ToggleVisibility: {
      AnnotationPatch patch;
      patch.visible = !a->visible;
      return store_->update(id, patch) != nullptr;
    }

    case ContextAction::ToggleLock: {
      AnnotationPatch patch;
      patch.locked = !a->locked;
      return store_->update(id, patch) != nullptr;
    }

    case ContextAction::Delete:
      return deleteAnnotation(id);
  }
  return false;
}

// -------------------- Drag --------------------

bool InteractionController::buildDragged(double x, double y, Annotation& out) const {
  const Annotation* target = store_->get(state_.targetId);
  if (!target) return false;

  const double dx = x - state_.dragOrigin.x;
  const double dy = y - state_.dragOrigin.y;
  Annotation a = *target;

  auto shift = [&](const DomainPoint& p, DomainPoint& moved) {
    PixelPoint px;
    if (!mapper_.domainToPixel(p, px)) return false;
    return mapper_.pixelToDomain(px.x + dx, px.y + dy, moved);
  };

  switch (state_.handle) {
    case DragHandle::Body:
      switch (a.type) {
        case AnnotationType::HorizontalLine: {
          double lineY;
          if (!mapper_.priceToY(a.price, lineY)) return false;
          if (!mapper_.pixelToPrice(lineY + dy, a.price)) return false;
          break;
        }
        case AnnotationType::VerticalLine: {
          double lineX;
          if (!mapper_.timeToX(a.time, lineX)) return false;
          if (!mapper_.pixelToTime(lineX + dx, a.time)) return false;
          break;
        }
        case AnnotationType::Trendline:
        case AnnotationType::Rectangle:
        case AnnotationType::Fibonacci: {
          DomainPoint s, e;
          if (!shift(a.startPoint, s) || !shift(a.endPoint, e)) return false;
          a.startPoint = s;
          a.endPoint = e;
          break;
        }
        case AnnotationType::Arrow:
        case AnnotationType::Text: {
          DomainPoint p;
          if (!shift(a.point, p)) return false;
          a.point = p;
          break;
        }
      }
      break;

    case DragHandle::Start:
      if (!mapper_.pixelToDomain(x, y, a.startPoint)) return false;
      break;

    case DragHandle::End:
      if (!mapper_.pixelToDomain(x, y, a.endPoint)) return false;
      break;

    case DragHandle::TopLeft:
    case DragHandle::TopRight:
    case DragHandle::BottomLeft:
    case DragHandle::BottomRight: {
      PixelPoint s, e;
      if (!mapper_.domainToPixel(a.startPoint, s) || !mapper_.domainToPixel(a.endPoint, e)) {
        return false;
      }
      PixelBox box = boxFromCorners(s, e);
      // The corner diagonally opposite the grabbed one stays put.
      PixelPoint fixed;
      switch (state_.handle) {
        case DragHandle::TopLeft:     fixed = {box.maxX, box.maxY}; break;
        case DragHandle::TopRight:    fixed = {box.minX, box.maxY}; break;
        case DragHandle::BottomLeft:  fixed = {box.maxX, box.minY}; break;
        default:                      fixed = {box.minX, box.minY}; break;
      }
      DomainPoint ds, de;
      if (!mapper_.pixelToDomain(fixed.x, fixed.y, ds)) return false;
      if (!mapper_.pixelToDomain(x, y, de)) return false;
      a.startPoint = ds;
      a.endPoint = de;
      break;
    }

    case DragHandle::None:
      return false;
  }

  out = std::move(a);
  return true;
}

void InteractionController::commitDrag(double x, double y) {
  Annotation moved;
  if (!buildDragged(x, y, moved)) return;

  AnnotationPatch patch;
  switch (moved.type) {
    case AnnotationType::HorizontalLine:
      patch.price = moved.price;
      break;
    case AnnotationType::VerticalLine:
      patch.time = moved.time;
      break;
    case AnnotationType::Trendline:
    case AnnotationType::Rectangle:
    case AnnotationType::Fibonacci:
      patch.startPoint = moved.startPoint;
      patch.endPoint = moved.endPoint;
      break;
    case AnnotationType::Arrow:
    case AnnotationType::Text:
      patch.point = moved.point;
      break;
  }
  if (!store_->update(state_.targetId, patch)) {
    std::fprintf(stderr, "[InteractionController] drag of %s not applied\n",
                 state_.targetId.c_str());
  }
}

// -------------------- Preview --------------------

InteractionPreview InteractionController::preview() const {
  InteractionPreview p;
  p.phase = state_.phase;
  p.tool = state_.tool;
  p.anchor = state_.anchor;
  p.hasPointer = hasPointer_;
  p.pointer = pointer_;
  if (state_.phase == InteractionPhase::Dragging && dragDraftValid_) {
    p.dragged = &dragDraft_;
  }
  return p;
}

void InteractionController::notifyChanged() {
  if (changeCb_) changeCb_();
}

} // namespace cm
