#include "cm/interaction/InteractionState.hpp"

namespace cm {

const char* dragHandleName(DragHandle handle) {
  switch (handle) {
    case DragHandle::None:        return "none";
    case DragHandle::Body:        return "body";
    case DragHandle::Start:       return "start";
    case DragHandle::End:         return "end";
    case DragHandle::TopLeft:     return "topLeft";
    case DragHandle::TopRight:    return "topRight";
    case DragHandle::BottomLeft:  return "bottomLeft";
    case DragHandle::BottomRight: return "bottomRight";
  }
  return "none";
}

const char* interactionPhaseName(InteractionPhase phase) {
  switch (phase) {
    case InteractionPhase::Idle:                return "Idle";
    case InteractionPhase::AwaitingSecondPoint: return "AwaitingSecondPoint";
    case InteractionPhase::TextEntryPending:    return "TextEntryPending";
    case InteractionPhase::Dragging:            return "Dragging";
  }
  return "Idle";
}

InteractionState reduceInteraction(const InteractionState& state, const InteractionEvent& event) {
  switch (event.kind) {
    case InteractionEventKind::Cancel:
      return InteractionState{};

    case InteractionEventKind::BeginTwoClick: {
      if (state.phase != InteractionPhase::Idle) return state;
      if (!isTwoClickTool(event.tool)) return state;
      InteractionState next;
      next.phase = InteractionPhase::AwaitingSecondPoint;
      next.tool = event.tool;
      next.anchor = event.point;
      return next;
    }

    case InteractionEventKind::CompleteTwoClick:
      if (state.phase != InteractionPhase::AwaitingSecondPoint) return state;
      return InteractionState{};

    case InteractionEventKind::BeginText: {
      if (state.phase != InteractionPhase::Idle) return state;
      InteractionState next;
      next.phase = InteractionPhase::TextEntryPending;
      next.tool = ActiveTool::Text;
      next.anchor = event.point;
      return next;
    }

    case InteractionEventKind::SubmitText:
      if (state.phase != InteractionPhase::TextEntryPending) return state;
      return InteractionState{};

    case InteractionEventKind::BeginDrag: {
      if (state.phase != InteractionPhase::Idle) return state;
      if (event.targetId.empty() || event.handle == DragHandle::None) return state;
      InteractionState next;
      next.phase = InteractionPhase::Dragging;
      next.targetId = event.targetId;
      next.handle = event.handle;
      next.dragOrigin = event.pixel;
      return next;
    }

    case InteractionEventKind::EndDrag:
      if (state.phase != InteractionPhase::Dragging) return state;
      return InteractionState{};
  }
  return state;
}

} // namespace cm
