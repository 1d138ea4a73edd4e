#pragma once
#include "cm/annotation/TimeValue.hpp"
#include "cm/geometry/Geometry.hpp"
#include "cm/ids/AnnotationId.hpp"
#include "cm/interaction/Tool.hpp"

#include <cstdint>

namespace cm {

// Part of an annotation a drag grabs.
enum class DragHandle : std::uint8_t {
  None = 0,
  Body,        // translate
  Start,       // startPoint of a two-point annotation
  End,         // endPoint
  TopLeft,     // rectangle corners
  TopRight,
  BottomLeft,
  BottomRight
};

const char* dragHandleName(DragHandle handle);

// Idle -> AwaitingSecondPoint(tool, anchor) -> Idle
// Idle -> TextEntryPending(anchor)          -> Idle
// Idle -> Dragging(targetId, handle)        -> Idle
enum class InteractionPhase : std::uint8_t {
  Idle = 0,
  AwaitingSecondPoint,
  TextEntryPending,
  Dragging
};

const char* interactionPhaseName(InteractionPhase phase);

// One state value; the fields that matter depend on `phase`.
struct InteractionState {
  InteractionPhase phase{InteractionPhase::Idle};

  // AwaitingSecondPoint: tool + first point. TextEntryPending: anchor only.
  ActiveTool tool{ActiveTool::None};
  DomainPoint anchor;

  // Dragging
  AnnotationId targetId;
  DragHandle handle{DragHandle::None};
  PixelPoint dragOrigin;

  bool isIdle() const { return phase == InteractionPhase::Idle; }
  bool isDrawPending() const {
    return phase == InteractionPhase::AwaitingSecondPoint ||
           phase == InteractionPhase::TextEntryPending;
  }
};

enum class InteractionEventKind : std::uint8_t {
  BeginTwoClick,     // first click of a two-click tool
  CompleteTwoClick,  // second click committed
  BeginText,         // text tool clicked
  SubmitText,        // text submitted or abandoned
  BeginDrag,         // pointer-down on a handle of the selection
  EndDrag,           // pointer-up after a drag
  Cancel             // Escape, tool change, context switch
};

struct InteractionEvent {
  InteractionEventKind kind{InteractionEventKind::Cancel};
  ActiveTool tool{ActiveTool::None};
  DomainPoint point;
  AnnotationId targetId;
  DragHandle handle{DragHandle::None};
  PixelPoint pixel;
};

// The only place phases change. An event that does not apply to the current
// phase leaves the state untouched.
InteractionState reduceInteraction(const InteractionState& state, const InteractionEvent& event);

} // namespace cm
