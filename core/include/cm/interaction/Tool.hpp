#pragma once
#include "cm/annotation/Annotation.hpp"

#include <cstdint>
#include <string>

namespace cm {

// Process-wide drawing tool. None behaves like Select.
enum class ActiveTool : std::uint8_t {
  None = 0,
  Select,
  Delete,
  HorizontalLine, // single click
  VerticalLine,   // single click
  Arrow,          // single click
  Text,           // click, then text submission
  Trendline,      // two clicks
  Rectangle,      // two clicks
  Fibonacci       // two clicks
};

const char* toolName(ActiveTool tool);
bool parseTool(const std::string& name, ActiveTool& out);

bool isSingleClickTool(ActiveTool tool);
bool isTwoClickTool(ActiveTool tool);
bool isDrawingTool(ActiveTool tool);

// Annotation type a drawing tool produces. False for Select/Delete/None.
bool toolAnnotationType(ActiveTool tool, AnnotationType& out);

} // namespace cm
