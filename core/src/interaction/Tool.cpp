#include "cm/interaction/Tool.hpp"

namespace cm {

const char* toolName(ActiveTool tool) {
  switch (tool) {
    case ActiveTool::None:           return "none";
    case ActiveTool::Select:         return "select";
    case ActiveTool::Delete:         return "delete";
    case ActiveTool::HorizontalLine: return "horizontal_line";
    case ActiveTool::VerticalLine:   return "vertical_line";
    case ActiveTool::Arrow:          return "arrow";
    case ActiveTool::Text:           return "text";
    case ActiveTool::Trendline:      return "trendline";
    case ActiveTool::Rectangle:      return "rectangle";
    case ActiveTool::Fibonacci:      return "fibonacci";
  }
  return "none";
}

bool parseTool(const std::string& name, ActiveTool& out) {
  static const ActiveTool all[] = {
    ActiveTool::None, ActiveTool::Select, ActiveTool::Delete,
    ActiveTool::HorizontalLine, ActiveTool::VerticalLine, ActiveTool::Arrow,
    ActiveTool::Text, ActiveTool::Trendline, ActiveTool::Rectangle,
    ActiveTool::Fibonacci
  };
  for (ActiveTool t : all) {
    if (name == toolName(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

bool isSingleClickTool(ActiveTool tool) {
  return tool == ActiveTool::HorizontalLine ||
         tool == ActiveTool::VerticalLine ||
         tool == ActiveTool::Arrow;
}

bool isTwoClickTool(ActiveTool tool) {
  return tool == ActiveTool::Trendline ||
         tool == ActiveTool::Rectangle ||
         tool == ActiveTool::Fibonacci;
}

bool isDrawingTool(ActiveTool tool) {
  return isSingleClickTool(tool) || isTwoClickTool(tool) || tool == ActiveTool::Text;
}

bool toolAnnotationType(ActiveTool tool, AnnotationType& out) {
  switch (tool) {
    case ActiveTool::HorizontalLine: out = AnnotationType::HorizontalLine; return true;
    case ActiveTool::VerticalLine:   out = AnnotationType::VerticalLine;   return true;
    case ActiveTool::Arrow:          out = AnnotationType::Arrow;          return true;
    case ActiveTool::Text:           out = AnnotationType::Text;           return true;
    case ActiveTool::Trendline:      out = AnnotationType::Trendline;      return true;
    case ActiveTool::Rectangle:      out = AnnotationType::Rectangle;      return true;
    case ActiveTool::Fibonacci:      out = AnnotationType::Fibonacci;      return true;
    case ActiveTool::None:
    case ActiveTool::Select:
    case ActiveTool::Delete:
      return false;
  }
  return false;
}

} // namespace cm
