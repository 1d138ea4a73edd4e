#include "cm/render/DisplayList.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace cm {

const char* paintOpKindName(PaintOpKind kind) {
  switch (kind) {
    case PaintOpKind::Clear:        return "clear";
    case PaintOpKind::StrokeLine:   return "strokeLine";
    case PaintOpKind::StrokeRect:   return "strokeRect";
    case PaintOpKind::FillRect:     return "fillRect";
    case PaintOpKind::FillTriangle: return "fillTriangle";
    case PaintOpKind::FillText:     return "fillText";
  }
  return "clear";
}

DisplayList::DisplayList(double width, double height)
  : width_(width), height_(height) {}

void DisplayList::resize(double width, double height) {
  width_ = width;
  height_ = height;
}

Color DisplayList::faded(const Color& c) const {
  return Color{c.r, c.g, c.b, c.a * alpha_};
}

void DisplayList::clear() {
  ops_.clear();
  alpha_ = 1.0f;
  PaintOp op;
  op.kind = PaintOpKind::Clear;
  ops_.push_back(op);
}

void DisplayList::strokeLine(const PixelPoint& a, const PixelPoint& b, const StrokeStyle& style) {
  PaintOp op;
  op.kind = PaintOpKind::StrokeLine;
  op.p0 = a;
  op.p1 = b;
  op.color = faded(style.color);
  op.width = style.width;
  op.dash = style.dash;
  ops_.push_back(op);
}

void DisplayList::strokeRect(const PixelBox& box, const StrokeStyle& style) {
  PaintOp op;
  op.kind = PaintOpKind::StrokeRect;
  op.p0 = PixelPoint{box.minX, box.minY};
  op.p1 = PixelPoint{box.maxX, box.maxY};
  op.color = faded(style.color);
  op.width = style.width;
  op.dash = style.dash;
  ops_.push_back(op);
}

void DisplayList::fillRect(const PixelBox& box, const Color& color) {
  PaintOp op;
  op.kind = PaintOpKind::FillRect;
  op.p0 = PixelPoint{box.minX, box.minY};
  op.p1 = PixelPoint{box.maxX, box.maxY};
  op.color = faded(color);
  ops_.push_back(op);
}

void DisplayList::fillTriangle(const PixelPoint& a, const PixelPoint& b, const PixelPoint& c,
                               const Color& color) {
  PaintOp op;
  op.kind = PaintOpKind::FillTriangle;
  op.p0 = a;
  op.p1 = b;
  op.p2 = c;
  op.color = faded(color);
  ops_.push_back(op);
}

void DisplayList::fillText(const std::string& text, double x, double y, float fontSize,
                           const Color& color) {
  PaintOp op;
  op.kind = PaintOpKind::FillText;
  op.p0 = PixelPoint{x, y};
  op.text = text;
  op.fontSize = fontSize;
  op.color = faded(color);
  ops_.push_back(op);
}

double DisplayList::measureText(const std::string& text, float fontSize) const {
  return approxTextWidth(text, static_cast<double>(fontSize));
}

std::size_t DisplayList::count(PaintOpKind kind) const {
  std::size_t n = 0;
  for (const auto& op : ops_) {
    if (op.kind == kind) n++;
  }
  return n;
}

const PaintOp* DisplayList::findText(const std::string& needle) const {
  for (const auto& op : ops_) {
    if (op.kind == PaintOpKind::FillText && op.text.find(needle) != std::string::npos) {
      return &op;
    }
  }
  return nullptr;
}

std::string DisplayList::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto point = [&w](const char* kx, const char* ky, const PixelPoint& p) {
    w.Key(kx); w.Double(p.x);
    w.Key(ky); w.Double(p.y);
  };

  w.StartObject();
  w.Key("width");  w.Double(width_);
  w.Key("height"); w.Double(height_);
  w.Key("ops");
  w.StartArray();
  for (const auto& op : ops_) {
    w.StartObject();
    w.Key("op"); w.String(paintOpKindName(op.kind));
    switch (op.kind) {
      case PaintOpKind::Clear:
        break;
      case PaintOpKind::StrokeLine:
      case PaintOpKind::StrokeRect:
        point("x0", "y0", op.p0);
        point("x1", "y1", op.p1);
        w.Key("width"); w.Double(static_cast<double>(op.width));
        w.Key("dash");  w.String(lineStyleName(op.dash));
        break;
      case PaintOpKind::FillRect:
        point("x0", "y0", op.p0);
        point("x1", "y1", op.p1);
        break;
      case PaintOpKind::FillTriangle:
        point("x0", "y0", op.p0);
        point("x1", "y1", op.p1);
        point("x2", "y2", op.p2);
        break;
      case PaintOpKind::FillText:
        point("x", "y", op.p0);
        w.Key("text"); w.String(op.text.c_str());
        w.Key("fontSize"); w.Double(static_cast<double>(op.fontSize));
        break;
    }
    if (op.kind != PaintOpKind::Clear) {
      w.Key("color"); w.String(toHexColor(op.color).c_str());
    }
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

} // namespace cm
