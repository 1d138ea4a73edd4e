#include "cm/render/OverlayTheme.hpp"

namespace cm {

OverlayTheme darkOverlayTheme() {
  OverlayTheme t;
  t.name = "Dark";
  // Struct initializers carry the dark values.
  return t;
}

OverlayTheme lightOverlayTheme() {
  OverlayTheme t;
  t.name = "Light";

  t.previewColor = rgba(0.278f, 0.333f, 0.412f);     // #475569
  t.handleFill = rgba(1.0f, 1.0f, 1.0f);
  t.handleStroke = rgba(0.145f, 0.388f, 0.922f);     // #2563eb
  t.selectionOutline = rgba(0.059f, 0.090f, 0.165f); // #0f172a

  t.labelBackground = rgba(0.96f, 0.96f, 0.97f, 0.9f);
  return t;
}

bool overlayThemeByName(const std::string& name, OverlayTheme& out) {
  if (name == "Dark")  { out = darkOverlayTheme();  return true; }
  if (name == "Light") { out = lightOverlayTheme(); return true; }
  return false;
}

} // namespace cm
