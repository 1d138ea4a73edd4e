#pragma once
#include "cm/annotation/Color.hpp"

#include <string>

namespace cm {

// Colours and layout constants of the annotation overlay.
struct OverlayTheme {
  std::string name;

  // In-progress geometry
  Color previewColor{0.420f, 0.447f, 0.502f, 1.0f}; // #6b7280
  float previewAlpha{0.7f};
  float previewLineWidth{2.0f};

  // Selection
  Color handleFill{1.0f, 1.0f, 1.0f, 1.0f};
  Color handleStroke{0.231f, 0.510f, 0.965f, 1.0f}; // #3b82f6
  double handleSizePx{8.0};
  Color selectionOutline{1.0f, 1.0f, 1.0f, 1.0f};

  // Label boxes
  Color labelBackground{0.118f, 0.133f, 0.176f, 0.9f}; // rgba(30,34,45,0.9)
  float labelFontSize{11.0f};
  float priceTagFontSize{10.0f};
  float fibLabelFontSize{11.0f};
  double textPaddingPx{6.0};

  // Host chart chrome the overlay keeps clear of
  double priceScaleReservePx{60.0};  // right
  double timeScaleReservePx{22.0};   // bottom
  double lineInsetPx{50.0};          // left end of a non-extended horizontal line
  double shortLineReservePx{120.0};  // right end of a non-extended horizontal line
};

// Built-in presets
OverlayTheme darkOverlayTheme();
OverlayTheme lightOverlayTheme();

// "Dark" / "Light". False for an unknown name.
bool overlayThemeByName(const std::string& name, OverlayTheme& out);

} // namespace cm
