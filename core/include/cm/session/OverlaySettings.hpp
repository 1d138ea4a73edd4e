#pragma once
#include "cm/interaction/InteractionController.hpp"
#include "cm/storage/AnnotationRegistry.hpp"
#include "cm/surface/SurfaceCoordinator.hpp"

#include <string>

namespace cm {

// Serializable overlay configuration. Annotations themselves are not part
// of it; they live in the key-value store under their context keys.
struct OverlaySettings {
  std::string version{"1.0"};
  std::string themeName{"Dark"};  // resolved with overlayThemeByName()

  InteractionConfig interaction;
  RegistryConfig registry;
  StoreConfig store;
  CoordinatorConfig coordinator;

  // Last context shown, restored by the host on startup.
  std::string symbol;
  std::string timeframe;
};

std::string serializeOverlaySettings(const OverlaySettings& settings);

// Returns false on malformed JSON. Keys that are absent or of the wrong type
// keep the value already in `out`.
bool deserializeOverlaySettings(const std::string& json, OverlaySettings& out);

} // namespace cm
