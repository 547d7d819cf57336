#pragma once

#include "isodistrict/Scene.hpp"

#include <string>

namespace isodistrict {

// Scene payload loading (JSON, already projected to the planar frame).
//
// Only document-level problems fail the load: invalid JSON, a non-object root, or a top-level
// member of the wrong type. Individual records with missing or mistyped fields are loaded with
// non-finite placeholders and left for AdmitScene to repair or drop.
//
// A building without an explicit anchor gets a NaN anchor, which AdmitScene resolves to the
// vertex centroid of the cleaned footprint.
bool LoadSceneJson(const std::string& text, Scene& outScene, std::string& outError);

bool LoadSceneFile(const std::string& path, Scene& outScene, std::string& outError);

// One-line summary for the [scene] log:
//   "buildings 120/3, roads 40/0, ... (kept/dropped); repaired: 2 floors, 1 road widths, 0 park areas"
std::string FormatAdmissionReport(const SceneAdmissionReport& report);

} // namespace isodistrict
