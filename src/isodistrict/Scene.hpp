#pragma once

#include "isodistrict/Color.hpp"
#include "isodistrict/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace isodistrict {

// -----------------------------------------------------------------------------------------------
// Scene data model
//
// Everything here is a read-only snapshot in planar coordinates, loaded once and admitted once
// (AdmitScene) before it reaches the renderer. Only the camera and the selection mutate at
// runtime, and those live in ViewState.
// -----------------------------------------------------------------------------------------------

enum class UsageCategory : std::uint8_t {
  Office = 0,
  Shop,
  Hotel,
  Commercial,
  House,
  Apartment,
  ShopHouse,
  ShopApartment,
  WorkshopHouse,
  Government,
  School,
  Transport,
  Factory,
  Unknown,
};

// Stable lowercase name ("shop_house", ...).
const char* UsageCategoryName(UsageCategory u);

// English label for the inspector ("Shop+House", ...).
const char* UsageCategoryLabel(UsageCategory u);

// Unknown names map to Unknown.
UsageCategory ParseUsageCategory(const std::string& name);

// Land-use codes 401..461. Returns false for codes outside the table.
bool UsageCategoryFromCode(int code, UsageCategory& out);

// Storefront usages: taller ground-floor band, one window per floor.
bool IsShopLike(UsageCategory u);

enum class RoadClass : std::uint8_t {
  Motorway = 0,
  Trunk,
  Primary,
  Secondary,
  Tertiary,
  Residential,
  Service,
  LivingStreet,
  Pedestrian,
  Footway,
  Path,
  Other,
};

const char* RoadClassName(RoadClass c);
RoadClass ParseRoadClass(const std::string& name);
float DefaultRoadWidth(RoadClass c);

enum class RooftopOrnament : std::uint8_t {
  None = 0,
  Antenna,
  Helipad,
  Screen,
  BillboardTop,
  Sign,
};

const char* RooftopOrnamentName(RooftopOrnament o);
RooftopOrnament ParseRooftopOrnament(const std::string& name);

// Billboard rectangle in wall UV space (u along the wall, v from ground to roof).
struct Billboard {
  float u0 = 0.0f;
  float v0 = 0.0f;
  float u1 = 1.0f;
  float v1 = 1.0f;
  Rgba8 color = Rgb(0x888888);
};

struct HeroDecoration {
  std::vector<Billboard> billboards;
  Rgba8 accent = Rgb(0xFF7799);
  RooftopOrnament rooftop = RooftopOrnament::None;
};

struct Building {
  PlanarRing footprint;

  // Extrusion height in render units.
  float height = 0.0f;

  // Surveyed height in metres (display + tone derivation).
  float heightMeters = 0.0f;

  int floors = 1;
  UsageCategory usage = UsageCategory::Unknown;
  std::string name;

  // Depth key and label anchor. NaN until AdmitScene resolves it to the footprint centroid.
  PlanarPoint anchor{std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::quiet_NaN()};

  std::optional<HeroDecoration> hero;
};

struct Road {
  PlanarPolyline points;
  float width = 5.0f;
  RoadClass roadClass = RoadClass::Other;
  std::string name;
};

struct RailSegment {
  PlanarPolyline points;
  std::string lineName;
  std::string operatorName;
  Rgba8 color = Rgb(0x888888);
};

struct Station {
  PlanarPoint position;
  std::string name;
  std::string lineName;
  Rgba8 color = Rgb(0x888888);
};

struct Park {
  PlanarPoint position;
  std::string name;
  float area = 0.0f;
};

struct ScrambleFeature {
  PlanarRing area;
  std::vector<PlanarPolyline> crossings;
  std::string label = "SCRAMBLE CROSSING";
};

// Aerial imagery tile: the encoded payload spans the parallelogram topLeft -> topRight,
// topLeft -> bottomLeft. The fourth corner is implied.
struct GroundTile {
  PlanarPoint topLeft;
  PlanarPoint topRight;
  PlanarPoint bottomLeft;
  std::vector<std::uint8_t> encoded;
};

struct Scene {
  std::string title;
  std::vector<Building> buildings;
  std::vector<Road> roads;
  std::vector<RailSegment> railways;
  std::vector<Station> stations;
  std::vector<Park> parks;
  std::optional<ScrambleFeature> scramble;
  std::vector<GroundTile> tiles;

  // Distinct non-empty railway line names.
  std::size_t distinctLineCount() const;
};

struct AdmissionCount {
  std::size_t kept = 0;
  std::size_t dropped = 0;
};

struct SceneAdmissionReport {
  AdmissionCount buildings;
  AdmissionCount roads;
  AdmissionCount railways;
  AdmissionCount stations;
  AdmissionCount parks;
  AdmissionCount scrambleCrossings;
  AdmissionCount tiles;
  bool scrambleAreaDropped = false;

  // Repairs that kept the entity.
  std::size_t floorsClamped = 0;
  std::size_t roadWidthsDefaulted = 0;
  std::size_t parkAreasReset = 0;

  std::size_t totalDropped() const;
};

// One-shot structural admission. Never throws; malformed entities are repaired or dropped.
SceneAdmissionReport AdmitScene(Scene& scene);

// Vertex centroid of a ring (0,0 for an empty ring).
PlanarPoint RingCentroid(const PlanarRing& ring);

} // namespace isodistrict
