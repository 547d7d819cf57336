#include "isodistrict/Scene.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>

namespace isodistrict {

namespace {

struct UsageInfo {
  UsageCategory usage;
  const char* name;
  const char* label;
  int code;
};

constexpr UsageInfo kUsageTable[] = {
    {UsageCategory::Office, "office", "Office", 401},
    {UsageCategory::Shop, "shop", "Shop", 402},
    {UsageCategory::Hotel, "hotel", "Hotel", 403},
    {UsageCategory::Commercial, "commercial", "Commercial", 404},
    {UsageCategory::House, "house", "House", 411},
    {UsageCategory::Apartment, "apartment", "Apartment", 412},
    {UsageCategory::ShopHouse, "shop_house", "Shop+House", 413},
    {UsageCategory::ShopApartment, "shop_apartment", "Shop+Apt", 414},
    {UsageCategory::WorkshopHouse, "workshop_house", "Workshop", 415},
    {UsageCategory::Government, "government", "Government", 421},
    {UsageCategory::School, "school", "School", 422},
    {UsageCategory::Transport, "transport", "Transport", 431},
    {UsageCategory::Factory, "factory", "Factory", 441},
    {UsageCategory::Unknown, "unknown", "Unknown", 461},
};

const UsageInfo& InfoFor(UsageCategory u)
{
  for (const UsageInfo& info : kUsageTable) {
    if (info.usage == u) return info;
  }
  return kUsageTable[std::size(kUsageTable) - 1];
}

struct RoadClassInfo {
  RoadClass roadClass;
  const char* name;
};

constexpr RoadClassInfo kRoadClasses[] = {
    {RoadClass::Motorway, "motorway"},     {RoadClass::Trunk, "trunk"},
    {RoadClass::Primary, "primary"},       {RoadClass::Secondary, "secondary"},
    {RoadClass::Tertiary, "tertiary"},     {RoadClass::Residential, "residential"},
    {RoadClass::Service, "service"},       {RoadClass::LivingStreet, "living_street"},
    {RoadClass::Pedestrian, "pedestrian"}, {RoadClass::Footway, "footway"},
    {RoadClass::Path, "path"},             {RoadClass::Other, "other"},
};

constexpr const char* kOrnamentNames[] = {"none", "antenna", "helipad", "screen", "billboard_top", "sign"};

bool IsFinite(PlanarPoint p) { return std::isfinite(p.x) && std::isfinite(p.y); }

bool SamePoint(PlanarPoint a, PlanarPoint b) { return a.x == b.x && a.y == b.y; }

// Drop non-finite points and collapse consecutive duplicates.
void CleanPolyline(PlanarPolyline& pts)
{
  PlanarPolyline out;
  out.reserve(pts.size());
  for (const PlanarPoint& p : pts) {
    if (!IsFinite(p)) continue;
    if (!out.empty() && SamePoint(out.back(), p)) continue;
    out.push_back(p);
  }
  pts.swap(out);
}

// Polyline cleaning plus removal of a closing point equal to the first.
void CleanRing(PlanarRing& ring)
{
  CleanPolyline(ring);
  while (ring.size() >= 2 && SamePoint(ring.front(), ring.back())) ring.pop_back();
}

template <typename T, typename Pred>
void EraseIfCounted(std::vector<T>& v, AdmissionCount& count, Pred shouldDrop)
{
  const std::size_t before = v.size();
  v.erase(std::remove_if(v.begin(), v.end(), shouldDrop), v.end());
  count.kept = v.size();
  count.dropped = before - v.size();
}

} // namespace

const char* UsageCategoryName(UsageCategory u) { return InfoFor(u).name; }

const char* UsageCategoryLabel(UsageCategory u) { return InfoFor(u).label; }

UsageCategory ParseUsageCategory(const std::string& name)
{
  for (const UsageInfo& info : kUsageTable) {
    if (name == info.name) return info.usage;
  }
  return UsageCategory::Unknown;
}

bool UsageCategoryFromCode(int code, UsageCategory& out)
{
  for (const UsageInfo& info : kUsageTable) {
    if (info.code == code) {
      out = info.usage;
      return true;
    }
  }
  return false;
}

bool IsShopLike(UsageCategory u)
{
  return u == UsageCategory::Shop || u == UsageCategory::Commercial || u == UsageCategory::ShopHouse ||
         u == UsageCategory::ShopApartment;
}

const char* RoadClassName(RoadClass c)
{
  for (const RoadClassInfo& info : kRoadClasses) {
    if (info.roadClass == c) return info.name;
  }
  return "other";
}

RoadClass ParseRoadClass(const std::string& name)
{
  for (const RoadClassInfo& info : kRoadClasses) {
    if (name == info.name) return info.roadClass;
  }
  return RoadClass::Other;
}

float DefaultRoadWidth(RoadClass c)
{
  switch (c) {
  case RoadClass::Trunk:
  case RoadClass::Primary: return 12.0f;
  case RoadClass::Secondary:
  case RoadClass::Tertiary: return 8.0f;
  case RoadClass::Pedestrian: return 6.0f;
  case RoadClass::Footway: return 3.0f;
  case RoadClass::Service: return 4.0f;
  default: return 5.0f;
  }
}

const char* RooftopOrnamentName(RooftopOrnament o)
{
  const auto i = static_cast<std::size_t>(o);
  return (i < std::size(kOrnamentNames)) ? kOrnamentNames[i] : "none";
}

RooftopOrnament ParseRooftopOrnament(const std::string& name)
{
  for (std::size_t i = 0; i < std::size(kOrnamentNames); ++i) {
    if (name == kOrnamentNames[i]) return static_cast<RooftopOrnament>(i);
  }
  return RooftopOrnament::None;
}

std::size_t Scene::distinctLineCount() const
{
  std::set<std::string> names;
  for (const RailSegment& r : railways) {
    if (!r.lineName.empty()) names.insert(r.lineName);
  }
  return names.size();
}

std::size_t SceneAdmissionReport::totalDropped() const
{
  return buildings.dropped + roads.dropped + railways.dropped + stations.dropped + parks.dropped +
         scrambleCrossings.dropped + tiles.dropped + (scrambleAreaDropped ? 1u : 0u);
}

PlanarPoint RingCentroid(const PlanarRing& ring)
{
  if (ring.empty()) return PlanarPoint{};
  double sx = 0.0;
  double sy = 0.0;
  for (const PlanarPoint& p : ring) {
    sx += p.x;
    sy += p.y;
  }
  const double n = static_cast<double>(ring.size());
  return PlanarPoint{static_cast<float>(sx / n), static_cast<float>(sy / n)};
}

SceneAdmissionReport AdmitScene(Scene& scene)
{
  SceneAdmissionReport rep;

  // Buildings.
  for (Building& b : scene.buildings) {
    CleanRing(b.footprint);
    if (b.floors < 1) {
      b.floors = 1;
      ++rep.floorsClamped;
    }
    if (!std::isfinite(b.heightMeters) || b.heightMeters < 0.0f) b.heightMeters = std::isfinite(b.height) ? b.height : 0.0f;
    if (!IsFinite(b.anchor)) b.anchor = RingCentroid(b.footprint);
  }
  EraseIfCounted(scene.buildings, rep.buildings, [](const Building& b) {
    return b.footprint.size() < 3 || !std::isfinite(b.height) || b.height <= 0.0f;
  });

  // Roads.
  for (Road& r : scene.roads) {
    CleanPolyline(r.points);
    if (!std::isfinite(r.width) || r.width <= 0.0f) {
      r.width = DefaultRoadWidth(r.roadClass);
      ++rep.roadWidthsDefaulted;
    }
  }
  EraseIfCounted(scene.roads, rep.roads, [](const Road& r) { return r.points.size() < 2; });

  // Railways.
  for (RailSegment& r : scene.railways) CleanPolyline(r.points);
  EraseIfCounted(scene.railways, rep.railways, [](const RailSegment& r) { return r.points.size() < 2; });

  // Point features.
  EraseIfCounted(scene.stations, rep.stations, [](const Station& s) { return !IsFinite(s.position); });
  for (Park& p : scene.parks) {
    if (!std::isfinite(p.area) || p.area < 0.0f) {
      p.area = 0.0f;
      ++rep.parkAreasReset;
    }
  }
  EraseIfCounted(scene.parks, rep.parks, [](const Park& p) { return !IsFinite(p.position); });

  // Scramble crossing.
  if (scene.scramble) {
    ScrambleFeature& s = *scene.scramble;
    CleanRing(s.area);
    if (!s.area.empty() && s.area.size() < 3) {
      s.area.clear();
      rep.scrambleAreaDropped = true;
    }
    for (PlanarPolyline& c : s.crossings) CleanPolyline(c);
    EraseIfCounted(s.crossings, rep.scrambleCrossings, [](const PlanarPolyline& c) { return c.size() < 2; });
    if (s.area.empty() && s.crossings.empty()) scene.scramble.reset();
  }

  // Imagery tiles.
  EraseIfCounted(scene.tiles, rep.tiles, [](const GroundTile& t) {
    return !IsFinite(t.topLeft) || !IsFinite(t.topRight) || !IsFinite(t.bottomLeft) || t.encoded.empty();
  });

  return rep;
}

} // namespace isodistrict
