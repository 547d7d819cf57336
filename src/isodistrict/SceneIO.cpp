#include "isodistrict/SceneIO.hpp"

#include "isodistrict/Base64.hpp"
#include "isodistrict/ConfigIO.hpp"
#include "isodistrict/Json.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace isodistrict {

namespace {

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
const Rgba8 kFallbackColor = Rgb(0x888888);

float NumberOrNaN(const JsonValue& obj, const char* key)
{
  const JsonValue* v = FindJsonMember(obj, key);
  return (v && v->isNumber()) ? static_cast<float>(v->numberValue) : kNaN;
}

Rgba8 ColorMember(const JsonValue& obj, const char* key)
{
  return HexColorOr(JsonStringOr(obj, key, std::string()), kFallbackColor);
}

// Accepts {"x":..,"y":..} objects and [x, y] pairs. Anything else becomes a NaN point that
// admission removes.
PlanarPoint ReadPoint(const JsonValue& v)
{
  if (v.isObject()) return PlanarPoint{NumberOrNaN(v, "x"), NumberOrNaN(v, "y")};
  if (v.isArray() && v.arrayValue.size() >= 2 && v.arrayValue[0].isNumber() && v.arrayValue[1].isNumber()) {
    return PlanarPoint{static_cast<float>(v.arrayValue[0].numberValue), static_cast<float>(v.arrayValue[1].numberValue)};
  }
  return PlanarPoint{kNaN, kNaN};
}

std::vector<PlanarPoint> ReadPoints(const JsonValue* arr)
{
  std::vector<PlanarPoint> out;
  if (!arr || !arr->isArray()) return out;
  out.reserve(arr->arrayValue.size());
  for (const JsonValue& v : arr->arrayValue) out.push_back(ReadPoint(v));
  return out;
}

bool TopLevelArray(const JsonValue& root, const char* key, const JsonValue*& out, std::string& outError)
{
  out = nullptr;
  const JsonValue* v = FindJsonMember(root, key);
  if (!v || v->isNull()) return true;
  if (!v->isArray()) {
    outError = std::string("scene: '") + key + "' must be an array, got " + JsonTypeName(v->type);
    return false;
  }
  out = v;
  return true;
}

std::optional<HeroDecoration> ReadHero(const JsonValue* v)
{
  if (!v || !v->isObject()) return std::nullopt;

  HeroDecoration hero;
  hero.accent = HexColorOr(JsonStringOr(*v, "accent", std::string()), hero.accent);
  hero.rooftop = ParseRooftopOrnament(JsonStringOr(*v, "rooftop", "none"));
  if (const JsonValue* boards = FindJsonArray(*v, "billboards")) {
    for (const JsonValue& b : boards->arrayValue) {
      if (!b.isObject()) continue;
      Billboard bb;
      bb.u0 = static_cast<float>(JsonNumberOr(b, "u0", bb.u0));
      bb.v0 = static_cast<float>(JsonNumberOr(b, "v0", bb.v0));
      bb.u1 = static_cast<float>(JsonNumberOr(b, "u1", bb.u1));
      bb.v1 = static_cast<float>(JsonNumberOr(b, "v1", bb.v1));
      bb.color = ColorMember(b, "color");
      hero.billboards.push_back(bb);
    }
  }
  return hero;
}

UsageCategory ReadUsage(const JsonValue& b)
{
  // Land-use codes are three digits; anything else falls through to the names.
  if (const JsonValue* code = FindJsonMember(b, "usage_code");
      code && code->isNumber() && code->numberValue >= 0.0 && code->numberValue < 1000.0) {
    UsageCategory u = UsageCategory::Unknown;
    if (UsageCategoryFromCode(static_cast<int>(code->numberValue), u)) return u;
  }
  // "usage" wins over the raw "type" tag.
  std::string name = JsonStringOr(b, "usage", std::string());
  if (name.empty()) name = JsonStringOr(b, "type", "unknown");
  return ParseUsageCategory(name);
}

Building ReadBuilding(const JsonValue& b)
{
  Building out;
  out.name = JsonStringOr(b, "name", std::string());
  out.footprint = ReadPoints(FindJsonMember(b, "coords"));
  out.usage = ReadUsage(b);

  const float height = NumberOrNaN(b, "height");
  const float heightM = NumberOrNaN(b, "height_m");
  if (std::isfinite(height)) {
    out.height = height;
    out.heightMeters = std::isfinite(heightM) ? heightM : height;
  } else {
    out.height = heightM * 1.5f;
    out.heightMeters = heightM;
  }

  const float levels = NumberOrNaN(b, "levels");
  if (std::isfinite(levels)) {
    out.floors = static_cast<int>(std::clamp(levels, -1.0f, 10000.0f));
  } else if (std::isfinite(out.heightMeters)) {
    out.floors = static_cast<int>(std::clamp(std::floor(out.heightMeters / 3.5f), 1.0f, 10000.0f));
  }

  out.anchor = PlanarPoint{NumberOrNaN(b, "x"), NumberOrNaN(b, "y")};
  out.hero = ReadHero(FindJsonMember(b, "hero"));
  return out;
}

Road ReadRoad(const JsonValue& r)
{
  Road out;
  out.name = JsonStringOr(r, "name", std::string());
  out.roadClass = ParseRoadClass(JsonStringOr(r, "type", "other"));
  out.width = NumberOrNaN(r, "width");
  out.points = ReadPoints(FindJsonMember(r, "coords"));
  return out;
}

RailSegment ReadRailway(const JsonValue& r)
{
  RailSegment out;
  out.lineName = JsonStringOr(r, "name", std::string());
  out.operatorName = JsonStringOr(r, "operator", std::string());
  out.color = ColorMember(r, "color");
  out.points = ReadPoints(FindJsonMember(r, "coords"));
  return out;
}

} // namespace

bool LoadSceneJson(const std::string& text, Scene& outScene, std::string& outError)
{
  JsonValue root;
  if (!ParseJson(text, root, outError)) return false;
  if (!root.isObject()) {
    outError = std::string("scene: root must be an object, got ") + JsonTypeName(root.type);
    return false;
  }

  const JsonValue* buildings = nullptr;
  const JsonValue* roads = nullptr;
  const JsonValue* railways = nullptr;
  const JsonValue* stations = nullptr;
  const JsonValue* parks = nullptr;
  const JsonValue* crossings = nullptr;
  const JsonValue* tiles = nullptr;
  if (!TopLevelArray(root, "buildings", buildings, outError) || !TopLevelArray(root, "roads", roads, outError) ||
      !TopLevelArray(root, "railways", railways, outError) || !TopLevelArray(root, "stations", stations, outError) ||
      !TopLevelArray(root, "parks", parks, outError) || !TopLevelArray(root, "scramble_crossings", crossings, outError) ||
      !TopLevelArray(root, "tiles", tiles, outError)) {
    return false;
  }

  Scene scene;
  scene.title = JsonStringOr(root, "title", std::string());

  if (buildings) {
    for (const JsonValue& b : buildings->arrayValue) {
      if (b.isObject()) scene.buildings.push_back(ReadBuilding(b));
    }
  }
  if (roads) {
    for (const JsonValue& r : roads->arrayValue) {
      if (r.isObject()) scene.roads.push_back(ReadRoad(r));
    }
  }
  if (railways) {
    for (const JsonValue& r : railways->arrayValue) {
      if (r.isObject()) scene.railways.push_back(ReadRailway(r));
    }
  }
  if (stations) {
    for (const JsonValue& s : stations->arrayValue) {
      if (!s.isObject()) continue;
      Station st;
      st.name = JsonStringOr(s, "name", std::string());
      st.lineName = JsonStringOr(s, "line", std::string());
      st.color = ColorMember(s, "color");
      st.position = PlanarPoint{NumberOrNaN(s, "x"), NumberOrNaN(s, "y")};
      scene.stations.push_back(std::move(st));
    }
  }
  if (parks) {
    for (const JsonValue& p : parks->arrayValue) {
      if (!p.isObject()) continue;
      Park pk;
      pk.name = JsonStringOr(p, "name", std::string());
      pk.area = static_cast<float>(JsonNumberOr(p, "area", 0.0));
      pk.position = PlanarPoint{NumberOrNaN(p, "x"), NumberOrNaN(p, "y")};
      scene.parks.push_back(std::move(pk));
    }
  }

  const JsonValue* area = FindJsonArray(root, "scramble_area");
  if (area || crossings) {
    ScrambleFeature sf;
    sf.area = ReadPoints(area);
    if (crossings) {
      for (const JsonValue& c : crossings->arrayValue) sf.crossings.push_back(ReadPoints(&c));
    }
    sf.label = JsonStringOr(root, "scramble_label", sf.label);
    scene.scramble = std::move(sf);
  }

  if (tiles) {
    for (const JsonValue& t : tiles->arrayValue) {
      if (!t.isObject()) continue;
      GroundTile tile;
      tile.topLeft = PlanarPoint{NumberOrNaN(t, "x0"), NumberOrNaN(t, "y0")};
      tile.topRight = PlanarPoint{NumberOrNaN(t, "x1"), NumberOrNaN(t, "y1")};
      tile.bottomLeft = PlanarPoint{NumberOrNaN(t, "x2"), NumberOrNaN(t, "y2")};

      // An undecodable payload stays empty; admission drops the tile.
      std::string b64err;
      if (!DecodeBase64(JsonStringOr(t, "data", std::string()), tile.encoded, b64err)) tile.encoded.clear();
      scene.tiles.push_back(std::move(tile));
    }
  }

  outScene = std::move(scene);
  outError.clear();
  return true;
}

bool LoadSceneFile(const std::string& path, Scene& outScene, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text, outError)) return false;
  if (!LoadSceneJson(text, outScene, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

std::string FormatAdmissionReport(const SceneAdmissionReport& r)
{
  std::ostringstream oss;
  auto count = [&](const char* name, const AdmissionCount& c, bool last) {
    oss << name << " " << c.kept << "/" << c.dropped << (last ? "" : ", ");
  };
  count("buildings", r.buildings, false);
  count("roads", r.roads, false);
  count("railways", r.railways, false);
  count("stations", r.stations, false);
  count("parks", r.parks, false);
  count("crossings", r.scrambleCrossings, false);
  count("tiles", r.tiles, true);
  oss << " (kept/dropped)";
  if (r.scrambleAreaDropped) oss << "; scramble area dropped";
  oss << "; repaired: " << r.floorsClamped << " floors, " << r.roadWidthsDefaulted << " road widths, "
      << r.parkAreasReset << " park areas";
  return oss.str();
}

} // namespace isodistrict
