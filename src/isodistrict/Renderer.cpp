#include "isodistrict/Renderer.hpp"

#include "isodistrict/DeterministicMath.hpp"
#include "isodistrict/Shading.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace isodistrict {

namespace {

constexpr Rgba8 kParkGround = Rgb(0x1E4D1E);
constexpr Rgba8 kParkInner = Rgb(0x2D6B2D);
constexpr Rgba8 kParkTreeDark = Rgb(0x226622);
constexpr Rgba8 kParkTreeLight = Rgb(0x338833);
constexpr Rgba8 kParkLabel = Rgb(0x66AA44);

constexpr Rgba8 kStreetTreeDark = Rgb(0x336633);
constexpr Rgba8 kStreetTreeLight = Rgb(0x448844);
constexpr Rgba8 kStreetTreeTrunk = Rgb(0x554433);

constexpr Rgba8 kKioskColors[] = {Rgb(0xCC2222), Rgb(0x2244CC), Rgb(0x22AA44), Rgb(0xDD8822)};

constexpr Rgba8 kPedestrianColors[] = {Rgb(0xDDDDDD), Rgb(0xAAAAAA), Rgb(0x997766), Rgb(0x334455),
                                       Rgb(0xCC8866), Rgb(0x667788), Rgb(0xBBAA99), Rgb(0x445566)};
constexpr Rgba8 kPedestrianHead = Rgb(0xEEDDCC);

constexpr Rgba8 kAntennaMast = Rgb(0x888888);
constexpr Rgba8 kAntennaBar = Rgb(0xAAAAAA);
constexpr Rgba8 kAntennaLight = Rgb(0xFF3333);
constexpr Rgba8 kHelipad = Rgb(0x333333);
constexpr Rgba8 kSignPost = Rgb(0x444444);

// #88DDFF in HSL, for the darkened office glazing band.
constexpr HslColor kOfficeGlass{197.14f, 100.0f, 76.67f};

int FloorI(float v) { return static_cast<int>(std::floor(v)); }

float RoundF(float v) { return static_cast<float>(RoundToInt(v)); }

// 1x1 (or wider) pixel run at integer coordinates.
void Pixel(DrawingSurface& s, float x, float y, Rgba8 c, float w = 1.0f, float h = 1.0f) { s.fillRect(x, y, w, h, c); }

gfx::StrokeStyle Stroke(float width, gfx::LineCap cap, gfx::LineJoin join)
{
  gfx::StrokeStyle st;
  st.width = width;
  st.cap = cap;
  st.join = join;
  return st;
}

ScreenPolyline Diamond(float px, float py, float s)
{
  return ScreenPolyline{{px, py - s}, {px + s * 1.5f, py}, {px, py + s}, {px - s * 1.5f, py}};
}

bool IsWalkway(RoadClass c) { return c == RoadClass::Footway || c == RoadClass::Pedestrian; }

} // namespace

struct LayeredRenderer::Frame {
  const Scene& scene;
  const Camera& cam;
  int k;
  float zoomOverK;
  DrawingSurface& surface;
  HitTestIndex& index;
  RenderStats stats;

  ScreenPoint iso(PlanarPoint p) const { return Project(p, cam, k); }

  ScreenPolyline iso(const std::vector<PlanarPoint>& pts) const
  {
    ScreenPolyline out;
    out.reserve(pts.size());
    for (const PlanarPoint& p : pts) out.push_back(iso(p));
    return out;
  }
};

std::vector<std::size_t> PaintOrder(const Scene& scene)
{
  std::vector<std::size_t> order(scene.buildings.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    const PlanarPoint& pa = scene.buildings[a].anchor;
    const PlanarPoint& pb = scene.buildings[b].anchor;
    return (pa.x + pa.y) < (pb.x + pb.y);
  });
  return order;
}

RenderStats LayeredRenderer::render(const Scene& scene, const std::vector<RgbaImage>& decodedTiles, const Camera& cam,
                                    DrawingSurface& working, HitTestIndex& index, std::uint64_t frameSerial) const
{
  const int k = std::max(1, m_opt.pixelScale);
  Frame f{scene, cam, k, cam.zoom / static_cast<float>(k), working, index, RenderStats{}};

  index.clear(frameSerial);
  working.clear(palette::kSky);

  drawGroundTiles(f, decodedTiles);
  drawParks(f);
  drawRailways(f);
  drawRoads(f);
  drawKiosks(f);
  drawStreetTrees(f);
  drawScramble(f);
  drawPedestrians(f);

  const std::vector<std::size_t> order = PaintOrder(scene);
  for (std::size_t bi : order) drawBuilding(f, bi);
  for (std::size_t bi : order) drawBuildingLabel(f, scene.buildings[bi]);

  drawStations(f);
  return f.stats;
}

// -----------------------------------------------------------------------------------------------
// Ground layers
// -----------------------------------------------------------------------------------------------

void LayeredRenderer::drawGroundTiles(Frame& f, const std::vector<RgbaImage>& decodedTiles) const
{
  const std::size_t n = std::min(decodedTiles.size(), f.scene.tiles.size());
  for (std::size_t i = 0; i < n; ++i) {
    const RgbaImage& img = decodedTiles[i];
    if (img.empty()) continue;

    const GroundTile& t = f.scene.tiles[i];
    const gfx::Affine2D xf = gfx::AffineFromParallelogram(static_cast<float>(img.width), static_cast<float>(img.height),
                                                          f.iso(t.topLeft), f.iso(t.topRight), f.iso(t.bottomLeft));
    f.surface.blitImageAffine(img, xf, m_opt.groundAlpha);
    ++f.stats.tilesDrawn;
  }
}

void LayeredRenderer::drawParks(Frame& f) const
{
  DrawingSurface& s = f.surface;
  for (const Park& park : f.scene.parks) {
    const ScreenPoint p = f.iso(park.position);
    const int baseSize = std::max(2, FloorI(std::sqrt(park.area) * 0.008f * f.zoomOverK));
    const float size = static_cast<float>(baseSize);
    const float px = RoundF(p.x);
    const float py = RoundF(p.y);

    s.fillPolygon(Diamond(px, py, size), kParkGround);
    if (baseSize > 2) s.fillPolygon(Diamond(px, py, size * 0.6f), kParkInner);

    if (baseSize > 3) {
      const int trees = std::min(4, baseSize);
      for (int t = 0; t < trees; ++t) {
        const float a = static_cast<float>(t) * 2.1f;
        const float tx = RoundF(px + FastSinRad(a) * size * 0.8f);
        const float ty = RoundF(py + FastCosRad(a) * size * 0.4f);
        Pixel(s, tx, ty - 2.0f, kParkTreeDark);
        Pixel(s, tx - 1.0f, ty - 1.0f, kParkTreeLight, 3.0f);
        Pixel(s, tx, ty, kParkTreeDark);
      }
    }

    if (park.area > 2000.0f && f.zoomOverK > 0.35f && !park.name.empty()) {
      TextStyle ts;
      ts.sizePx = std::max(3, FloorI(3.0f * f.zoomOverK));
      ts.align = TextAlign::Center;
      s.drawText(park.name, px, py - size - 2.0f, ts, kParkLabel);
      ++f.stats.labelsDrawn;
    }
    ++f.stats.parksDrawn;
  }
}

void LayeredRenderer::drawRailways(Frame& f) const
{
  const gfx::StrokeStyle bed = Stroke(static_cast<float>(std::max(2, FloorI(3.0f * f.zoomOverK))), gfx::LineCap::Round,
                                      gfx::LineJoin::Round);
  const gfx::StrokeStyle line = Stroke(static_cast<float>(std::max(1, FloorI(2.0f * f.zoomOverK))), gfx::LineCap::Round,
                                       gfx::LineJoin::Round);

  // Each segment gets its bed then its line; segments of one line are not merged.
  for (const RailSegment& rail : f.scene.railways) {
    const ScreenPolyline pts = f.iso(rail.points);
    f.surface.strokePolyline(pts, bed, palette::kRailBed);
    f.surface.strokePolyline(pts, line, rail.color);
    ++f.stats.railwaysDrawn;
  }
}

void LayeredRenderer::drawRoads(Frame& f) const
{
  DrawingSurface& s = f.surface;
  for (const Road& road : f.scene.roads) {
    const ScreenPolyline pts = f.iso(road.points);
    const int w = std::max(1, FloorI(road.width * f.zoomOverK));

    s.strokePolyline(pts, Stroke(static_cast<float>(w + 1), gfx::LineCap::Square, gfx::LineJoin::Miter), palette::kRoadEdge);
    s.strokePolyline(pts, Stroke(static_cast<float>(w), gfx::LineCap::Square, gfx::LineJoin::Miter), palette::kRoad);

    if (!IsWalkway(road.roadClass) && w > 2) {
      gfx::StrokeStyle dash = Stroke(1.0f, gfx::LineCap::Square, gfx::LineJoin::Miter);
      dash.dash = {2.0f, 3.0f};
      s.strokePolyline(pts, dash, palette::kRoadDash);
    }
    ++f.stats.roadsDrawn;
  }

  TextStyle ts;
  ts.sizePx = std::max(4, FloorI(3.0f * f.cam.zoom));
  ts.align = TextAlign::Center;
  for (const Road& road : f.scene.roads) {
    if (road.name.empty() || road.roadClass == RoadClass::Footway) continue;
    const ScreenPoint mid = f.iso(road.points[road.points.size() / 2]);
    s.drawText(road.name, mid.x, mid.y - 2.0f, ts, palette::kRoadName);
    ++f.stats.labelsDrawn;
  }
}

// -----------------------------------------------------------------------------------------------
// Ambient decoration
// -----------------------------------------------------------------------------------------------

void LayeredRenderer::drawKiosks(Frame& f) const
{
  if (f.zoomOverK < m_opt.decorationZoomThreshold) return;

  for (const Road& road : f.scene.roads) {
    if (road.roadClass == RoadClass::Footway || road.roadClass == RoadClass::Path) continue;
    const PlanarPolyline& pts = road.points;
    for (std::size_t i = 0; i + 1 < pts.size(); i += 3) {
      const float dx = pts[i + 1].x - pts[i].x;
      const float dy = pts[i + 1].y - pts[i].y;
      const float len = std::sqrt(dx * dx + dy * dy);
      if (len < 1.0f) continue;

      // Offset to the road edge, perpendicular to the segment.
      const float off = road.width + 2.0f;
      const PlanarPoint at{(pts[i].x + pts[i + 1].x) * 0.5f + (-dy / len) * off,
                           (pts[i].y + pts[i + 1].y) * 0.5f + (dx / len) * off};
      const ScreenPoint p = f.iso(at);
      const float x = RoundF(p.x);
      const float y = RoundF(p.y);

      Pixel(f.surface, x, y - 2.0f, kKioskColors[(i * 7) % std::size(kKioskColors)], 1.0f, 2.0f);
      Pixel(f.surface, x, y - 3.0f, palette::kWhite);
      ++f.stats.kiosksDrawn;
    }
  }
}

void LayeredRenderer::drawStreetTrees(Frame& f) const
{
  if (f.zoomOverK < m_opt.decorationZoomThreshold) return;

  for (const Road& road : f.scene.roads) {
    if (road.roadClass != RoadClass::Pedestrian && road.roadClass != RoadClass::LivingStreet) continue;
    for (std::size_t i = 0; i + 1 < road.points.size(); i += 4) {
      const ScreenPoint p = f.iso(road.points[i]);
      const float tx = RoundF(p.x);
      const float ty = RoundF(p.y);
      Pixel(f.surface, tx, ty - 4.0f, kStreetTreeDark);
      Pixel(f.surface, tx - 1.0f, ty - 3.0f, kStreetTreeLight, 3.0f);
      Pixel(f.surface, tx, ty - 2.0f, kStreetTreeDark);
      Pixel(f.surface, tx, ty - 1.0f, kStreetTreeTrunk);
      ++f.stats.streetTreesDrawn;
    }
  }
}

void LayeredRenderer::drawScramble(Frame& f) const
{
  if (!f.scene.scramble) return;
  const ScrambleFeature& sc = *f.scene.scramble;
  DrawingSurface& s = f.surface;

  const bool hasArea = sc.area.size() >= 3;
  if (hasArea) s.fillPolygon(f.iso(sc.area), palette::kCrossing);

  // Zebra stripes across each crossing segment, in working-surface space.
  const int stripeW = std::max(1, FloorI(f.cam.zoom));
  const float halfW = static_cast<float>(std::max(1, FloorI(2.0f * f.zoomOverK)));
  const gfx::StrokeStyle stripe = Stroke(static_cast<float>(stripeW), gfx::LineCap::Butt, gfx::LineJoin::Miter);
  for (const PlanarPolyline& crossing : sc.crossings) {
    const ScreenPolyline pts = f.iso(crossing);
    for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
      const float dx = pts[i + 1].x - pts[i].x;
      const float dy = pts[i + 1].y - pts[i].y;
      const float len = std::sqrt(dx * dx + dy * dy);
      if (!(len > 0.0f)) continue;

      const float nx = -dy / len;
      const float ny = dx / len;
      const int numStripes = FloorI(len / static_cast<float>(stripeW + 1));
      for (int k = 0; k < numStripes; ++k) {
        const float t = static_cast<float>(k * (stripeW + 1)) / len;
        const float cx = pts[i].x + dx * t;
        const float cy = pts[i].y + dy * t;
        s.strokePolyline(ScreenPolyline{{cx + nx * halfW, cy + ny * halfW}, {cx - nx * halfW, cy - ny * halfW}}, stripe,
                         palette::kStripe);
        ++f.stats.stripesDrawn;
      }
    }
  }

  if (hasArea && !sc.label.empty()) {
    const ScreenPoint c = f.iso(RingCentroid(sc.area));
    TextStyle ts;
    ts.sizePx = std::max(5, FloorI(5.0f * f.cam.zoom));
    ts.bold = true;
    ts.align = TextAlign::Center;
    s.drawText(sc.label, c.x, c.y, ts, palette::kCrossingLabel);
    ++f.stats.labelsDrawn;
  }
}

void LayeredRenderer::drawPedestrians(Frame& f) const
{
  if (f.zoomOverK < m_opt.decorationZoomThreshold) return;
  if (!f.scene.scramble || f.scene.scramble->area.size() < 3) return;

  const PlanarPoint c = RingCentroid(f.scene.scramble->area);
  for (int p = 0; p < m_opt.pedestrianCount; ++p) {
    const float fp = static_cast<float>(p);
    const PlanarPoint at{c.x + FastSinRad(fp * 2.4f) * 18.0f + FastCosRad(fp * 1.7f) * 12.0f,
                         c.y + FastCosRad(fp * 3.1f) * 14.0f + FastSinRad(fp * 0.9f) * 10.0f};
    const ScreenPoint s = f.iso(at);
    const float x = RoundF(s.x);
    const float y = RoundF(s.y);
    Pixel(f.surface, x, y - 1.0f, kPedestrianColors[static_cast<std::size_t>(p) % std::size(kPedestrianColors)]);
    Pixel(f.surface, x, y - 2.0f, kPedestrianHead);
    ++f.stats.pedestriansDrawn;
  }
}

// -----------------------------------------------------------------------------------------------
// Buildings
// -----------------------------------------------------------------------------------------------

namespace {

// Footprints may arrive closed (last point repeating the first); walls are built on the open ring.
PlanarRing OpenRing(const PlanarRing& footprint)
{
  PlanarRing ring = footprint;
  if (ring.size() > 1 && ring.front().x == ring.back().x && ring.front().y == ring.back().y) ring.pop_back();
  return ring;
}

} // namespace

void LayeredRenderer::drawBuilding(Frame& f, std::size_t buildingIndex) const
{
  const Building& b = f.scene.buildings[buildingIndex];
  const PlanarRing ring = OpenRing(b.footprint);
  const std::size_t n = ring.size();
  if (n < 3) return;

  DrawingSurface& s = f.surface;
  const float lift = b.height * f.zoomOverK;
  const BuildingTones tones = ToneFor(b);

  const ScreenPolyline ground = f.iso(ring);
  ScreenPolyline roof = ground;
  for (ScreenPoint& p : roof) p.y -= lift;

  ScreenPolyline all = ground;
  all.insert(all.end(), roof.begin(), roof.end());
  f.index.add(BoundsOf(all), buildingIndex);

  const bool details = f.zoomOverK > m_opt.detailZoomThreshold && b.floors >= 2;
  const gfx::StrokeStyle thin = Stroke(1.0f, gfx::LineCap::Butt, gfx::LineJoin::Miter);

  auto wallTone = [&](std::size_t i) {
    return WallFacesLight(ring[i], ring[(i + 1) % n]) ? tones.left : tones.right;
  };
  auto wallQuad = [&](std::size_t i) {
    const std::size_t j = (i + 1) % n;
    return ScreenPolyline{ground[i], ground[j], roof[j], roof[i]};
  };

  s.fillPolygon(ground, HslToRgba(tones.right));

  for (std::size_t i = 0; i < n; ++i) s.fillPolygon(wallQuad(i), HslToRgba(wallTone(i)));

  if (details) {
    const bool shop = IsShopLike(b.usage);
    const bool office = b.usage == UsageCategory::Office;
    const float gf = StorefrontRatio(b.usage, b.floors);
    const int perFloor = WindowsPerFloor(b.usage);
    const float floors = static_cast<float>(b.floors);

    for (std::size_t i = 0; i < n; ++i) {
      const std::size_t j = (i + 1) % n;
      const ScreenPoint g1 = ground[i];
      const ScreenPoint g2 = ground[j];
      const ScreenPoint r1 = roof[i];
      const ScreenPoint r2 = roof[j];
      const HslColor wall = wallTone(i);

      // Ground-floor band.
      Rgba8 band;
      if (shop) band = HslToRgba(AdjustLightness(wall, 14.0f));
      else if (office) band = HslToRgba(AdjustLightness(kOfficeGlass, -10.0f));
      else band = HslToRgba(AdjustLightness(wall, 8.0f));
      s.fillPolygon(ScreenPolyline{g1, g2, Bilinear(g1, g2, r1, r2, 1.0f, gf), Bilinear(g1, g2, r1, r2, 0.0f, gf)}, band);

      const ScreenPoint door = Bilinear(g1, g2, r1, r2, 0.5f, gf * 0.5f);
      Pixel(s, RoundF(door.x) - 1.0f, RoundF(door.y), shop ? palette::kShopEntrance : palette::kWindowGround, 2.0f);

      for (int fl = 1; fl < b.floors; ++fl) {
        const float v = static_cast<float>(fl) / floors;
        s.strokePolyline(ScreenPolyline{Bilinear(g1, g2, r1, r2, 0.0f, v), Bilinear(g1, g2, r1, r2, 1.0f, v)}, thin,
                         palette::kFloorLine);
      }

      for (int fl = 1; fl < b.floors; ++fl) {
        for (int w = 0; w < perFloor; ++w) {
          const float u = static_cast<float>(w + 1) / static_cast<float>(perFloor + 1);
          const ScreenPoint pt = Bilinear(g1, g2, r1, r2, u, (static_cast<float>(fl) + 0.5f) / floors);
          const bool lit = WindowLit(static_cast<int>(i), fl, w);
          Pixel(s, RoundF(pt.x), RoundF(pt.y), lit ? palette::kWindowLit : palette::kWindowDim);
          ++(lit ? f.stats.windowsLit : f.stats.windowsDim);
        }
      }
    }

    // Billboards go on the widest wall as seen on screen.
    if (b.hero && !b.hero->billboards.empty()) {
      std::size_t best = 0;
      float bestWidth = 0.0f;
      for (std::size_t i = 0; i < n; ++i) {
        const std::size_t j = (i + 1) % n;
        const float w = std::fabs(ground[j].x - ground[i].x) + std::fabs(ground[j].y - ground[i].y);
        if (w > bestWidth) {
          bestWidth = w;
          best = i;
        }
      }
      const std::size_t j = (best + 1) % n;
      for (const Billboard& bb : b.hero->billboards) {
        const ScreenPoint tl = Bilinear(ground[best], ground[j], roof[best], roof[j], bb.u0, bb.v0);
        const ScreenPoint tr = Bilinear(ground[best], ground[j], roof[best], roof[j], bb.u1, bb.v0);
        const ScreenPoint bl = Bilinear(ground[best], ground[j], roof[best], roof[j], bb.u0, bb.v1);
        const float w = std::fabs(tr.x - tl.x) + 1.0f;
        const float h = std::fabs(bl.y - tl.y) + 1.0f;
        s.fillPolygon(ScreenPolyline{{tl.x, tl.y}, {tl.x + w, tl.y + w * 0.5f}, {tl.x + w, tl.y + w * 0.5f + h}, {tl.x, tl.y + h}},
                      bb.color);
      }
    }
  }

  for (std::size_t i = 0; i < n; ++i) s.strokePolygon(wallQuad(i), thin, HslToRgba(AdjustLightness(wallTone(i), -20.0f)));

  s.fillPolygon(roof, HslToRgba(tones.top));
  if (details && PolygonArea(roof) > 15.0f) {
    const Rgba8 base = HslToRgba(tones.top);
    const Rgba8 dark = HslToRgba(AdjustLightness(tones.top, -6.0f));
    gfx::PatternTile dither;
    dither.width = 2;
    dither.height = 2;
    dither.pixels = {dark, base, base, dark};
    s.fillPatternClipped(roof, dither);
  }
  s.strokePolygon(roof, thin, HslToRgba(AdjustLightness(tones.top, -20.0f)));

  if (details && b.hero && b.hero->rooftop != RooftopOrnament::None) {
    float cx = 0.0f;
    float cy = 0.0f;
    for (const ScreenPoint& p : roof) {
      cx += p.x;
      cy += p.y;
    }
    const float rx = RoundF(cx / static_cast<float>(n));
    const float ry = RoundF(cy / static_cast<float>(n));
    const Rgba8 accent = b.hero->accent;

    switch (b.hero->rooftop) {
    case RooftopOrnament::Antenna:
      Pixel(s, rx, ry - 8.0f, kAntennaMast, 1.0f, 8.0f);
      Pixel(s, rx - 1.0f, ry - 7.0f, kAntennaBar, 3.0f);
      Pixel(s, rx - 1.0f, ry - 5.0f, kAntennaBar, 3.0f);
      Pixel(s, rx, ry - 9.0f, kAntennaLight);
      break;
    case RooftopOrnament::Helipad:
      Pixel(s, rx - 3.0f, ry - 2.0f, kHelipad, 6.0f, 4.0f);
      Pixel(s, rx - 2.0f, ry - 1.0f, palette::kWhite, 1.0f, 3.0f);
      Pixel(s, rx + 1.0f, ry - 1.0f, palette::kWhite, 1.0f, 3.0f);
      Pixel(s, rx - 1.0f, ry, palette::kWhite, 3.0f);
      break;
    case RooftopOrnament::Screen:
      Pixel(s, rx - 2.0f, ry - 2.0f, accent, 5.0f, 3.0f);
      Pixel(s, rx - 1.0f, ry - 1.0f, WithAlpha(palette::kWhite, 0.4f), 3.0f);
      break;
    case RooftopOrnament::BillboardTop:
      Pixel(s, rx - 1.0f, ry - 5.0f, kSignPost, 1.0f, 4.0f);
      Pixel(s, rx + 1.0f, ry - 5.0f, kSignPost, 1.0f, 4.0f);
      Pixel(s, rx - 2.0f, ry - 7.0f, accent, 5.0f, 3.0f);
      break;
    case RooftopOrnament::Sign:
      Pixel(s, rx - 2.0f, ry - 2.0f, accent, 4.0f, 2.0f);
      Pixel(s, rx - 1.0f, ry - 1.0f, palette::kWhite, 2.0f);
      break;
    case RooftopOrnament::None: break;
    }
  }

  ++f.stats.buildingsDrawn;
  if (details) ++f.stats.detailedBuildings;
}

void LayeredRenderer::drawBuildingLabel(Frame& f, const Building& b) const
{
  if (b.name.empty()) return;
  const ScreenPoint p = f.iso(b.anchor);
  TextStyle ts;
  ts.sizePx = std::max(5, FloorI(4.0f * f.cam.zoom));
  ts.align = TextAlign::Center;
  f.surface.drawText(b.name, p.x, p.y - b.height * f.zoomOverK - 4.0f, ts, palette::kBuildingLabel);
  ++f.stats.labelsDrawn;
}

void LayeredRenderer::drawStations(Frame& f) const
{
  DrawingSurface& s = f.surface;
  const int size = std::max(2, FloorI(3.0f * f.zoomOverK));
  const float sz = static_cast<float>(size);

  TextStyle ts;
  ts.sizePx = std::max(4, FloorI(4.0f * f.cam.zoom));
  ts.bold = true;
  ts.align = TextAlign::Center;

  for (const Station& st : f.scene.stations) {
    const ScreenPoint p = f.iso(st.position);
    s.fillRect(p.x - sz, p.y - sz, sz * 2.0f, sz * 2.0f, palette::kWhite);
    s.fillRect(p.x - sz + 1.0f, p.y - sz + 1.0f, sz * 2.0f - 2.0f, sz * 2.0f - 2.0f, st.color);
    if (!st.name.empty()) {
      s.drawText(st.name, p.x, p.y - sz - 2.0f, ts, palette::kWhite);
      ++f.stats.labelsDrawn;
    }
    ++f.stats.stationsDrawn;
  }
}

} // namespace isodistrict
