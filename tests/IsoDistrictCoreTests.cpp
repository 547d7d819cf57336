#include "isodistrict/CameraController.hpp"
#include "isodistrict/Compositor.hpp"
#include "isodistrict/FrameHash.hpp"
#include "isodistrict/HitTest.hpp"
#include "isodistrict/Inspector.hpp"
#include "isodistrict/Iso.hpp"
#include "isodistrict/Renderer.hpp"
#include "isodistrict/Scene.hpp"
#include "isodistrict/Shading.hpp"
#include "isodistrict/SoftwareSurface.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace isodistrict;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const double _a = static_cast<double>(a);                                                                        \
    const double _b = static_cast<double>(b);                                                                        \
    if (std::fabs(_a - _b) > static_cast<double>(eps)) {                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (" << _a       \
                << " vs " << _b << ")\n";                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static Building SquareBuilding(float x0, float y0, float size, float height, int floors, UsageCategory usage)
{
  Building b;
  b.footprint = {{x0, y0}, {x0 + size, y0}, {x0 + size, y0 + size}, {x0, y0 + size}};
  b.height = height;
  b.heightMeters = height;
  b.floors = floors;
  b.usage = usage;
  return b;
}

static bool SameBox(const ScreenBox& a, const ScreenBox& b)
{
  return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
}

static void TestProjectionValues()
{
  Camera cam;
  cam.zoom = 1.0f;

  const ScreenPoint a = Project(10.0f, 0.0f, cam, 3);
  EXPECT_NEAR(a.x, 2.357, 1e-3);
  EXPECT_NEAR(a.y, 1.179, 1e-3);

  const ScreenPoint b = Project(10.0f, 10.0f, cam, 3);
  EXPECT_NEAR(b.x, 0.0, 1e-6);
  EXPECT_NEAR(b.y, 2.357, 1e-3);

  const ScreenPoint c = Project(0.0f, 10.0f, cam, 3);
  EXPECT_NEAR(c.x, -2.357, 1e-3);
  EXPECT_NEAR(c.y, 1.179, 1e-3);

  // Bit-for-bit reproducible.
  Camera odd;
  odd.panX = 123.25f;
  odd.panY = -47.5f;
  odd.zoom = 2.7f;
  const ScreenPoint p0 = Project(311.7f, -92.1f, odd, 3);
  const ScreenPoint p1 = Project(311.7f, -92.1f, odd, 3);
  EXPECT_EQ(p0.x, p1.x);
  EXPECT_EQ(p0.y, p1.y);

  // Ground-level inverse (tooling only).
  const PlanarPoint back = UnprojectToPlanar(p0, odd, 3);
  EXPECT_NEAR(back.x, 311.7, 1e-2);
  EXPECT_NEAR(back.y, -92.1, 1e-2);
}

static void TestZoomClamp()
{
  CameraController ctl(3, 50.0f);
  ViewState view;
  view.camera = DefaultCamera(1280, 1.3f);
  EXPECT_EQ(view.camera.panX, 690.0f);
  EXPECT_EQ(view.camera.panY, -200.0f);

  for (int i = 0; i < 30; ++i) EXPECT_TRUE(ctl.wheel(view, 100.0f));
  EXPECT_EQ(view.camera.zoom, kMinZoom);

  for (int i = 0; i < 60; ++i) ctl.wheel(view, -100.0f);
  EXPECT_EQ(view.camera.zoom, kMaxZoom);

  // Zero delta is ignored.
  EXPECT_FALSE(ctl.wheel(view, 0.0f));
  EXPECT_EQ(view.camera.zoom, kMaxZoom);

  EXPECT_EQ(ClampZoom(0.01f), kMinZoom);
  EXPECT_EQ(ClampZoom(1.0f), 1.0f);
}

static void TestClickDragThreshold()
{
  HitTestIndex index;
  index.clear(1);
  index.add(ScreenBox{0.0f, 0.0f, 100.0f, 100.0f}, 7);

  // 4.9 units: click, selection resolves through the index.
  {
    CameraController ctl(3, 50.0f);
    ViewState view;
    ctl.pointerDown(view, 100.0f, 100.0f);
    EXPECT_TRUE(ctl.state() == DragState::Dragging);
    EXPECT_TRUE(ctl.pointerUp(view, index, 104.9f, 100.0f));
    EXPECT_TRUE(ctl.state() == DragState::Idle);
    ASSERT_TRUE(view.selected.has_value());
    EXPECT_EQ(*view.selected, static_cast<std::size_t>(7));
  }

  // 5.1 units: drag, selection unchanged.
  {
    CameraController ctl(3, 50.0f);
    ViewState view;
    view.selected = 3;
    ctl.pointerDown(view, 100.0f, 100.0f);
    EXPECT_FALSE(ctl.pointerUp(view, index, 105.1f, 100.0f));
    EXPECT_TRUE(ctl.state() == DragState::Idle);
    ASSERT_TRUE(view.selected.has_value());
    EXPECT_EQ(*view.selected, static_cast<std::size_t>(3));
  }

  // A click on empty space clears the selection.
  {
    CameraController ctl(3, 50.0f);
    ViewState view;
    view.selected = 3;
    ctl.pointerDown(view, 900.0f, 600.0f);
    EXPECT_TRUE(ctl.pointerUp(view, index, 900.0f, 600.0f));
    EXPECT_FALSE(view.selected.has_value());
  }
}

static void TestDragPansAndLeaveResets()
{
  CameraController ctl(3, 50.0f);
  ViewState view;
  view.camera.panX = 10.0f;
  view.camera.panY = 20.0f;

  // Moves without a press do nothing.
  EXPECT_FALSE(ctl.pointerMove(view, 50.0f, 50.0f));
  EXPECT_EQ(view.camera.panX, 10.0f);

  ctl.pointerDown(view, 100.0f, 100.0f);
  EXPECT_TRUE(ctl.pointerMove(view, 110.0f, 95.0f));
  EXPECT_TRUE(ctl.pointerMove(view, 130.0f, 90.0f));
  EXPECT_EQ(view.camera.panX, 40.0f);
  EXPECT_EQ(view.camera.panY, 10.0f);

  ctl.pointerLeave(view);
  EXPECT_TRUE(ctl.state() == DragState::Idle);
  EXPECT_FALSE(ctl.pointerMove(view, 200.0f, 200.0f));
  EXPECT_EQ(view.camera.panX, 40.0f);

  // Working-surface conversion subtracts the header.
  const ScreenPoint w = ctl.toWorking(30.0f, 80.0f);
  EXPECT_NEAR(w.x, 10.0, 1e-6);
  EXPECT_NEAR(w.y, 10.0, 1e-6);
}

static void TestBilinear()
{
  const ScreenPoint g1{0.0f, 10.0f};
  const ScreenPoint g2{8.0f, 14.0f};
  const ScreenPoint r1{0.0f, 0.0f};
  const ScreenPoint r2{8.0f, 4.0f};

  const ScreenPoint a = Bilinear(g1, g2, r1, r2, 0.0f, 0.0f);
  EXPECT_EQ(a.x, g1.x);
  EXPECT_EQ(a.y, g1.y);
  const ScreenPoint b = Bilinear(g1, g2, r1, r2, 1.0f, 0.0f);
  EXPECT_EQ(b.x, g2.x);
  EXPECT_EQ(b.y, g2.y);
  const ScreenPoint c = Bilinear(g1, g2, r1, r2, 0.0f, 1.0f);
  EXPECT_EQ(c.x, r1.x);
  EXPECT_EQ(c.y, r1.y);
  const ScreenPoint d = Bilinear(g1, g2, r1, r2, 1.0f, 1.0f);
  EXPECT_EQ(d.x, r2.x);
  EXPECT_EQ(d.y, r2.y);

  const ScreenPoint m = Bilinear(g1, g2, r1, r2, 0.5f, 0.5f);
  EXPECT_NEAR(m.x, 4.0, 1e-6);
  EXPECT_NEAR(m.y, 7.0, 1e-6);
}

static void TestShading()
{
  // Light comes from the top-left: an edge running +y has outward normal (-1, 0), facing it.
  EXPECT_TRUE(WallFacesLight(PlanarPoint{0.0f, 0.0f}, PlanarPoint{0.0f, 10.0f}));
  EXPECT_FALSE(WallFacesLight(PlanarPoint{0.0f, 10.0f}, PlanarPoint{0.0f, 0.0f}));

  Building b = SquareBuilding(0.0f, 0.0f, 10.0f, 35.0f, 10, UsageCategory::Office);
  b.anchor = PlanarPoint{0.0f, 0.0f};
  b.heightMeters = 150.0f;
  const BuildingTones t = ToneFor(b);
  EXPECT_NEAR(t.left.l, 44.0, 1e-4);
  EXPECT_NEAR(t.right.l, 32.0, 1e-4);
  EXPECT_NEAR(t.top.l, 58.0, 1e-4);

  EXPECT_EQ(WindowsPerFloor(UsageCategory::Office), 3);
  EXPECT_EQ(WindowsPerFloor(UsageCategory::ShopHouse), 1);
  EXPECT_EQ(WindowsPerFloor(UsageCategory::House), 2);
  EXPECT_NEAR(StorefrontRatio(UsageCategory::Shop, 4), 0.3, 1e-6);
  EXPECT_NEAR(StorefrontRatio(UsageCategory::Shop, 10), 0.2, 1e-6);
  EXPECT_NEAR(StorefrontRatio(UsageCategory::Office, 10), 0.1, 1e-6);

  EXPECT_TRUE(WindowLit(0, 1, 1));
  EXPECT_FALSE(WindowLit(0, 3, 0));
  EXPECT_FALSE(WindowLit(1, 1, 2));
}

static void TestDepthOrder()
{
  Scene scene;
  Building a = SquareBuilding(0.0f, 0.0f, 4.0f, 10.0f, 2, UsageCategory::House);
  a.anchor = PlanarPoint{5.0f, 5.0f};
  Building b = SquareBuilding(0.0f, 0.0f, 4.0f, 10.0f, 2, UsageCategory::House);
  b.anchor = PlanarPoint{1.0f, 1.0f};
  Building c = SquareBuilding(0.0f, 0.0f, 4.0f, 10.0f, 2, UsageCategory::House);
  c.anchor = PlanarPoint{3.0f, 7.0f};
  scene.buildings = {a, b, c};

  const std::vector<std::size_t> order = PaintOrder(scene);
  ASSERT_TRUE(order.size() == 3);
  EXPECT_EQ(order[0], static_cast<std::size_t>(1));
  // Ties keep input order.
  EXPECT_EQ(order[1], static_cast<std::size_t>(0));
  EXPECT_EQ(order[2], static_cast<std::size_t>(2));
}

static void TestPickingPrefersLaterPaint()
{
  Scene scene;
  // Input order is deliberately back-to-front reversed.
  scene.buildings.push_back(SquareBuilding(5.0f, 5.0f, 10.0f, 35.0f, 4, UsageCategory::Office));
  scene.buildings.push_back(SquareBuilding(0.0f, 0.0f, 10.0f, 35.0f, 4, UsageCategory::Office));
  AdmitScene(scene);

  Camera cam;
  cam.panX = 300.0f;
  cam.panY = 150.0f;
  cam.zoom = 2.0f;

  SoftwareSurface working(200, 150);
  HitTestIndex index;
  LayeredRenderer renderer;
  renderer.render(scene, {}, cam, working, index, 1);

  ASSERT_TRUE(index.size() == 2);
  const HitBox& first = index.entries()[0];
  const HitBox& second = index.entries()[1];
  EXPECT_EQ(first.buildingIndex, static_cast<std::size_t>(1));
  EXPECT_EQ(second.buildingIndex, static_cast<std::size_t>(0));

  const float ox0 = std::max(first.box.minX, second.box.minX);
  const float ox1 = std::min(first.box.maxX, second.box.maxX);
  const float oy0 = std::max(first.box.minY, second.box.minY);
  const float oy1 = std::min(first.box.maxY, second.box.maxY);
  ASSERT_TRUE(ox0 <= ox1 && oy0 <= oy1);

  const std::optional<std::size_t> hit = index.pick(ScreenPoint{(ox0 + ox1) * 0.5f, (oy0 + oy1) * 0.5f});
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, static_cast<std::size_t>(0));

  // Bounds are inclusive.
  EXPECT_TRUE(index.pick(ScreenPoint{first.box.minX, first.box.minY}).has_value());
  EXPECT_FALSE(index.pick(ScreenPoint{-1000.0f, -1000.0f}).has_value());
}

static void TestHitIndexFreshness()
{
  Scene scene;
  scene.buildings.push_back(SquareBuilding(0.0f, 0.0f, 10.0f, 35.0f, 4, UsageCategory::Office));
  scene.buildings.push_back(SquareBuilding(30.0f, 0.0f, 8.0f, 20.0f, 3, UsageCategory::House));
  AdmitScene(scene);

  LayeredRenderer renderer;
  SoftwareSurface working(200, 150);
  HitTestIndex index;

  Camera a;
  a.panX = 300.0f;
  a.panY = 150.0f;
  a.zoom = 1.3f;
  renderer.render(scene, {}, a, working, index, 1);
  const std::vector<HitBox> frame1 = index.entries();
  EXPECT_EQ(index.frameSerial(), static_cast<std::uint64_t>(1));

  Camera b = a;
  b.panX += 30.0f;
  b.panY += 12.0f;
  renderer.render(scene, {}, b, working, index, 2);
  EXPECT_EQ(index.frameSerial(), static_cast<std::uint64_t>(2));
  ASSERT_TRUE(index.size() == frame1.size());

  SoftwareSurface scratch(200, 150);
  HitTestIndex reference;
  renderer.render(scene, {}, b, scratch, reference, 99);
  ASSERT_TRUE(reference.size() == index.size());

  for (std::size_t i = 0; i < index.size(); ++i) {
    EXPECT_TRUE(SameBox(index.entries()[i].box, reference.entries()[i].box));
    for (const HitBox& old : frame1) EXPECT_FALSE(SameBox(index.entries()[i].box, old.box));
  }
}

static void TestSingleBuildingScenario()
{
  Scene scene;
  scene.buildings.push_back(SquareBuilding(0.0f, 0.0f, 10.0f, 35.0f, 10, UsageCategory::Office));
  const SceneAdmissionReport rep = AdmitScene(scene);
  EXPECT_EQ(rep.buildings.kept, static_cast<std::size_t>(1));

  const Camera cam = DefaultCamera(1280, 1.3f);
  LayeredRenderer renderer;

  SoftwareSurface w1(426, 223);
  HitTestIndex i1;
  const RenderStats s1 = renderer.render(scene, {}, cam, w1, i1, 1);

  EXPECT_EQ(i1.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(s1.buildingsDrawn, static_cast<std::size_t>(1));
  EXPECT_EQ(s1.detailedBuildings, static_cast<std::size_t>(1));
  // 4 walls x 9 upper floors x 3 office windows; (wall + window) % 3 == 0 is dim.
  EXPECT_EQ(s1.windowsLit, static_cast<std::size_t>(72));
  EXPECT_EQ(s1.windowsDim, static_cast<std::size_t>(36));

  SoftwareSurface w2(426, 223);
  HitTestIndex i2;
  const RenderStats s2 = renderer.render(scene, {}, cam, w2, i2, 2);
  EXPECT_EQ(s2.windowsLit, s1.windowsLit);
  EXPECT_EQ(HashImage(w1.image()), HashImage(w2.image()));
  EXPECT_TRUE(SameBox(i1.entries()[0].box, i2.entries()[0].box));
}

static void TestClosedFootprintMatchesOpen()
{
  // Rendered without admission so the renderer sees the repeated closing point.
  Scene open;
  open.buildings.push_back(SquareBuilding(0.0f, 0.0f, 10.0f, 35.0f, 10, UsageCategory::Office));
  open.buildings[0].anchor = PlanarPoint{5.0f, 5.0f};

  Scene closed = open;
  closed.buildings[0].footprint.push_back(closed.buildings[0].footprint.front());

  const Camera cam = DefaultCamera(1280, 3.0f);
  LayeredRenderer renderer;

  SoftwareSurface wOpen(426, 223);
  HitTestIndex iOpen;
  const RenderStats sOpen = renderer.render(open, {}, cam, wOpen, iOpen, 1);

  SoftwareSurface wClosed(426, 223);
  HitTestIndex iClosed;
  const RenderStats sClosed = renderer.render(closed, {}, cam, wClosed, iClosed, 1);

  EXPECT_EQ(sOpen.windowsLit, static_cast<std::size_t>(72));
  EXPECT_EQ(sOpen.windowsDim, static_cast<std::size_t>(36));
  EXPECT_EQ(sClosed.windowsLit, sOpen.windowsLit);
  EXPECT_EQ(sClosed.windowsDim, sOpen.windowsDim);
  EXPECT_EQ(HashImage(wClosed.image()), HashImage(wOpen.image()));
  ASSERT_TRUE(iOpen.size() == 1 && iClosed.size() == 1);
  EXPECT_TRUE(SameBox(iOpen.entries()[0].box, iClosed.entries()[0].box));
}

static void TestDetailGate()
{
  Scene scene;
  scene.buildings.push_back(SquareBuilding(0.0f, 0.0f, 10.0f, 35.0f, 10, UsageCategory::Office));
  scene.buildings.push_back(SquareBuilding(20.0f, 0.0f, 10.0f, 5.0f, 1, UsageCategory::House));
  AdmitScene(scene);

  LayeredRenderer renderer;
  SoftwareSurface working(200, 150);
  HitTestIndex index;

  Camera far;
  far.zoom = 0.6f; // zoom / K = 0.2
  RenderStats s = renderer.render(scene, {}, far, working, index, 1);
  EXPECT_EQ(s.detailedBuildings, static_cast<std::size_t>(0));
  EXPECT_EQ(s.windowsLit + s.windowsDim, static_cast<std::size_t>(0));
  EXPECT_EQ(index.size(), static_cast<std::size_t>(2));

  Camera nearCam;
  nearCam.zoom = 1.5f; // zoom / K = 0.5; the one-floor house stays plain
  s = renderer.render(scene, {}, nearCam, working, index, 2);
  EXPECT_EQ(s.detailedBuildings, static_cast<std::size_t>(1));
}

static void TestDecorationGate()
{
  Scene scene;
  Road road;
  road.points = {{0.0f, 0.0f}, {20.0f, 0.0f}, {40.0f, 0.0f}, {60.0f, 0.0f}, {80.0f, 0.0f}, {100.0f, 0.0f}};
  road.roadClass = RoadClass::Pedestrian;
  road.width = 6.0f;
  scene.roads.push_back(road);

  ScrambleFeature sf;
  sf.area = {{0.0f, 0.0f}, {30.0f, 0.0f}, {30.0f, 30.0f}, {0.0f, 30.0f}};
  sf.crossings.push_back(PlanarPolyline{{0.0f, 0.0f}, {30.0f, 30.0f}});
  scene.scramble = sf;
  AdmitScene(scene);

  LayeredRenderer renderer;
  SoftwareSurface working(200, 150);
  HitTestIndex index;

  Camera cam;
  cam.zoom = 1.3f;
  RenderStats s = renderer.render(scene, {}, cam, working, index, 1);
  EXPECT_EQ(s.pedestriansDrawn, static_cast<std::size_t>(40));
  // Vertices 0 and 4 (i < len - 1, step 4).
  EXPECT_EQ(s.streetTreesDrawn, static_cast<std::size_t>(2));
  // Segments 0 and 3 (step 3).
  EXPECT_EQ(s.kiosksDrawn, static_cast<std::size_t>(2));
  EXPECT_TRUE(s.stripesDrawn > 0);

  cam.zoom = 0.9f; // zoom / K = 0.3 < 0.35
  s = renderer.render(scene, {}, cam, working, index, 2);
  EXPECT_EQ(s.pedestriansDrawn, static_cast<std::size_t>(0));
  EXPECT_EQ(s.streetTreesDrawn, static_cast<std::size_t>(0));
  EXPECT_EQ(s.kiosksDrawn, static_cast<std::size_t>(0));
}

static void TestAdmission()
{
  const float nan = std::numeric_limits<float>::quiet_NaN();
  Scene scene;

  Building closed = SquareBuilding(0.0f, 0.0f, 10.0f, 20.0f, 0, UsageCategory::House);
  closed.footprint.push_back(closed.footprint.front());
  closed.footprint.insert(closed.footprint.begin() + 1, PlanarPoint{nan, 3.0f});
  scene.buildings.push_back(closed);

  Building flat = SquareBuilding(0.0f, 0.0f, 10.0f, 0.0f, 2, UsageCategory::House);
  scene.buildings.push_back(flat);

  Building sliver;
  sliver.footprint = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 0.0f}};
  sliver.height = 10.0f;
  scene.buildings.push_back(sliver);

  Road r;
  r.points = {{0.0f, 0.0f}, {10.0f, 0.0f}};
  r.width = nan;
  r.roadClass = RoadClass::Secondary;
  scene.roads.push_back(r);
  Road stub;
  stub.points = {{0.0f, 0.0f}, {0.0f, 0.0f}};
  scene.roads.push_back(stub);

  Park p;
  p.area = -5.0f;
  scene.parks.push_back(p);

  Station lost;
  lost.position = PlanarPoint{nan, 0.0f};
  scene.stations.push_back(lost);

  ScrambleFeature sf;
  sf.area = {{0.0f, 0.0f}, {5.0f, 5.0f}};
  scene.scramble = sf;

  GroundTile empty;
  scene.tiles.push_back(empty);

  const SceneAdmissionReport rep = AdmitScene(scene);
  EXPECT_EQ(rep.buildings.kept, static_cast<std::size_t>(1));
  EXPECT_EQ(rep.buildings.dropped, static_cast<std::size_t>(2));
  EXPECT_EQ(rep.floorsClamped, static_cast<std::size_t>(1));
  EXPECT_EQ(rep.roads.kept, static_cast<std::size_t>(1));
  EXPECT_EQ(rep.roads.dropped, static_cast<std::size_t>(1));
  EXPECT_EQ(rep.roadWidthsDefaulted, static_cast<std::size_t>(1));
  EXPECT_EQ(rep.parkAreasReset, static_cast<std::size_t>(1));
  EXPECT_EQ(rep.stations.dropped, static_cast<std::size_t>(1));
  EXPECT_EQ(rep.tiles.dropped, static_cast<std::size_t>(1));
  EXPECT_TRUE(rep.scrambleAreaDropped);
  EXPECT_FALSE(scene.scramble.has_value());
  EXPECT_EQ(rep.totalDropped(), static_cast<std::size_t>(6));

  ASSERT_TRUE(scene.buildings.size() == 1);
  const Building& kept = scene.buildings[0];
  EXPECT_EQ(kept.footprint.size(), static_cast<std::size_t>(4));
  EXPECT_EQ(kept.floors, 1);
  EXPECT_NEAR(kept.anchor.x, 5.0, 1e-6);
  EXPECT_NEAR(kept.anchor.y, 5.0, 1e-6);
  EXPECT_EQ(scene.roads[0].width, 8.0f);
  EXPECT_EQ(scene.parks[0].area, 0.0f);
}

static void TestInspectorSizing()
{
  Building b = SquareBuilding(0.0f, 0.0f, 10.0f, 35.0f, 10, UsageCategory::Office);
  const InspectorContent c = BuildInspectorContent(b);
  EXPECT_EQ(c.title, std::string("Building"));
  ASSERT_TRUE(c.lines.size() == 3);
  EXPECT_EQ(c.lines[0].label, std::string("Height:"));
  EXPECT_EQ(c.lines[0].value, std::string("35.0 m"));
  EXPECT_EQ(c.lines[1].value, std::string("10"));
  EXPECT_EQ(c.lines[2].value, std::string("Office"));

  SoftwareSurface display(800, 600);
  const InspectorLayout lay = LayoutInspector(c, display);

  TextStyle line;
  line.sizePx = 12;
  const int labelW = display.measureText("Height:", line);
  const int valueW = display.measureText("35.0 m", line);
  EXPECT_NEAR(lay.width, labelW + 12 + valueW + 48, 1e-4);
  EXPECT_NEAR(lay.valueX, lay.labelX + labelW + 12, 1e-4);
  EXPECT_NEAR(lay.height, 20 + 22 + 3 * 18 + 8, 1e-4);
  EXPECT_NEAR(lay.x, 800.0 - lay.width - 16.0, 1e-4);
  EXPECT_NEAR(lay.y, 60.0, 1e-6);

  // Hero buildings get a landmark line and a longer name widens the panel.
  b.name = "Very Long Landmark Tower Name";
  b.hero = HeroDecoration{};
  b.hero->rooftop = RooftopOrnament::Helipad;
  const InspectorContent hero = BuildInspectorContent(b);
  ASSERT_TRUE(hero.lines.size() == 4);
  EXPECT_EQ(hero.lines[3].value, std::string("helipad"));
  const InspectorLayout heroLay = LayoutInspector(hero, display);
  EXPECT_TRUE(heroLay.width > lay.width);
  EXPECT_NEAR(heroLay.height, lay.height + 18.0, 1e-4);

  // Every label ends before the value column and every value fits inside the panel.
  for (const InspectorLine& l : hero.lines) {
    EXPECT_TRUE(heroLay.labelX + static_cast<float>(display.measureText(l.label, line)) < heroLay.valueX);
    EXPECT_TRUE(heroLay.valueX + static_cast<float>(display.measureText(l.value, line)) <= heroLay.x + heroLay.width);
  }
  EXPECT_NEAR(heroLay.valueX, heroLay.labelX + display.measureText("Landmark:", line) + 12, 1e-4);

  DrawInspector(display, hero);
  const Rgba8 border = display.image().at(static_cast<int>(heroLay.x) + 1, static_cast<int>(heroLay.y) + 20);
  EXPECT_EQ(border, Rgb(0xFF7799));
}

static void TestCompositor()
{
  int ww = 0;
  int wh = 0;
  WorkingSizeFor(1280, 670, 3, ww, wh);
  EXPECT_EQ(ww, 426);
  EXPECT_EQ(wh, 223);

  RgbaImage working;
  working.resize(4, 3);
  for (int y = 0; y < 3; ++y) {
    for (int x = 0; x < 4; ++x) {
      const std::size_t i = (static_cast<std::size_t>(y) * 4u + static_cast<std::size_t>(x)) * 4u;
      working.rgba[i + 0] = static_cast<std::uint8_t>(x * 60);
      working.rgba[i + 1] = static_cast<std::uint8_t>(y * 80);
      working.rgba[i + 2] = 200;
      working.rgba[i + 3] = 255;
    }
  }

  SoftwareSurface display(13, 10);
  CompositorOptions opt;
  opt.scanlines = false;
  const Rgba8 bg = Rgb(0x1A1028);
  PresentWorking(working, display, opt, bg);

  for (int y = 0; y < 9; ++y) {
    for (int x = 0; x < 12; ++x) EXPECT_EQ(display.image().at(x, y), working.at(x / 3, y / 3));
  }
  EXPECT_EQ(display.image().at(12, 0), bg);
  EXPECT_EQ(display.image().at(0, 9), bg);

  opt.scanlines = true;
  PresentWorking(working, display, opt, bg);
  EXPECT_TRUE(display.image().at(0, 0).b < display.image().at(0, 1).b);
  EXPECT_EQ(display.image().at(0, 1), working.at(0, 0));
  EXPECT_TRUE(display.image().at(0, 3).b < display.image().at(0, 4).b);
}

int main()
{
  TestProjectionValues();
  TestZoomClamp();
  TestClickDragThreshold();
  TestDragPansAndLeaveResets();
  TestBilinear();
  TestShading();
  TestDepthOrder();
  TestPickingPrefersLaterPaint();
  TestHitIndexFreshness();
  TestSingleBuildingScenario();
  TestClosedFootprintMatchesOpen();
  TestDetailGate();
  TestDecorationGate();
  TestAdmission();
  TestInspectorSizing();
  TestCompositor();

  if (g_failures == 0) {
    std::cout << "isodistrict_core_tests: OK\n";
    return 0;
  }
  std::cerr << "isodistrict_core_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
