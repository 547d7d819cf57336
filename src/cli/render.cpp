// isodistrict_render: headless single-frame renderer.
//
// Loads a scene payload, renders one frame through the software surfaces (optionally simulating a
// click so the inspector shows), prints the frame hash and writes a PNG.

#include "cli/CliParse.hpp"

#include "isodistrict/Chrome.hpp"
#include "isodistrict/ConfigIO.hpp"
#include "isodistrict/DistrictView.hpp"
#include "isodistrict/FrameHash.hpp"
#include "isodistrict/ImageDecodeQueue.hpp"
#include "isodistrict/ImageIO.hpp"
#include "isodistrict/LogTee.hpp"
#include "isodistrict/SceneIO.hpp"
#include "isodistrict/SoftwareSurface.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

using namespace isodistrict;

void PrintHelp()
{
  std::cout << "isodistrict_render - render one frame of a district scene to PNG\n\n"
            << "Usage: isodistrict_render --scene <scene.json> [options]\n\n"
            << "  --scene <path>        scene payload (JSON)\n"
            << "  --config <path>       viewer config JSON (merged over defaults)\n"
            << "  --window <W>x<H>      window size, header included (default 1280x720)\n"
            << "  --header <N>          header rows (default 50)\n"
            << "  --scale <K>           display pixels per working pixel (default 3)\n"
            << "  --zoom <Z>            initial zoom, clamped to [0.3, 5]\n"
            << "  --pan <X>,<Y>         explicit pan in display pixels\n"
            << "  --select-at <X>,<Y>   simulate a click at a window position\n"
            << "  --scanlines <0|1>     scanline overlay\n"
            << "  --no-chrome           write the display surface only (no header)\n"
            << "  --working             write the low-resolution working surface instead\n"
            << "  --stats               print render counters\n"
            << "  --log-file <path>     tee stdout/stderr into a rotated log file\n"
            << "  --print-config        print the effective config as JSON and exit\n"
            << "  -o, --out <path>      output PNG\n";
}

struct Args {
  std::string scenePath;
  std::string configPath;
  std::string outPath;
  std::optional<std::pair<float, float>> selectAt;
  bool chrome = true;
  bool workingOnly = false;
  bool stats = false;
  bool printConfig = false;
};

bool NeedValue(int i, int argc, const std::string& flag, std::string& err)
{
  if (i + 1 < argc) return true;
  err = "missing value for " + flag;
  return false;
}

// Config flags are applied after --config so they always win.
bool ParseArgs(int argc, char** argv, Args& args, ViewerConfig& cfg, bool& wantHelp, std::string& err)
{
  // First pass: the config file, so flag overrides layer on top of it.
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config") {
      if (!NeedValue(i, argc, a, err)) return false;
      args.configPath = argv[++i];
    }
  }
  if (!args.configPath.empty() && !LoadViewerConfigJsonFile(args.configPath, cfg, err)) return false;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      wantHelp = true;
      return true;
    } else if (a == "--config") {
      ++i;
    } else if (a == "--scene") {
      if (!NeedValue(i, argc, a, err)) return false;
      args.scenePath = argv[++i];
    } else if (a == "-o" || a == "--out") {
      if (!NeedValue(i, argc, a, err)) return false;
      args.outPath = argv[++i];
    } else if (a == "--window") {
      if (!NeedValue(i, argc, a, err)) return false;
      if (!cli::ParseWxH(argv[++i], &cfg.windowWidth, &cfg.windowHeight)) {
        err = "invalid --window (expected WxH)";
        return false;
      }
    } else if (a == "--header") {
      if (!NeedValue(i, argc, a, err)) return false;
      if (!cli::ParseI32(argv[++i], &cfg.headerHeight)) {
        err = "invalid --header";
        return false;
      }
    } else if (a == "--scale") {
      if (!NeedValue(i, argc, a, err)) return false;
      if (!cli::ParseI32(argv[++i], &cfg.pixelScale)) {
        err = "invalid --scale";
        return false;
      }
    } else if (a == "--zoom") {
      if (!NeedValue(i, argc, a, err)) return false;
      if (!cli::ParseF32(argv[++i], &cfg.initialZoom)) {
        err = "invalid --zoom";
        return false;
      }
      cfg.initialZoom = ClampZoom(cfg.initialZoom);
    } else if (a == "--pan") {
      if (!NeedValue(i, argc, a, err)) return false;
      if (!cli::ParseF32Pair(argv[++i], &cfg.initialPanX, &cfg.initialPanY)) {
        err = "invalid --pan (expected X,Y)";
        return false;
      }
      cfg.panAuto = false;
    } else if (a == "--select-at") {
      if (!NeedValue(i, argc, a, err)) return false;
      float x = 0.0f;
      float y = 0.0f;
      if (!cli::ParseF32Pair(argv[++i], &x, &y)) {
        err = "invalid --select-at (expected X,Y)";
        return false;
      }
      args.selectAt = std::make_pair(x, y);
    } else if (a == "--scanlines") {
      if (!NeedValue(i, argc, a, err)) return false;
      if (!cli::ParseBool01(argv[++i], &cfg.scanlines)) {
        err = "invalid --scanlines (expected 0 or 1)";
        return false;
      }
    } else if (a == "--log-file") {
      if (!NeedValue(i, argc, a, err)) return false;
      cfg.logFile = argv[++i];
    } else if (a == "--no-chrome") {
      args.chrome = false;
    } else if (a == "--working") {
      args.workingOnly = true;
    } else if (a == "--stats") {
      args.stats = true;
    } else if (a == "--print-config") {
      args.printConfig = true;
    } else if (args.scenePath.empty() && !a.empty() && a[0] != '-') {
      args.scenePath = a;
    } else {
      err = "unknown argument: " + a;
      return false;
    }
  }

  return ValidateViewerConfig(cfg, err);
}

void PrintStats(const RenderStats& s, const HitTestIndex& index)
{
  std::cout << "[render] frame " << index.frameSerial() << ": " << s.buildingsDrawn << " buildings ("
            << s.detailedBuildings << " detailed, " << index.size() << " hit boxes), " << s.roadsDrawn << " roads, "
            << s.railwaysDrawn << " rail segments, " << s.parksDrawn << " parks, " << s.stationsDrawn << " stations, "
            << s.tilesDrawn << " tiles\n"
            << "[render] decoration: " << s.kiosksDrawn << " kiosks, " << s.streetTreesDrawn << " street trees, "
            << s.stripesDrawn << " stripes, " << s.pedestriansDrawn << " pedestrians, " << s.labelsDrawn << " labels\n"
            << "[render] windows: " << s.windowsLit << " lit, " << s.windowsDim << " dim\n";
}

int Run(int argc, char** argv)
{
  Args args;
  ViewerConfig cfg;
  bool wantHelp = false;
  std::string err;
  if (!ParseArgs(argc, argv, args, cfg, wantHelp, err)) {
    std::cerr << "error: " << err << "\n";
    return 2;
  }
  if (wantHelp) {
    PrintHelp();
    return 0;
  }
  if (args.printConfig) {
    std::cout << ViewerConfigToJson(cfg);
    return 0;
  }
  if (args.scenePath.empty()) {
    std::cerr << "error: no scene given (use --scene <path>)\n";
    return 2;
  }

  LogTee tee;
  if (!cfg.logFile.empty()) {
    LogTeeOptions lo;
    lo.path = cfg.logFile;
    if (!tee.start(lo, err)) std::cerr << "[log] " << err << " (continuing without a log file)\n";
  }

  Scene scene;
  if (!LoadSceneFile(args.scenePath, scene, err)) {
    std::cerr << "[scene] " << err << "\n";
    return 1;
  }
  const SceneAdmissionReport report = AdmitScene(scene);
  std::cout << "[scene] " << args.scenePath << ": " << FormatAdmissionReport(report) << "\n";

  const int displayW = cfg.windowWidth;
  const int displayH = cfg.windowHeight - cfg.headerHeight;

  DistrictView view(std::move(scene), cfg);
  view.resize(displayW, displayH);

  BuiltinImageDecoder decoder;
  ImageDecodeQueue queue(decoder);
  queue.requestAll(view.scene());
  queue.pumpAll([&](std::size_t i, RgbaImage&& img) { view.setTileImage(i, std::move(img)); });
  if (!view.scene().tiles.empty()) {
    std::cout << "[imagery] " << queue.decoded() << " tiles decoded, " << queue.failed() << " failed\n";
  }

  view.renderIfDirty();

  if (args.selectAt) {
    const float x = args.selectAt->first;
    const float y = args.selectAt->second;
    view.pointerDown(x, y);
    view.pointerUp(x, y);
    const std::optional<std::size_t>& sel = view.viewState().selected;
    if (sel) {
      const Building& b = view.scene().buildings[*sel];
      std::cout << "[select] building " << *sel << (b.name.empty() ? std::string() : " '" + b.name + "'") << "\n";
    } else {
      std::cout << "[select] nothing at " << x << "," << y << "\n";
    }
    view.renderIfDirty();
  }

  RgbaImage out;
  if (args.workingOnly) {
    out = view.working().image();
  } else {
    SoftwareSurface display(displayW, displayH);
    view.present(display);

    if (args.chrome) {
      SoftwareSurface header(cfg.windowWidth, cfg.headerHeight);
      DrawHeader(header, view.scene());

      SoftwareSurface window(cfg.windowWidth, cfg.windowHeight);
      window.blitImageAffine(header.image(), gfx::AffineTranslate(0.0f, 0.0f), 1.0f);
      window.blitImageAffine(display.image(), gfx::AffineTranslate(0.0f, static_cast<float>(cfg.headerHeight)), 1.0f);
      out = window.image();
    } else {
      out = display.image();
    }
  }

  if (args.stats) PrintStats(view.lastStats(), view.hitIndex());
  std::cout << "frame_hash " << HexU64(HashImage(out)) << "\n";

  if (!args.outPath.empty()) {
    if (!cli::EnsureParentDir(args.outPath)) {
      std::cerr << "error: cannot create directory for " << args.outPath << "\n";
      return 1;
    }
    if (!WritePng(args.outPath, out, err)) {
      std::cerr << "error: " << err << "\n";
      return 1;
    }
    std::cout << "wrote " << args.outPath << " (" << out.width << "x" << out.height << ")\n";
  }
  return 0;
}

} // namespace

int main(int argc, char** argv)
{
  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return 1;
  } catch (...) {
    std::cerr << "Fatal error: unknown exception\n";
    return 1;
  }
}
