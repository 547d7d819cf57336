#include "cli/CliParse.hpp"

#include "isodistrict/ConfigIO.hpp"
#include "isodistrict/LogTee.hpp"
#include "isodistrict/SceneIO.hpp"
#include "isodistrict/Viewer.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

static void PrintHelp()
{
  std::cout << "IsoDistrict\n"
            << "  --scene <path>        scene payload (JSON)\n"
            << "  --config <path>       viewer config JSON\n"
            << "  --window <W>x<H>      window size (header included)\n"
            << "  --scale <K>           display pixels per working pixel\n"
            << "  --zoom <Z>            initial zoom\n"
            << "  --pan <X>,<Y>         initial pan in display pixels\n"
            << "  --scanlines <0|1>\n"
            << "  --log-file <path>     tee stdout/stderr into a rotated log file\n"
            << "  --raylib-log <level>  trace|debug|info|warning|error|fatal|none\n";
}

int main(int argc, char** argv)
{
  isodistrict::ViewerConfig cfg;
  std::string scenePath;
  std::string err;

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config" && i + 1 < argc) {
      if (!isodistrict::LoadViewerConfigJsonFile(argv[i + 1], cfg, err)) {
        std::cerr << "[config] " << err << "\n";
        return 2;
      }
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool hasValue = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    }
    if (arg == "--config" && hasValue) {
      ++i;
    } else if (arg == "--scene" && hasValue) {
      scenePath = argv[++i];
    } else if (arg == "--window" && hasValue) {
      if (!isodistrict::cli::ParseWxH(argv[++i], &cfg.windowWidth, &cfg.windowHeight)) {
        std::cerr << "invalid --window (expected WxH)\n";
        return 2;
      }
    } else if (arg == "--scale" && hasValue) {
      if (!isodistrict::cli::ParseI32(argv[++i], &cfg.pixelScale)) {
        std::cerr << "invalid --scale\n";
        return 2;
      }
    } else if (arg == "--zoom" && hasValue) {
      if (!isodistrict::cli::ParseF32(argv[++i], &cfg.initialZoom)) {
        std::cerr << "invalid --zoom\n";
        return 2;
      }
      cfg.initialZoom = isodistrict::ClampZoom(cfg.initialZoom);
    } else if (arg == "--pan" && hasValue) {
      if (!isodistrict::cli::ParseF32Pair(argv[++i], &cfg.initialPanX, &cfg.initialPanY)) {
        std::cerr << "invalid --pan (expected X,Y)\n";
        return 2;
      }
      cfg.panAuto = false;
    } else if (arg == "--scanlines" && hasValue) {
      if (!isodistrict::cli::ParseBool01(argv[++i], &cfg.scanlines)) {
        std::cerr << "invalid --scanlines\n";
        return 2;
      }
    } else if (arg == "--log-file" && hasValue) {
      cfg.logFile = argv[++i];
    } else if (arg == "--raylib-log" && hasValue) {
      if (!isodistrict::ParseLogSeverity(argv[++i], cfg.raylibLogLevel)) {
        std::cerr << "invalid --raylib-log (expected trace|debug|info|warning|error|fatal|none)\n";
        return 2;
      }
    } else if (scenePath.empty() && !arg.empty() && arg[0] != '-') {
      scenePath = arg;
    } else {
      std::cerr << "unknown argument: " << arg << " (see --help)\n";
      return 2;
    }
  }

  if (!isodistrict::ValidateViewerConfig(cfg, err)) {
    std::cerr << "[config] " << err << "\n";
    return 2;
  }
  if (scenePath.empty()) {
    PrintHelp();
    return 2;
  }

  isodistrict::LogTee tee;
  if (!cfg.logFile.empty()) {
    isodistrict::LogTeeOptions lo;
    lo.path = cfg.logFile;
    if (!tee.start(lo, err)) std::cerr << "[log] " << err << " (continuing without a log file)\n";
  }

  int rc = 0;
  try {
    isodistrict::Scene scene;
    if (!isodistrict::LoadSceneFile(scenePath, scene, err)) {
      std::cerr << "[scene] " << err << "\n";
      rc = 1;
    } else {
      const isodistrict::SceneAdmissionReport report = isodistrict::AdmitScene(scene);
      std::cout << "[scene] " << scenePath << ": " << isodistrict::FormatAdmissionReport(report) << "\n";

      isodistrict::Viewer viewer(cfg, std::move(scene));
      viewer.run();
    }
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    rc = 1;
  } catch (...) {
    std::cerr << "Fatal error: unknown exception\n";
    rc = 1;
  }

  return rc;
}
