// src/main.cpp
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/store/ItemStore.hpp"
#include "services/AppContext.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --serve       # start HTTP server (VINDEX_PORT or 8080)\n"
            << "  " << argv0 << " --backup      # upload one snapshot and exit\n"
            << "  " << argv0 << " --stats       # print store counts and exit\n";
}

static void configure_logging(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
  spdlog::set_level(lvl);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const std::string cmd = argc > 1 ? argv[1] : "";
    if (cmd != "--serve" && cmd != "--backup" && cmd != "--stats") {
      print_usage(argv[0]);
      return 1;
    }

    const vindex::Config cfg = vindex::Config::fromEnv();
    configure_logging(cfg.logLevel);

    if (cmd == "--backup" && !cfg.backupEnabled) {
      std::cerr << "backup is disabled (set VINDEX_BACKUP_ENABLED=1)\n";
      return 1;
    }

    vindex::AppContext ctx(cfg);

    if (cmd == "--serve") {
      vindex::run_http_server(ctx, cfg.port, cfg.apiKey);
    } else if (cmd == "--backup") {
      ctx.snapshots()->backup(ctx.store());
    } else {
      const auto s = ctx.store().stats();
      std::cout << "projects:  " << s.projects << "\n"
                << "items:     " << s.items << "\n"
                << "indexed:   " << s.indexed << "\n"
                << "dimension: " << s.dimension << "\n"
                << "capacity:  " << s.capacity << "\n";
    }

    // Final snapshot (when enabled) happens here.
    ctx.shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
