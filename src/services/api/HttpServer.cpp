#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "core/errors/Error.hpp"
#include "services/AppContext.hpp"

using nlohmann::json;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true);
}

} // namespace

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled for now
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content(R"({"error":{"code":"UNAUTHORIZED","message":"unauthorized"}})", "application/json");
  return false;
}

static void send_error(httplib::Response& res, const vindex::Error& e) {
  json body = {{"error", {{"code", vindex::code_name(e.code())}, {"message", e.what()}}}};
  if (!e.detail().empty()) body["error"]["detail"] = e.detail();
  res.status = vindex::http_status(e.code());
  res.set_content(body.dump(), "application/json");
}

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

// Runs fn and maps failures to the JSON error envelope.
template <class F>
static void guarded(const httplib::Request& req, httplib::Response& res, F&& fn) {
  try {
    fn();
  } catch (const vindex::Error& e) {
    if (vindex::http_status(e.code()) >= 500) {
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
    }
    send_error(res, e);
  } catch (const std::exception& e) {
    spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
    send_json(res, 500, {{"error", {{"code", "INTERNAL"}, {"message", "Internal server error"}}}});
  }
}

static json image_info(const vindex::ItemRecord& r) {
  json j = {
    {"project_id",        r.project_id},
    {"id",                r.item_id},
    {"blob_key",          r.blob_key},
    {"content_type",      r.content_type},
    {"size_bytes",        r.size_bytes},
    {"original_filename", nullptr}
  };
  if (r.original_filename) j["original_filename"] = *r.original_filename;
  return j;
}

// -------- server --------

namespace vindex {

void run_http_server(AppContext& ctx, int port, const std::string& apiKey) {
  httplib::Server svr;
  svr.set_payload_max_length(ctx.config().maxUploadBytes + 64 * 1024);

  // Health check
  svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, {{"status", "ok"}});
  });

  svr.Get("/readyz", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const auto s = ctx.store().stats();
      send_json(res, 200, {
        {"server_ready", true},
        {"image_search_ready", true},
        {"embedder", ctx.embedder().name()},
        {"backup_running", ctx.backupRunning()},
        {"store", {
          {"projects", s.projects},
          {"items", s.items},
          {"indexed", s.indexed},
          {"dimension", s.dimension},
          {"capacity", s.capacity}
        }}
      });
    });
  });

  // POST /v1/projects/{project}/images   multipart field "file"
  svr.Post(R"(/v1/projects/([^/]+)/images)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded(req, res, [&] {
      if (!req.has_file("file")) {
        throw Error(ErrorCode::InvalidArgument, "multipart field 'file' is required");
      }
      const auto file = req.get_file_value("file");
      std::optional<std::string> filename;
      if (!file.filename.empty()) filename = file.filename;
      auto rec = ctx.images().registerImage(req.matches[1], file.content, file.content_type, filename);
      send_json(res, 200, image_info(rec));
    });
  });

  svr.Get(R"(/v1/projects/([^/]+)/images)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded(req, res, [&] {
      json images = json::array();
      for (const auto& r : ctx.images().listImages(req.matches[1])) images.push_back(image_info(r));
      send_json(res, 200, {{"images", images}});
    });
  });

  // Body: {"query": "...", "limit": 5}
  svr.Post(R"(/v1/projects/([^/]+)/images/search)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded(req, res, [&] {
      json j;
      try { j = json::parse(req.body); }
      catch (const json::exception&) { throw Error(ErrorCode::InvalidArgument, "invalid JSON body"); }
      if (!j.is_object() || !j.contains("query") || !j["query"].is_string()) {
        throw Error(ErrorCode::InvalidArgument, "query is required");
      }
      int limit = 5;
      if (j.contains("limit")) {
        if (!j["limit"].is_number_integer()) throw Error(ErrorCode::InvalidArgument, "limit must be an integer");
        limit = j["limit"].get<int>();
      }

      json results = json::array();
      for (const auto& hit : ctx.images().searchImages(req.matches[1], j["query"].get<std::string>(), limit)) {
        json r = image_info(hit.record);
        r["score"] = hit.score;
        results.push_back(std::move(r));
      }
      send_json(res, 200, {{"results", results}});
    });
  });

  svr.Get(R"(/v1/projects/([^/]+)/images/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded(req, res, [&] {
      send_json(res, 200, image_info(ctx.images().getImage(req.matches[1], req.matches[2])));
    });
  });

  svr.Get(R"(/v1/projects/([^/]+)/images/([^/]+)/file)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded(req, res, [&] {
      res.set_redirect(ctx.images().imageUrl(req.matches[1], req.matches[2]), 307);
    });
  });

  svr.Delete(R"(/v1/projects/([^/]+)/images/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    guarded(req, res, [&] {
      ctx.images().deleteImage(req.matches[1], req.matches[2]);
      res.status = 204;
    });
  });

  // Target of presigned URLs; the expiry stands in for the signature.
  svr.Get(R"(/v1/blobs/(.+))", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const std::string expires = req.has_param("expires") ? req.get_param_value("expires") : "";
      int64_t at = 0;
      try { at = std::stoll(expires); } catch (const std::exception&) { at = 0; }
      if (at < static_cast<int64_t>(std::time(nullptr))) {
        send_json(res, 403, {{"error", {{"code", "URL_EXPIRED"}, {"message", "link expired"}}}});
        return;
      }
      const std::string key = req.matches[1];
      res.set_content(ctx.blobs().get(key), "application/octet-stream");
      res.status = 200;
    });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) {
      res.set_content(R"({"error":{"code":"NOT_FOUND","message":"not found"}})", "application/json");
    }
  });

  // Signal handler only flips a flag; this thread turns it into svr.stop().
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  std::atomic<bool> done{false};
  std::thread watcher([&] {
    while (!done.load()) {
      if (g_shutdown_requested.load()) {
        spdlog::info("shutdown requested");
        svr.stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    if (!g_shutdown_requested.load()) spdlog::error("Failed to bind port {}", port);
  }
  done.store(true);
  watcher.join();
}

} // namespace vindex
