#pragma once
#include <string>

namespace vindex {
  class AppContext;

  // Start a blocking HTTP server for the image search API. Returns after
  // SIGINT/SIGTERM once in-flight requests are done.
  // apiKey: if empty, auth is disabled (useful for early integration).
  void run_http_server(AppContext& ctx, int port, const std::string& apiKey);
}
