#pragma once

#include "sightline_rt/compositor/nng_compositor.hpp"
#include "sightline_rt/config/config.hpp"
#include "sightline_rt/routing/route_loop.hpp"

namespace sightline_rt {

// Consumer process: frames on stdin to compositor calls
class RouteApp {
  public:
    explicit RouteApp(int argc, char **argv);

    // Returns the process exit code
    int Launch();

    ~RouteApp();

  private:
    routing::Router makeRouter_();

    config::RouteConfig config_;
    compositor::NngCompositor compositor_;
};

} // namespace sightline_rt
