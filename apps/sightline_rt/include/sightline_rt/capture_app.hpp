#pragma once

#include "sightline_rt/config/config.hpp"
#include "sightline_rt/producers/capture_loop.hpp"

namespace sightline_rt {

// Producer process: host input to frames on stdout
class CaptureApp {
  public:
    explicit CaptureApp(int argc, char **argv);

    // Returns the process exit code
    int Launch();

    ~CaptureApp();

  private:
    producers::Producer makeProducer_() const;

    config::CaptureConfig config_;
};

} // namespace sightline_rt
