#pragma once

namespace sightline_rt::threading::signals {

// Installs SIGINT/SIGTERM handlers that request a stop, without SA_RESTART so
// blocking reads and polls return EINTR. SIGPIPE is ignored so a closed
// reader shows up as EPIPE on write.
void Install();

bool StopRequested();

} // namespace sightline_rt::threading::signals
