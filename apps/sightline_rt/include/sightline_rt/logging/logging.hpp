#pragma once

#include <string>
#include <string_view>

namespace sightline_rt::logging {

// Installs a colored stderr logger named `name` as the default logger.
// stdout is left alone since producers write frames there.
void Init(const std::string &name, std::string_view level);

} // namespace sightline_rt::logging
