#pragma once

namespace poz::util {

// Install the stderr logger used by every module.
// verbosity 0 logs warnings and errors, 1 adds info, 2 or more adds debug.
void setupLogging(int verbosity);

} // namespace poz::util
