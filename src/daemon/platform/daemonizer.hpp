#pragma once

namespace platform {

// Double-fork into the background and redirect stdio to /dev/null.
void daemonize();

} // namespace platform
