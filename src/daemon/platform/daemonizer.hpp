#pragma once

namespace platform {

// Detach from the terminal (double fork, setsid, stdio to /dev/null).
void daemonize();

} // namespace platform
