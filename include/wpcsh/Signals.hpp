#pragma once

#include <spawn.h>

namespace wpcsh {

// Interactive shell: SIGINT only raises a flag (no SA_RESTART, so a blocked
// read returns), SIGQUIT is ignored.
void setShellSignals();

// Forked builtin stages get default dispositions back.
void setChildSignals();

// Spawned programs start with default SIGINT/SIGQUIT handling.
int setSpawnSignals(posix_spawnattr_t& attr);

bool interruptPending() noexcept;
void clearInterrupt() noexcept;

} // namespace wpcsh
