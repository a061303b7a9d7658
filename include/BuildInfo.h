#pragma once

// Build metadata stamped in at compile time.  The CLI prints both at startup so
// a long unattended run log says exactly which binary produced it.
#ifndef PATCHPROBE_GIT
#define PATCHPROBE_GIT "nogit"
#endif
#ifndef PATCHPROBE_BUILT
#define PATCHPROBE_BUILT "unknown"
#endif
