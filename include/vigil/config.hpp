#pragma once

#ifndef VIGIL_HAS_SSE2
#if defined(__SSE2__)
#define VIGIL_HAS_SSE2 1
#else
#define VIGIL_HAS_SSE2 0
#endif
#endif

#define VIGIL_VERSION_MAJOR 1
#define VIGIL_VERSION_MINOR 0
#define VIGIL_VERSION_PATCH 0

namespace vigil {

/** Version string written into every checkpoint file. */
inline const char* version_string() { return "1.0.0"; }

/** Major version used for checkpoint compatibility checks. */
inline int version_major() { return VIGIL_VERSION_MAJOR; }

} // namespace vigil
