#pragma once

// Overridden by the build system through target compile definitions

#ifndef SNIPVAULT_VERSION_MAJOR
#define SNIPVAULT_VERSION_MAJOR 0
#endif

#ifndef SNIPVAULT_VERSION_MINOR
#define SNIPVAULT_VERSION_MINOR 1
#endif

#ifndef SNIPVAULT_VERSION_PATCH
#define SNIPVAULT_VERSION_PATCH 0
#endif

#ifndef SNIPVAULT_VERSION_STRING
#define SNIPVAULT_VERSION_STRING "0.1.0"
#endif
