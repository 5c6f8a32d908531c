//===----------------------------------------------------------------------===//
//                         PeerSync
//
// version.hpp
//
// Build identification; CMake supplies the real values
//===----------------------------------------------------------------------===//

#pragma once

#ifndef PEERSYNC_VERSION
#define PEERSYNC_VERSION "0.1.0"
#endif

#ifndef PEERSYNC_GIT_COMMIT
#define PEERSYNC_GIT_COMMIT "unknown"
#endif

#ifndef PEERSYNC_BUILD_TYPE
#define PEERSYNC_BUILD_TYPE "unknown"
#endif

#define PEERSYNC_BUILD_TIME __DATE__ " " __TIME__
