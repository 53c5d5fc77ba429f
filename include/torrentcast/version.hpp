#pragma once

#define TORRENTCAST_VERSION_MAJOR 1
#define TORRENTCAST_VERSION_MINOR 0
#define TORRENTCAST_VERSION_PATCH 0
#define TORRENTCAST_VERSION_STRING "1.0.0"
