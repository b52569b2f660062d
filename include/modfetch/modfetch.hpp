#ifndef MODFETCH_VERSION_HPP
#define MODFETCH_VERSION_HPP

// Project version
#define MODFETCH_VERSION_MAJOR 0
#define MODFETCH_VERSION_MINOR 3
#define MODFETCH_VERSION_PATCH 0

#define MODFETCH_VERSION_STRING "0.3.0"

#endif
