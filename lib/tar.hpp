#ifndef DOCKGATE_TAR_HPP
#define DOCKGATE_TAR_HPP

#include <string>

namespace Docker {
    // Packages every file below directory into an uncompressed tar, paths relative to it.
    // Entries are sorted so the same tree always yields the same bytes.
    std::string tarDirectory(const std::string& directory);
}

#endif // DOCKGATE_TAR_HPP
