#pragma once

// AF_UNIX stream socket helpers.

#include <string>
#include <core/types.hpp>

namespace platform {

// Connect a stream socket to a filesystem AF_UNIX path.
// Returns the fd, or -1 with errno set (ENOENT, ECONNREFUSED, ...).
int connect_unix(const std::string& path);

// Write the whole buffer, retrying on EINTR and short writes.
bool write_all(int fd, const std::string& data);

// Read up to and excluding the first '\n'. Stops at EOF; errors if nothing
// at all was read, on an I/O error, or after max_bytes without a newline.
Result<std::string> read_line(int fd, size_t max_bytes);

// Close a socket.
void close_socket(int fd);

} // namespace platform
