#ifndef FSMCPS_PLATFORM_ABI_HPP
#define FSMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstdint>
#include <string>

namespace platform {

// Metadata of a path, following symlinks.
struct PathStatus {
    bool exists = false;
    bool is_directory = false;
    bool is_regular_file = false;
    std::uintmax_t size_bytes = 0;
    std::int64_t modified_seconds = 0;
    long modified_nanoseconds = 0;
    // Set when the lookup failed for a reason other than the path being absent
    // (e.g. permission denied on a parent directory). exists is false then.
    std::string error_message;
};

// stat() the path. A missing path, a dangling symlink or a path running
// through a regular file all report exists == false with no error_message.
PathStatus stat_path(const std::string &path);

// Read the entire contents of a file, byte for byte.
// Returns true on success; on failure error_message describes the OS error.
bool read_file_contents(const std::string &file_path, std::string &output_contents,
                        std::string &error_message);

// Create or truncate the file and write contents to it.
bool write_file_contents(const std::string &file_path, const std::string &contents,
                         std::string &error_message);

// "<strerror(error_number)>: <path>".
std::string describe_os_error(int error_number, const std::string &path);

} // namespace platform

#endif // FSMCPS_PLATFORM_ABI_HPP
