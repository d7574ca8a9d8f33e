#include "platform/platform_abi.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace platform {

std::string describe_os_error(int error_number, const std::string &path) {
    return std::string(strerror(error_number)) + ": " + path;
}

PathStatus stat_path(const std::string &path) {
    PathStatus status;

    struct stat file_status;
    if (stat(path.c_str(), &file_status) != 0) {
        int error_number = errno;
        // These mean the path is absent, not that the lookup failed.
        if (error_number != ENOENT && error_number != ENOTDIR && error_number != ELOOP &&
            error_number != EBADF) {
            status.error_message = describe_os_error(error_number, path);
        }
        return status;
    }

    status.exists = true;
    status.is_directory = S_ISDIR(file_status.st_mode);
    status.is_regular_file = S_ISREG(file_status.st_mode);
    status.size_bytes = static_cast<std::uintmax_t>(file_status.st_size);
    status.modified_seconds = static_cast<std::int64_t>(file_status.st_mtim.tv_sec);
    status.modified_nanoseconds = static_cast<long>(file_status.st_mtim.tv_nsec);
    return status;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents,
                        std::string &error_message) {
    int descriptor = open(file_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (descriptor < 0) {
        error_message = describe_os_error(errno, file_path);
        return false;
    }

    std::string contents;
    char buffer[65536];
    while (true) {
        ssize_t bytes_read = read(descriptor, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            contents.append(buffer, static_cast<size_t>(bytes_read));
            continue;
        }
        if (bytes_read == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        error_message = describe_os_error(errno, file_path);
        close(descriptor);
        return false;
    }

    close(descriptor);
    output_contents = std::move(contents);
    return true;
}

bool write_file_contents(const std::string &file_path, const std::string &contents,
                         std::string &error_message) {
    int descriptor = open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (descriptor < 0) {
        error_message = describe_os_error(errno, file_path);
        return false;
    }

    const char *pointer = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t bytes_written = write(descriptor, pointer, remaining);
        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_message = describe_os_error(errno, file_path);
            close(descriptor);
            return false;
        }
        pointer += bytes_written;
        remaining -= static_cast<size_t>(bytes_written);
    }

    // close() is where NFS and full disks report deferred write errors.
    if (close(descriptor) != 0) {
        error_message = describe_os_error(errno, file_path);
        return false;
    }
    return true;
}

} // namespace platform
