#include "cbor_inspector/file_io.hpp"

#include "cbor_inspector/exceptions.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>

namespace cbi {

namespace {

constexpr const size_t READ_CHUNK_SIZE = 64 * 1024;

// Closes the wrapped descriptor when it goes out of scope
class fd_closer {
public:
    explicit fd_closer(int fd) : _fd(fd) {}
    ~fd_closer() { close(_fd); }

    NON_COPYABLE(fd_closer);

private:
    int _fd;
};

}  // namespace

byte_vector read_all_from_fd(int fd) {
    byte_vector data;
    std::array<uint8_t, READ_CHUNK_SIZE> chunk;

    while (true) {
        ssize_t result = read(fd, chunk.data(), chunk.size());

        if (result == 0) {
            break;
        }

        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }

            throw_errno_exception("Failed to read input");
        }

        data.insert(data.end(), chunk.begin(), chunk.begin() + result);
    }

    return data;
}

byte_vector read_file(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd == -1) {
        throw_errno_exception("Failed to open " + path);
    }

    fd_closer closer(fd);
    return read_all_from_fd(fd);
}

}  // namespace cbi
