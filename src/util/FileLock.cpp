#include "util/FileLock.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace hs::util;

FileLock::FileLock(std::filesystem::path p) : path_(std::move(p)) {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    const int fd = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0)
        throw std::runtime_error("FileLock: open failed for " + path_.string() + ": " + std::strerror(errno));

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) return;
        throw std::runtime_error("FileLock: flock failed for " + path_.string() + ": " + std::strerror(err));
    }

    fd_ = fd;
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}
