#pragma once

#include <filesystem>

namespace hs::util {

// Advisory, non-blocking flock(2) held for the lifetime of the object.
class FileLock {
public:
    explicit FileLock(std::filesystem::path p);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // False when another process (or another FileLock in this one) holds it.
    [[nodiscard]] bool acquired() const noexcept { return fd_ >= 0; }

private:
    std::filesystem::path path_;
    int fd_{-1};
};

}
