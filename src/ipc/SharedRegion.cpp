#include "ipc/SharedRegion.hpp"
#include "render/RenderError.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace {

[[noreturn]] void throwIo(const std::string& what, const std::string& name) {
    throw RenderError(RenderError::Kind::BackendIo,
                      what + " '" + name + "': " + std::strerror(errno));
}

// Closes the descriptor once the mapping exists (or on failure)
struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
};

} // namespace

SharedRegion::~SharedRegion() {
    close();
}

SharedRegion::SharedRegion(SharedRegion&& other) noexcept
    : name_(std::move(other.name_)),
      data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      owner_(std::exchange(other.owner_, false)) {}

SharedRegion& SharedRegion::operator=(SharedRegion&& other) noexcept {
    if (this != &other) {
        close();
        name_  = std::move(other.name_);
        data_  = std::exchange(other.data_, nullptr);
        size_  = std::exchange(other.size_, 0);
        owner_ = std::exchange(other.owner_, false);
    }
    return *this;
}

std::string SharedRegion::normalizeName(const std::string& name) {
    if (!name.empty() && name[0] == '/') return name;
    return "/" + name;
}

SharedRegion SharedRegion::create(const std::string& rawName, size_t bytes) {
    std::string name = normalizeName(rawName);

    int fd = ::shm_open(name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0600);
    if (fd < 0 && errno == EEXIST) {
        // Left behind by a crashed writer
        spdlog::warn("Replacing stale shared-memory segment {}", name);
        ::shm_unlink(name.c_str());
        fd = ::shm_open(name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0600);
    }
    if (fd < 0) throwIo("shm_open failed for", name);
    FdGuard guard{fd};

    if (::ftruncate(fd, static_cast<off_t>(bytes)) != 0) {
        int err = errno;
        ::shm_unlink(name.c_str());
        errno = err;
        throwIo("ftruncate failed for", name);
    }

    void* p = ::mmap(nullptr, bytes, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (p == MAP_FAILED) {
        int err = errno;
        ::shm_unlink(name.c_str());
        errno = err;
        throwIo("mmap failed for", name);
    }

    SharedRegion region;
    region.name_  = name;
    region.data_  = p;
    region.size_  = bytes;
    region.owner_ = true;
    spdlog::debug("Created shared segment {} ({} bytes)", name, bytes);
    return region;
}

SharedRegion SharedRegion::open(const std::string& rawName) {
    std::string name = normalizeName(rawName);

    int fd = ::shm_open(name.c_str(), O_RDWR, 0);
    if (fd < 0) throwIo("shm_open failed for", name);
    FdGuard guard{fd};

    struct stat st{};
    if (::fstat(fd, &st) != 0) throwIo("fstat failed for", name);
    if (st.st_size <= 0)
        throw RenderError(RenderError::Kind::BackendIo,
                          "shared segment '" + name + "' is empty");

    size_t bytes = static_cast<size_t>(st.st_size);
    void* p = ::mmap(nullptr, bytes, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (p == MAP_FAILED) throwIo("mmap failed for", name);

    SharedRegion region;
    region.name_  = name;
    region.data_  = p;
    region.size_  = bytes;
    region.owner_ = false;
    return region;
}

void SharedRegion::close() {
    if (data_) {
        if (::munmap(data_, size_) != 0)
            spdlog::warn("munmap failed for {}: {}", name_, std::strerror(errno));
        data_ = nullptr;
        size_ = 0;
    }
    if (owner_) {
        if (::shm_unlink(name_.c_str()) != 0 && errno != ENOENT)
            spdlog::warn("shm_unlink failed for {}: {}", name_, std::strerror(errno));
        owner_ = false;
    }
}
