#pragma once
#include <cstddef>
#include <string>

// RAII wrapper around a POSIX shared-memory mapping (shm_open + mmap).
// The creating side owns the name and unlinks it on destruction.
// Failures throw RenderError(BackendIo).
class SharedRegion {
public:
    SharedRegion() = default;
    ~SharedRegion();

    SharedRegion(SharedRegion&& other) noexcept;
    SharedRegion& operator=(SharedRegion&& other) noexcept;
    SharedRegion(const SharedRegion&) = delete;
    SharedRegion& operator=(const SharedRegion&) = delete;

    // Create (or replace a stale) segment of `bytes` zeroed bytes.
    static SharedRegion create(const std::string& name, size_t bytes);

    // Map an existing segment at its current size.
    static SharedRegion open(const std::string& name);

    void* data() const { return data_; }
    size_t size() const { return size_; }
    const std::string& name() const { return name_; }
    bool isOwner() const { return owner_; }
    bool isMapped() const { return data_ != nullptr; }

    // Unmap, and unlink when owner. Safe to call repeatedly.
    void close();

    // Names must start with '/' for shm_open; a missing slash is added.
    static std::string normalizeName(const std::string& name);

private:
    std::string name_;
    void*       data_  = nullptr;
    size_t      size_  = 0;
    bool        owner_ = false;
};
