#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include "../core/SplitterErrors.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace GzSplit {

enum class StoreErrorKind {
    NotFound,
    PermissionDenied,
    Other
};

// Failure while inspecting or creating the destination container.
class StoreError : public SplitterError {
public:
    StoreError(StoreErrorKind kind, const std::string& message)
        : SplitterError(message), kind_(kind) {}

    StoreErrorKind kind() const { return kind_; }

private:
    StoreErrorKind kind_;
};

// Streaming writer for a single remote object. The object becomes visible
// only after close() returns. Throws UploadError on failure.
class IObjectSink {
public:
    virtual ~IObjectSink() = default;

    virtual void write(const std::byte* data, size_t size) = 0;

    // Blocks until the object is durable at its destination.
    virtual void close() = 0;

    // Gives up on the object. Must not throw.
    virtual void abort() noexcept = 0;

    virtual uint64_t bytesWritten() const = 0;
};

// Destination for produced objects (a bucket, a directory, ...)
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    // Makes sure the container exists, creating it only when it is
    // definitely missing. Any other failure is reported as StoreError.
    virtual void ensureContainer() = 0;

    virtual std::unique_ptr<IObjectSink> openSink(const std::string& objectName) = 0;

    // Human readable location of an object, used in logs and manifests
    virtual std::string describe(const std::string& objectName) const = 0;
};

} // namespace GzSplit

#endif // OBJECT_STORE_HPP
