#include "LocalObjectStore.hpp"
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace GzSplit {

namespace {
StoreErrorKind classify(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) {
        return StoreErrorKind::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return StoreErrorKind::PermissionDenied;
    }
    return StoreErrorKind::Other;
}
}

LocalObjectStore::LocalObjectStore(fs::path root)
    : root_(std::move(root))
{
    if (root_.empty()) {
        throw std::invalid_argument("LocalObjectStore root must not be empty");
    }
}

void LocalObjectStore::ensureContainer() {
    std::error_code ec;
    fs::file_status status = fs::status(root_, ec);
    if (!ec) {
        if (!fs::is_directory(status)) {
            throw StoreError(StoreErrorKind::Other, root_.string() + " exists but is not a directory");
        }
        return;
    }

    StoreErrorKind kind = classify(ec);
    if (kind != StoreErrorKind::NotFound) {
        throw StoreError(kind, "Cannot inspect destination " + root_.string() + ": " + ec.message());
    }

    std::cerr << "Warning: destination " << root_.string() << " not found, creating it" << std::endl;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StoreError(classify(ec), "Failed to create destination " + root_.string() + ": " + ec.message());
    }
}

fs::path LocalObjectStore::objectPath(const std::string& objectName) const {
    return root_ / objectName;
}

std::unique_ptr<IObjectSink> LocalObjectStore::openSink(const std::string& objectName) {
    if (objectName.empty() || objectName.find('/') != std::string::npos) {
        throw UploadError("Invalid object name: '" + objectName + "'");
    }
    return std::make_unique<LocalObjectSink>(objectPath(objectName));
}

std::string LocalObjectStore::describe(const std::string& objectName) const {
    return objectPath(objectName).string();
}

LocalObjectSink::LocalObjectSink(fs::path finalPath)
    : finalPath_(std::move(finalPath)),
      partialPath_(finalPath_.string() + ".partial"),
      out_(partialPath_, std::ios::binary | std::ios::trunc)
{
    if (!out_) {
        throw UploadError("Failed to open object for writing: " + partialPath_.string());
    }
}

LocalObjectSink::~LocalObjectSink() {
    if (!done_) {
        abort();
    }
}

void LocalObjectSink::write(const std::byte* data, size_t size) {
    if (done_) {
        throw UploadError("write on closed object " + finalPath_.string());
    }
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out_) {
        throw UploadError("Failed to write object data to " + partialPath_.string());
    }
    bytesWritten_ += size;
}

void LocalObjectSink::close() {
    if (done_) {
        return;
    }
    out_.flush();
    out_.close();
    if (out_.fail()) {
        abort();
        throw UploadError("Failed to flush object " + partialPath_.string());
    }

    std::error_code ec;
    fs::rename(partialPath_, finalPath_, ec);
    if (ec) {
        abort();
        throw UploadError("Failed to publish object " + finalPath_.string() + ": " + ec.message());
    }
    done_ = true;
}

void LocalObjectSink::abort() noexcept {
    if (done_) {
        return;
    }
    done_ = true;
    if (out_.is_open()) {
        out_.close();
    }
    std::error_code ec;
    fs::remove(partialPath_, ec);
    if (ec) {
        std::cerr << "Warning: could not remove partial object " << partialPath_.string()
                  << ": " << ec.message() << std::endl;
    }
}

} // namespace GzSplit
