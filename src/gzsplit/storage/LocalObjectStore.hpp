#ifndef LOCAL_OBJECT_STORE_HPP
#define LOCAL_OBJECT_STORE_HPP

#include "ObjectStore.hpp"
#include <filesystem>
#include <fstream>

namespace GzSplit {

// Object store backed by a local (or mounted) directory. Each object is
// written as "<name>.partial" and renamed into place on close, so readers
// never observe a half-written object.
class LocalObjectStore : public IObjectStore {
public:
    explicit LocalObjectStore(std::filesystem::path root);

    void ensureContainer() override;
    std::unique_ptr<IObjectSink> openSink(const std::string& objectName) override;
    std::string describe(const std::string& objectName) const override;

    std::filesystem::path objectPath(const std::string& objectName) const;
    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

class LocalObjectSink : public IObjectSink {
public:
    explicit LocalObjectSink(std::filesystem::path finalPath);
    ~LocalObjectSink() override;

    void write(const std::byte* data, size_t size) override;
    void close() override;
    void abort() noexcept override;
    uint64_t bytesWritten() const override { return bytesWritten_; }

private:
    std::filesystem::path finalPath_;
    std::filesystem::path partialPath_;
    std::ofstream out_;
    uint64_t bytesWritten_ = 0;
    bool done_ = false;
};

} // namespace GzSplit

#endif // LOCAL_OBJECT_STORE_HPP
