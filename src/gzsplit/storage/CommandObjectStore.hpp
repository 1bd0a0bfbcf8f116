#ifndef COMMAND_OBJECT_STORE_HPP
#define COMMAND_OBJECT_STORE_HPP

#include "ObjectStore.hpp"
#include <string>
#include <sys/types.h>

namespace GzSplit {

// Command templates for an out-of-process store such as gsutil.
// "{object}" is replaced by the shell-quoted object name.
struct CommandStoreConfig {
    std::string uploadTemplate;   // reads the object body on stdin, e.g. "gsutil -q cp - gs://b/{object}"
    std::string checkTemplate;    // exits 0 if the container exists, e.g. "gsutil ls -b gs://b"
    std::string createTemplate;   // creates the container, e.g. "gsutil mb gs://b"
};

// Output and exit status of a finished command
struct CommandResult {
    int exitCode = -1;
    std::string output; // stdout and stderr combined
};

CommandResult runCommand(const std::string& command);

// Quotes a value for safe use as a single POSIX shell word
std::string shellQuote(const std::string& value);

// Maps the output of a failed existence check to an error kind
StoreErrorKind classifyCheckFailure(const std::string& output);

// Object store that pipes each object into an external upload command.
// The command runs under /bin/sh in its own process group; end-of-file on
// its stdin means the object is complete.
class CommandObjectStore : public IObjectStore {
public:
    explicit CommandObjectStore(CommandStoreConfig config);

    void ensureContainer() override;
    std::unique_ptr<IObjectSink> openSink(const std::string& objectName) override;
    std::string describe(const std::string& objectName) const override;

    std::string uploadCommandFor(const std::string& objectName) const;

private:
    CommandStoreConfig config_;
};

class CommandObjectSink : public IObjectSink {
public:
    CommandObjectSink(std::string command, std::string objectName);
    ~CommandObjectSink() override;

    void write(const std::byte* data, size_t size) override;
    void close() override;
    void abort() noexcept override;
    uint64_t bytesWritten() const override { return bytesWritten_; }

private:
    int waitForCommand() noexcept;

    std::string command_;
    std::string objectName_;
    pid_t pid_ = -1;
    int fd_ = -1;  // write end of the command's stdin
    uint64_t bytesWritten_ = 0;
};

} // namespace GzSplit

#endif // COMMAND_OBJECT_STORE_HPP
