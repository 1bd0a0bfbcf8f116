#include "CommandObjectStore.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace GzSplit {

namespace {
const char* const kObjectPlaceholder = "{object}";

std::string substitute(std::string tmpl, const std::string& value) {
    const std::string placeholder = kObjectPlaceholder;
    size_t pos = 0;
    while ((pos = tmpl.find(placeholder, pos)) != std::string::npos) {
        tmpl.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
    return tmpl;
}

int decodeStatus(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Blocks SIGPIPE in the calling thread so that writing to a command that
// has exited fails with EPIPE. A SIGPIPE raised meanwhile is consumed
// before the previous mask is restored.
class SigpipeBlocker {
public:
    SigpipeBlocker() {
        sigemptyset(&set_);
        sigaddset(&set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        wasPending_ = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        blocked_ = ::pthread_sigmask(SIG_BLOCK, &set_, &previous_) == 0;
    }

    ~SigpipeBlocker() {
        if (!blocked_) {
            return;
        }
        if (!wasPending_) {
            sigset_t pending;
            sigemptyset(&pending);
            if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                const struct timespec zero = {0, 0};
                while (::sigtimedwait(&set_, nullptr, &zero) == -1 && errno == EINTR) {
                }
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    SigpipeBlocker(const SigpipeBlocker&) = delete;
    SigpipeBlocker& operator=(const SigpipeBlocker&) = delete;

private:
    sigset_t set_;
    sigset_t previous_;
    bool wasPending_ = false;
    bool blocked_ = false;
};

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}
}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandResult runCommand(const std::string& command) {
    CommandResult result;
    FILE* pipe = ::popen((command + " 2>&1").c_str(), "r");
    if (!pipe) {
        throw StoreError(StoreErrorKind::Other, "Failed to start command: " + command + ": " + std::strerror(errno));
    }
    std::array<char, 4096> buffer;
    size_t n;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }
    result.exitCode = decodeStatus(::pclose(pipe));
    return result;
}

StoreErrorKind classifyCheckFailure(const std::string& output) {
    if (containsIgnoreCase(output, "NotFound") || containsIgnoreCase(output, "404") ||
        containsIgnoreCase(output, "does not exist") || containsIgnoreCase(output, "No such")) {
        return StoreErrorKind::NotFound;
    }
    if (containsIgnoreCase(output, "AccessDenied") || containsIgnoreCase(output, "403") ||
        containsIgnoreCase(output, "Permission")) {
        return StoreErrorKind::PermissionDenied;
    }
    return StoreErrorKind::Other;
}

CommandObjectStore::CommandObjectStore(CommandStoreConfig config)
    : config_(std::move(config))
{
    if (config_.uploadTemplate.find(kObjectPlaceholder) == std::string::npos) {
        throw std::invalid_argument("Upload command template must contain {object}");
    }
}

void CommandObjectStore::ensureContainer() {
    if (config_.checkTemplate.empty()) {
        return;
    }

    CommandResult check = runCommand(config_.checkTemplate);
    if (check.exitCode == 0) {
        return;
    }

    StoreErrorKind kind = classifyCheckFailure(check.output);
    if (kind != StoreErrorKind::NotFound) {
        throw StoreError(kind, "Destination check failed (exit " + std::to_string(check.exitCode) +
                               "): " + check.output);
    }
    if (config_.createTemplate.empty()) {
        throw StoreError(StoreErrorKind::NotFound, "Destination does not exist and no create command is configured");
    }

    std::cerr << "Warning: destination not found, running: " << config_.createTemplate << std::endl;
    CommandResult create = runCommand(config_.createTemplate);
    if (create.exitCode != 0) {
        throw StoreError(classifyCheckFailure(create.output),
                         "Failed to create destination (exit " + std::to_string(create.exitCode) +
                         "): " + create.output);
    }
}

std::string CommandObjectStore::uploadCommandFor(const std::string& objectName) const {
    return substitute(config_.uploadTemplate, shellQuote(objectName));
}

std::unique_ptr<IObjectSink> CommandObjectStore::openSink(const std::string& objectName) {
    return std::make_unique<CommandObjectSink>(uploadCommandFor(objectName), objectName);
}

std::string CommandObjectStore::describe(const std::string& objectName) const {
    return objectName + " via `" + uploadCommandFor(objectName) + "`";
}

CommandObjectSink::CommandObjectSink(std::string command, std::string objectName)
    : command_(std::move(command)), objectName_(std::move(objectName))
{
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw UploadError("Failed to create pipe for " + objectName_ + ": " + std::strerror(errno));
    }

    // Only async-signal-safe calls are allowed between fork and exec
    std::string shell = "/bin/sh";
    std::string flag = "-c";
    std::vector<char*> argv = {&shell[0], &flag[0], &command_[0], nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw UploadError("Failed to start upload command for " + objectName_ + ": " + std::strerror(err));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        if (::dup2(fds[0], STDIN_FILENO) < 0) {
            ::_exit(127);
        }
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    // Also set from the parent so abort() never races the child's setpgid
    ::setpgid(pid, pid);
    ::close(fds[0]);
    pid_ = pid;
    fd_ = fds[1];
}

CommandObjectSink::~CommandObjectSink() {
    abort();
}

int CommandObjectSink::waitForCommand() noexcept {
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);
    pid_ = -1;
    return result < 0 ? -1 : decodeStatus(status);
}

void CommandObjectSink::write(const std::byte* data, size_t size) {
    if (fd_ < 0) {
        throw UploadError("write on closed upload of " + objectName_);
    }
    SigpipeBlocker blocker;
    size_t offset = 0;
    while (offset < size) {
        ssize_t n = ::write(fd_, data + offset, size - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            throw UploadError("Upload command for " + objectName_ + " stopped accepting data: " + std::strerror(err));
        }
        offset += static_cast<size_t>(n);
    }
    bytesWritten_ += size;
}

void CommandObjectSink::close() {
    if (pid_ < 0) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
    int exitCode = waitForCommand();
    if (exitCode != 0) {
        throw UploadError("Upload command for " + objectName_ + " exited with status " + std::to_string(exitCode));
    }
}

void CommandObjectSink::abort() noexcept {
    if (pid_ < 0) {
        return;
    }
    // Kill before closing stdin: end-of-file would let the command commit a
    // truncated object.
    ::kill(-pid_, SIGKILL);
    ::close(fd_);
    fd_ = -1;
    int exitCode = waitForCommand();
    std::cerr << "Warning: abandoned upload of " << objectName_
              << " (command exit status " << exitCode << ")" << std::endl;
}

} // namespace GzSplit
