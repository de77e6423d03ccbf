#include "process/Launcher.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

using namespace ppt::log;

namespace ppt::process {

namespace {

std::vector<std::string> mergedEnvironment(const Environment& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view entry(*e);
        const auto key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& [k, v] : overrides)
            if (k == key) { overridden = true; break; }
        if (!overridden) out.emplace_back(entry);
    }
    for (const auto& [k, v] : overrides) out.push_back(k + "=" + v);
    return out;
}

std::vector<char*> pointers(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void closeFd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

}

std::string describe(const Command& cmd) {
    std::string out;
    for (const auto& a : cmd.argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

Result PosixLauncher::run(const Command& cmd) {
    if (cmd.argv.empty()) throw LaunchError("Empty command line");

    // Everything the child touches is built before fork().
    std::vector<std::string> argStore = cmd.argv;
    auto argv = pointers(argStore);
    auto envStore = mergedEnvironment(cmd.env);
    auto envp = pointers(envStore);
    const std::string cwd = cmd.cwd.string();

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};   // reports a failed exec, closed on success by O_CLOEXEC

    if (cmd.captureOutput && ::pipe(outPipe) == -1)
        throw LaunchError(fmt::format("Failed to create output pipe: {}", std::strerror(errno)));
    if (::pipe2(errPipe, O_CLOEXEC) == -1) {
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw LaunchError(fmt::format("Failed to create exec status pipe: {}", std::strerror(errno)));
    }

    Registry::runner()->debug("[PosixLauncher] exec: {}{}", describe(cmd),
                              cwd.empty() ? "" : fmt::format(" (in {})", cwd));

    const pid_t pid = ::fork();
    if (pid < 0) {
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        throw LaunchError(fmt::format("Failed to fork for '{}': {}", cmd.argv.front(), std::strerror(errno)));
    }

    if (pid == 0) {
        ::close(errPipe[0]);
        if (cmd.captureOutput) {
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(outPipe[1], STDERR_FILENO);
            ::close(outPipe[0]);
            ::close(outPipe[1]);
        }

        int err = 0;
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            err = errno;
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            err = errno;
        }
        [[maybe_unused]] const auto n = ::write(errPipe[1], &err, sizeof(err));
        _exit(127); // exec failed
    }

    closeFd(errPipe[1]);
    closeFd(outPipe[1]);

    Result result;
    if (cmd.captureOutput) {
        char buf[4096];
        ssize_t n;
        while ((n = ::read(outPipe[0], buf, sizeof(buf))) > 0 || (n < 0 && errno == EINTR))
            if (n > 0) result.output.append(buf, static_cast<size_t>(n));
        closeFd(outPipe[0]);
    }

    int childErr = 0;
    ssize_t got;
    do {
        got = ::read(errPipe[0], &childErr, sizeof(childErr));
    } while (got < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (got == static_cast<ssize_t>(sizeof(childErr)))
        throw LaunchError(fmt::format("Failed to start '{}': {}", cmd.argv.front(), std::strerror(childErr)));

    if (WIFEXITED(status)) result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exitCode = 128 + WTERMSIG(status);

    Registry::runner()->debug("[PosixLauncher] '{}' exited with {}", cmd.argv.front(), result.exitCode);
    return result;
}

}
