#include "bootstrap/Environment.hpp"
#include "http/Transport.hpp"
#include "log/Registry.hpp"
#include "process/Launcher.hpp"
#include "types/errors.hpp"
#include "util/url.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fmt/format.h>
#include <sys/utsname.h>

using namespace ppt::log;

namespace ppt::bootstrap {

Environment::Environment(std::shared_ptr<process::Launcher> launcher,
                         config::RuntimeConfig runtime,
                         Downloader downloader)
    : launcher_(std::move(launcher)), runtime_(std::move(runtime)), downloader_(std::move(downloader)) {
    if (!launcher_) throw std::invalid_argument("Environment requires a process launcher");
    if (!downloader_) downloader_ = http::download;
}

std::optional<std::string> Environment::probeVersion(const std::string& program) const {
    try {
        const auto res = launcher_->run({{program, "--version"}, {}, {}, true});
        if (!res.ok()) return std::nullopt;
        auto out = res.output;
        util::trimInPlace(out);
        if (out.empty()) return std::nullopt;
        return out.substr(0, out.find('\n'));
    } catch (const process::LaunchError&) {
        return std::nullopt;
    }
}

int Environment::runStep(const std::vector<std::string>& argv, const fs::path& cwd) const {
    Registry::bootstrap()->info("[Environment] $ {}", process::describe({argv}));
    try {
        return launcher_->run({argv, cwd, {}, false}).exitCode;
    } catch (const process::LaunchError& e) {
        throw BootstrapError(e.what());
    }
}

std::string Environment::nodeDistributionName(const std::string& version,
                                               const std::string& sysname,
                                               const std::string& machine) {
    std::string os;
    if (sysname == "Linux") os = "linux";
    else if (sysname == "Darwin") os = "darwin";
    else throw BootstrapError("No Node.js distribution for operating system " + sysname);

    std::string arch;
    if (machine == "x86_64" || machine == "amd64") arch = "x64";
    else if (machine == "aarch64" || machine == "arm64") arch = "arm64";
    else if (machine == "armv7l") arch = "armv7l";
    else if (machine == "ppc64le" || machine == "s390x") arch = machine;
    else throw BootstrapError("No Node.js distribution for architecture " + machine);

    const auto v = version.starts_with('v') ? version : "v" + version;
    return fmt::format("node-{}-{}-{}", v, os, arch);
}

bool Environment::looksLikeCommitSha(const std::string& ref) {
    if (ref.size() < 7 || ref.size() > 40) return false;
    return std::ranges::all_of(ref, [](const unsigned char c) { return std::isxdigit(c) != 0; });
}

void Environment::installRuntime() {
    utsname host{};
    if (::uname(&host) != 0) throw BootstrapError("uname() failed, cannot select a Node.js build");

    const auto dist = nodeDistributionName(runtime_.node_version, host.sysname, host.machine);
    const auto version = runtime_.node_version.starts_with('v') ? runtime_.node_version : "v" + runtime_.node_version;
    const std::string ext = std::string(host.sysname) == "Linux" ? ".tar.xz" : ".tar.gz";
    const auto url = fmt::format("https://nodejs.org/dist/{}/{}{}", version, dist, ext);

    const auto installDir = fs::absolute(runtime_.install_dir);
    fs::create_directories(installDir);
    const auto archive = installDir / (dist + ext);

    Registry::bootstrap()->info("[Environment] Installing Node.js {} from {}", version, url);
    try {
        downloader_(url, archive);
    } catch (const std::exception& e) {
        throw BootstrapError(fmt::format("Node.js download failed: {}", e.what()));
    }

    if (const int rc = runStep({"tar", "-xf", archive.string(), "-C", installDir.string()}); rc != 0)
        throw BootstrapError(fmt::format("Unpacking {} failed with exit code {}", archive.string(), rc));

    std::error_code ec;
    fs::remove(archive, ec);

    const auto bin = installDir / dist / "bin";
    const char* path = std::getenv("PATH");
    const auto newPath = bin.string() + (path && *path ? ":" + std::string(path) : "");
    ::setenv("PATH", newPath.c_str(), 1);
    Registry::bootstrap()->info("[Environment] Added {} to PATH", bin.string());
}

std::string Environment::ensureRuntimeInstalled() {
    if (const auto v = probeVersion("node")) {
        Registry::bootstrap()->info("[Environment] Node.js {} already installed", *v);
        return *v;
    }

    Registry::bootstrap()->info("[Environment] Node.js not found on PATH");
    installRuntime();

    const auto v = probeVersion("node");
    if (!v) throw BootstrapError("Node.js was installed but `node --version` reports nothing");

    Registry::bootstrap()->info("[Environment] Node.js {} ready", *v);
    return *v;
}

void Environment::fetchTestFramework(const std::string& repositoryUrl, const std::string& ref, const fs::path& dest) {
    if (repositoryUrl.empty()) throw BootstrapError("No test framework repository configured");

    const auto git = probeVersion("git");
    if (!git) throw BootstrapError("git is not available on PATH");
    Registry::bootstrap()->debug("[Environment] Using {}", *git);

    std::error_code ec;
    if (fs::exists(dest, ec)) {
        Registry::bootstrap()->info("[Environment] Removing previous framework copy at {}", dest.string());
        fs::remove_all(dest, ec);
        if (ec) throw BootstrapError(fmt::format("Could not remove {}: {}", dest.string(), ec.message()));
    }
    if (dest.has_parent_path()) fs::create_directories(dest.parent_path());

    int rc;
    if (ref.empty()) {
        Registry::bootstrap()->info("[Environment] Cloning {} (default branch)", repositoryUrl);
        rc = runStep({"git", "clone", "--depth", "1", repositoryUrl, dest.string()});
    } else if (looksLikeCommitSha(ref)) {
        Registry::bootstrap()->info("[Environment] Cloning {} at commit {}", repositoryUrl, ref);
        rc = runStep({"git", "clone", repositoryUrl, dest.string()});
        if (rc == 0) rc = runStep({"git", "-C", dest.string(), "checkout", "--detach", ref});
    } else {
        Registry::bootstrap()->info("[Environment] Cloning {} at {}", repositoryUrl, ref);
        rc = runStep({"git", "clone", "--depth", "1", "--branch", ref, repositoryUrl, dest.string()});
    }

    if (rc != 0) throw BootstrapError(fmt::format("Cloning {}{} failed with exit code {}",
                                                  repositoryUrl, ref.empty() ? "" : "@" + ref, rc));
}

void Environment::installFrameworkDependencies(const config::Browser browser, const fs::path& frameworkRoot) {
    bool installed = false;
    if (fs::exists(frameworkRoot / "package-lock.json")) {
        installed = runStep({"npm", "ci"}, frameworkRoot) == 0;
        if (!installed) Registry::bootstrap()->warn("[Environment] npm ci failed, falling back to npm install");
    }
    if (!installed && runStep({"npm", "install"}, frameworkRoot) != 0)
        throw BootstrapError("npm install failed in " + frameworkRoot.string());

    const auto name = config::to_string(browser);
    if (const int rc = runStep({"npx", "playwright", "install", name}, frameworkRoot); rc != 0)
        throw BootstrapError(fmt::format("Installing the {} browser failed with exit code {}", name, rc));

    if (const int rc = runStep({"npx", "playwright", "install-deps", name}, frameworkRoot); rc != 0)
        Registry::bootstrap()->warn("[Environment] Installing OS dependencies for {} failed (exit {}); "
                                    "continuing, the image may already provide them", name, rc);
}

}
