#include "patchbench/fs_guard.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <regex>
#include <sstream>
#include <unordered_set>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace patchbench {

namespace fs = std::filesystem;

bool is_path_under(const fs::path& p, const fs::path& root) {
    std::error_code ec;
    auto rp = fs::weakly_canonical(p, ec);
    if (ec) return false;
    auto rr = fs::weakly_canonical(root, ec);
    if (ec) return false;
    auto ps = rp.generic_string();
    auto rs = rr.generic_string();
    if (ps == rs) return true;
    if (!rs.empty() && rs.back() != '/') rs.push_back('/');
    return ps.rfind(rs, 0) == 0;
}

bool is_ignored_dir_name(const std::string& name) {
    static const std::unordered_set<std::string> ignored = {
        ".git", ".hg", ".svn", ".pytest_cache", "__pycache__", "build", "site-packages",
    };
    return ignored.count(name) > 0;
}

namespace {

std::string strip_prefix_dir(const std::string& s, const std::string& prefix) {
    if (s == prefix) return "";
    if (s.size() > prefix.size() && s.compare(0, prefix.size(), prefix) == 0 && s[prefix.size()] == '/') {
        return s.substr(prefix.size() + 1);
    }
    return s;
}

PathResolution reject(const std::string& type, const std::string& msg) {
    PathResolution r;
    r.ok = false;
    r.error_type = type;
    r.message = msg;
    return r;
}

} // namespace

PathResolution resolve_safe_path(const fs::path& root, const std::string& requested,
                                 const PathPolicy& policy) {
    std::error_code ec;
    fs::path croot = fs::canonical(root, ec);
    if (ec || !fs::is_directory(croot, ec)) {
        return reject("no_root", "workspace root does not exist: " + root.string());
    }
    if (requested.find('\0') != std::string::npos) {
        return reject("invalid_path", "path contains NUL byte");
    }

    std::string rel = requested;
    if (!rel.empty() && rel[0] == '/') {
        const std::string root_s = croot.generic_string();
        const std::string repo_mount = policy.container_workdir + "/repo";
        if (rel == root_s || rel.rfind(root_s + "/", 0) == 0) {
            rel = strip_prefix_dir(rel, root_s);
        } else if (!policy.container_workdir.empty() &&
                   (rel == repo_mount || rel.rfind(repo_mount + "/", 0) == 0)) {
            rel = strip_prefix_dir(rel, repo_mount);
        } else if (!policy.container_workdir.empty() &&
                   (rel == policy.container_workdir || rel.rfind(policy.container_workdir + "/", 0) == 0)) {
            rel = strip_prefix_dir(rel, policy.container_workdir);
        } else {
            return reject("path_escape", "absolute path outside workspace: " + requested);
        }
    } else {
        rel = strip_prefix_dir(rel, "repo");
    }

    // Lexical normalization; ".." may never climb above the root.
    std::vector<std::string> parts;
    std::stringstream ss(rel);
    std::string comp;
    while (std::getline(ss, comp, '/')) {
        if (comp.empty() || comp == ".") continue;
        if (comp == "..") {
            if (parts.empty()) return reject("path_escape", "path escapes workspace: " + requested);
            parts.pop_back();
            continue;
        }
        parts.push_back(comp);
    }

    if (!policy.allow_hidden) {
        for (const auto& p : parts) {
            if (p[0] == '.') return reject("hidden_path", "hidden path not allowed: " + requested);
        }
    }

    std::string norm;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) norm += "/";
        norm += parts[i];
    }

    fs::path candidate = norm.empty() ? croot : croot / norm;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) return reject("invalid_path", "cannot resolve " + requested + ": " + ec.message());
    if (!is_path_under(resolved, croot)) {
        return reject("symlink_escape", "symlink resolves outside workspace: " + requested);
    }

    PathResolution r;
    r.ok = true;
    r.path = resolved;
    r.rel = norm;
    return r;
}

bool glob_match(const std::string& pattern, const std::string& rel_path) {
    std::string subject = rel_path;
    if (pattern.find('/') == std::string::npos) {
        auto slash = rel_path.rfind('/');
        if (slash != std::string::npos) subject = rel_path.substr(slash + 1);
    }

    std::string re;
    for (size_t i = 0; i < pattern.size(); i++) {
        char c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    re += "(?:.*/)?";
                    i += 2;
                } else {
                    re += ".*";
                    i += 1;
                }
            } else {
                re += "[^/]*";
            }
        } else if (c == '?') {
            re += "[^/]";
        } else if (c == '[') {
            size_t close = pattern.find(']', i + 1);
            if (close == std::string::npos) {
                re += "\\[";
            } else {
                std::string cls = pattern.substr(i + 1, close - i - 1);
                if (!cls.empty() && cls[0] == '!') cls[0] = '^';
                re += "[" + cls + "]";
                i = close;
            }
        } else if (std::strchr(".^$+(){}|\\", c)) {
            re += '\\';
            re += c;
        } else {
            re += c;
        }
    }
    try {
        return std::regex_match(subject, std::regex(re));
    } catch (const std::regex_error&) {
        return false;
    }
}

ListResult safe_list(const fs::path& root, const fs::path& dir, const std::optional<std::string>& glob,
                     const PathPolicy& policy, size_t max_entries,
                     std::chrono::steady_clock::time_point deadline) {
    ListResult res;
    std::error_code ec;
    fs::path croot = fs::canonical(root, ec);
    if (ec) {
        res.error_type = "no_root";
        res.message = "workspace root does not exist";
        return res;
    }
    if (!fs::is_directory(dir, ec)) {
        res.error_type = "not_found";
        res.message = "directory does not exist: " + fs::relative(dir, croot, ec).generic_string();
        return res;
    }

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        res.error_type = "io_error";
        res.message = ec.message();
        return res;
    }

    size_t visited = 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            res.error_type = "io_error";
            res.message = ec.message();
            return res;
        }
        if ((++visited & 255) == 0 && std::chrono::steady_clock::now() > deadline) {
            res.error_type = "timeout";
            res.message = "listing exceeded its time limit";
            return res;
        }

        const fs::directory_entry& e = *it;
        const std::string name = e.path().filename().string();
        if (e.is_symlink(ec)) continue;
        if (e.is_directory(ec)) {
            if (is_ignored_dir_name(name) || (!policy.allow_hidden && name[0] == '.')) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!e.is_regular_file(ec)) continue;
        if (!policy.allow_hidden && name[0] == '.') continue;

        std::string rel = fs::relative(e.path(), croot, ec).generic_string();
        if (ec) continue;
        if (glob && !glob->empty() && !glob_match(*glob, rel)) continue;
        res.files.push_back(rel);
    }

    std::sort(res.files.begin(), res.files.end());
    if (res.files.size() > max_entries) {
        res.files.resize(max_entries);
        res.truncated = true;
    }
    res.ok = true;
    return res;
}

int open_under_root_nofollow(const fs::path& root, const fs::path& p, std::string* err) {
    int fd = ::open(p.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        *err = std::string("cannot open: ") + std::strerror(errno);
        return -1;
    }
    struct stat st;
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        *err = "not a regular file";
        return -1;
    }
    char proc_path[64];
    std::snprintf(proc_path, sizeof(proc_path), "/proc/self/fd/%d", fd);
    char target[4096];
    ssize_t len = ::readlink(proc_path, target, sizeof(target) - 1);
    if (len > 0) {
        target[len] = '\0';
        if (!is_path_under(fs::path(target), root)) {
            ::close(fd);
            *err = "file escaped workspace after open";
            return -1;
        }
    }
    return fd;
}

} // namespace patchbench
