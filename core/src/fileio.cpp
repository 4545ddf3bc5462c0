#include "patchbench/fileio.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace patchbench {

namespace fs = std::filesystem;

namespace {

std::string write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::string("write: ") + std::strerror(errno);
        off += (size_t)n;
    }
    return "";
}

void fsync_dir(const fs::path& dir) {
    int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) { (void)::fsync(dfd); ::close(dfd); }
}

} // namespace

std::string read_whole_file(const fs::path& p, std::string* out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return "cannot open " + p.string();
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return "read failed: " + p.string();
    *out = ss.str();
    return "";
}

std::string atomic_write_file(const fs::path& p, const std::string& data) {
    std::string tmp = p.string() + ".tmp." + std::to_string(std::random_device{}());
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) return "cannot create " + tmp + ": " + std::strerror(errno);

    std::string err = write_all(fd, data);
    if (err.empty() && ::fsync(fd) != 0) err = std::string("fsync: ") + std::strerror(errno);
    ::close(fd);
    if (!err.empty()) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return err;
    }

    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(tmp, ec2);
        return "rename failed: " + ec.message();
    }
    fsync_dir(p.parent_path());
    return "";
}

std::string write_file_exclusive(const fs::path& p, const std::string& data) {
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0444);
    if (fd < 0) return "cannot create " + p.string() + ": " + std::strerror(errno);
    std::string err = write_all(fd, data);
    if (err.empty() && ::fsync(fd) != 0) err = std::string("fsync: ") + std::strerror(errno);
    ::close(fd);
    if (err.empty()) fsync_dir(p.parent_path());
    return err;
}

std::string append_to_file(const fs::path& p, const std::string& data) {
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) return "cannot open " + p.string() + ": " + std::strerror(errno);
    std::string err = write_all(fd, data);
    ::close(fd);
    return err;
}

std::string make_private_dir(const fs::path& parent, const std::string& prefix, fs::path* out) {
    std::string tmpl = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) return "mkdtemp " + tmpl + ": " + std::strerror(errno);
    *out = fs::path(buf.data());
    return "";
}

} // namespace patchbench
