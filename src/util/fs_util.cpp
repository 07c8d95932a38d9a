#include <pinfold/fs_util.hpp>
#include <pinfold/log.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pinfold {

Result<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return PinfoldError{PinfoldError::IO, "cannot open file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

static std::string temp_name(const std::string& path) {
    static std::atomic<unsigned> counter{0};
    return path + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(counter++);
}

static bool fsync_path(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

Status atomic_write_file(const std::string& path, const std::string& content) {
    std::string tmp = temp_name(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return PinfoldError{PinfoldError::IO, "cannot create temporary file: " + tmp};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return PinfoldError{PinfoldError::IO, "failed writing " + tmp};
        }
    }

    if (!fsync_path(tmp, O_RDONLY)) {
        int err = errno;
        std::error_code ec;
        fs::remove(tmp, ec);
        return PinfoldError{PinfoldError::IO,
            "cannot sync " + tmp + ": " + std::strerror(err)};
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        std::error_code ec;
        fs::remove(tmp, ec);
        return PinfoldError{PinfoldError::IO,
            "cannot replace " + path + ": " + std::strerror(err)};
    }

    // Make the rename itself durable
    std::string dir = fs::path(path).parent_path().string();
    if (!fsync_path(dir.empty() ? "." : dir, O_RDONLY | O_DIRECTORY)) {
        log::debug("cannot sync directory of %s: %s", path.c_str(), std::strerror(errno));
    }
    return ok_status();
}

} // namespace pinfold
