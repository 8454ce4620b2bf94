/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/fileutil.hpp>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace groundstation {

std::string readFile(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::system_error(errno, std::generic_category(), "Cannot open " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw std::system_error(errno, std::generic_category(), "Cannot read " + path.string());
    }
    return content.str();
}

fs::path withSuffix(const fs::path &path, const std::string &suffix) {
    fs::path result = path;
    result += suffix;
    return result;
}

// Write all bytes to a file descriptor, retrying on short writes
static void writeAll(int fd, std::string_view content, const fs::path &path) {
    const char *data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "Cannot write " + path.string());
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void writeFileAtomically(const fs::path &path, std::string_view content, bool keepBackup) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    fs::path tmp = withSuffix(path, ".tmp");

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot create " + tmp.string());
    }
    try {
        writeAll(fd, content, tmp);
        if (::fsync(fd) != 0) {
            throw std::system_error(errno, std::generic_category(), "Cannot sync " + tmp.string());
        }
    } catch (const std::system_error &) {
        ::close(fd);
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    }
    if (::close(fd) != 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot close " + tmp.string());
    }

    if (keepBackup && fs::exists(path)) {
        fs::copy_file(path, withSuffix(path, ".bak"), fs::copy_options::overwrite_existing);
    }

    fs::rename(tmp, path);
}

}
