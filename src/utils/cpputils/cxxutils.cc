/******************************************************************************
 * Copyright (c) Huawei Technologies Co., Ltd. 2024. All rights reserved.
 * podshim licensed under the Mulan PSL v2.
 * You can use this software according to the terms and conditions of the Mulan PSL v2.
 * You may obtain a copy of Mulan PSL v2 at:
 *     http://license.coscl.org.cn/MulanPSL2
 * THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND, EITHER EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT, MERCHANTABILITY OR FIT FOR A PARTICULAR
 * PURPOSE.
 * See the Mulan PSL v2 for more details.
 * Author: zhangwei
 * Create: 2024-05-20
 * Description: provide c++ common utils functions
 *******************************************************************************/
#include "cxxutils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <numeric>
#include <random>
#include <regex.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

#include <isula_libutils/log.h>

namespace CXXUtils {
std::vector<std::string> Split(const std::string &str, char delimiter)
{
    std::vector<std::string> parts;
    std::string item;
    std::istringstream input(str);

    while (std::getline(input, item, delimiter)) {
        parts.push_back(item);
    }
    return parts;
}

std::string StringsJoin(const std::vector<std::string> &vec, const std::string &sep)
{
    if (vec.empty()) {
        return "";
    }

    return std::accumulate(vec.begin() + 1, vec.end(), vec[0],
    [&sep](const std::string & a, const std::string & b) -> std::string {
        return a + sep + b;
    });
}

std::string ToLower(const std::string &str)
{
    std::string out(str);

    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool HasPrefix(const std::string &str, const std::string &prefix)
{
    return str.compare(0, prefix.length(), prefix) == 0;
}

bool RegMatch(const std::string &pattern, const std::string &str)
{
    regex_t reg;
    bool matched = false;

    if (regcomp(&reg, pattern.c_str(), REG_EXTENDED | REG_NOSUB) != 0) {
        ERROR("Invalid regular expression: %s", pattern.c_str());
        return false;
    }
    matched = (regexec(&reg, str.c_str(), 0, nullptr, 0) == 0);
    regfree(&reg);
    return matched;
}

std::string RandomHex(size_t n)
{
    static const char hexDigits[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out;

    out.reserve(n * 2);
    for (size_t i = 0; i < n; i++) {
        int b = dist(gen);
        out.push_back(hexDigits[(b >> 4) & 0xf]);
        out.push_back(hexDigits[b & 0xf]);
    }
    return out;
}

auto ReadFile(const std::string &path, Errors &error) -> std::string
{
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (!in) {
        error.Errorf("failed to open %s: %s", path.c_str(), strerror(errno));
        return "";
    }

    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void WriteAll(int fd, const std::string &path, const std::string &content, Errors &error)
{
    size_t written = 0;

    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error.Errorf("failed to write %s: %s", path.c_str(), strerror(errno));
            return;
        }
        written += static_cast<size_t>(n);
    }
}

void AtomicWriteFile(const std::string &path, const std::string &content, mode_t mode, Errors &error)
{
    std::string tmpPath = path + ".tmp-" + RandomHex(4);

    int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        SYSERROR("Failed to create %s", tmpPath.c_str());
        error.Errorf("failed to create %s: %s", tmpPath.c_str(), strerror(errno));
        return;
    }

    WriteAll(fd, tmpPath, content, error);
    if (error.NotEmpty()) {
        goto err_out;
    }

    if (fsync(fd) != 0) {
        error.Errorf("failed to sync %s: %s", tmpPath.c_str(), strerror(errno));
        goto err_out;
    }
    // open() honours umask, the final file must carry the requested mode
    if (fchmod(fd, mode) != 0) {
        error.Errorf("failed to chmod %s: %s", tmpPath.c_str(), strerror(errno));
        goto err_out;
    }
    (void)close(fd);
    fd = -1;

    if (rename(tmpPath.c_str(), path.c_str()) != 0) {
        error.Errorf("failed to rename %s to %s: %s", tmpPath.c_str(), path.c_str(), strerror(errno));
        goto err_out;
    }
    return;

err_out:
    if (fd >= 0) {
        (void)close(fd);
    }
    if (unlink(tmpPath.c_str()) != 0 && errno != ENOENT) {
        SYSWARN("Failed to remove %s", tmpPath.c_str());
    }
}

void RewriteFile(const std::string &path, const std::string &content, Errors &error)
{
    int fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
    if (fd < 0) {
        SYSERROR("Failed to open %s", path.c_str());
        error.Errorf("failed to open %s: %s", path.c_str(), strerror(errno));
        return;
    }

    WriteAll(fd, path, content, error);
    if (error.Empty() && fsync(fd) != 0) {
        error.Errorf("failed to sync %s: %s", path.c_str(), strerror(errno));
    }
    (void)close(fd);
}

void EnsureDir(const std::string &path, mode_t mode, Errors &error)
{
    std::string current;
    std::vector<std::string> parts = Split(path, '/');

    if (HasPrefix(path, "/")) {
        current = "/";
    }
    for (const auto &part : parts) {
        if (part.empty()) {
            continue;
        }
        current += part;
        if (mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
            error.Errorf("failed to create directory %s: %s", current.c_str(), strerror(errno));
            return;
        }
        current += "/";
    }
}
} // namespace CXXUtils
