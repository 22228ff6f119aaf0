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
 * Create: 2024-05-23
 * Description: provide resolv.conf rewriting functions
 *********************************************************************************/
#include "resolv_conf.h"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

#include <isula_libutils/log.h>

#include "cri_constants.h"
#include "cxxutils.h"

namespace podshim {
auto BuildResolvConf(const std::vector<std::string> &servers, const std::vector<std::string> &searches,
                     const std::vector<std::string> &options, Errors &error) -> std::string
{
    std::vector<std::string> lines;

    if (searches.size() > static_cast<size_t>(CRI::Constants::MAX_DNS_SEARCHES)) {
        error.Errorf("DNSOption.Searches has more than %d domains", CRI::Constants::MAX_DNS_SEARCHES);
        return "";
    }

    if (!servers.empty()) {
        lines.push_back("nameserver " + CXXUtils::StringsJoin(servers, "\nnameserver "));
    }
    if (!searches.empty()) {
        lines.push_back("search " + CXXUtils::StringsJoin(searches, " "));
    }
    if (!options.empty()) {
        lines.push_back("options " + CXXUtils::StringsJoin(options, " "));
    }
    if (lines.empty()) {
        return "";
    }

    return CXXUtils::StringsJoin(lines, "\n") + "\n";
}

void FileResolvConfWriter::Rewrite(const std::string &path, const std::vector<std::string> &servers,
                                   const std::vector<std::string> &searches, const std::vector<std::string> &options,
                                   Errors &error)
{
    struct stat st;

    if (path.empty()) {
        WARN("Sandbox has no resolv.conf path, skip rewriting it");
        return;
    }

    std::string content = BuildResolvConf(servers, searches, options, error);
    if (error.NotEmpty()) {
        return;
    }
    if (content.empty()) {
        DEBUG("No dns config to write into %s", path.c_str());
        return;
    }

    if (stat(path.c_str(), &st) != 0) {
        SYSERROR("Failed to stat resolv.conf %s", path.c_str());
        error.Errorf("resolv.conf %s is not accessible: %s", path.c_str(), strerror(errno));
        return;
    }

    CXXUtils::RewriteFile(path, content, error);
    if (error.NotEmpty()) {
        ERROR("Failed to rewrite %s: %s", path.c_str(), error.GetCMessage());
        return;
    }
    DEBUG("Rewrote resolv.conf %s", path.c_str());
}
} // namespace podshim
