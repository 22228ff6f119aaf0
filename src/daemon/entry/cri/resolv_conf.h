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
 * Description: provide resolv.conf rewriting definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_RESOLV_CONF_H
#define DAEMON_ENTRY_CRI_RESOLV_CONF_H

#include <string>
#include <vector>

#include "errors.h"

namespace podshim {
class ResolvConfWriter {
public:
    virtual ~ResolvConfWriter() = default;

    // replaces the content of an existing file, nothing is written without dns entries
    virtual void Rewrite(const std::string &path, const std::vector<std::string> &servers,
                         const std::vector<std::string> &searches, const std::vector<std::string> &options,
                         Errors &error) = 0;
};

class FileResolvConfWriter : public ResolvConfWriter {
public:
    FileResolvConfWriter() = default;
    virtual ~FileResolvConfWriter() = default;

    void Rewrite(const std::string &path, const std::vector<std::string> &servers,
                 const std::vector<std::string> &searches, const std::vector<std::string> &options,
                 Errors &error) override;
};

auto BuildResolvConf(const std::vector<std::string> &servers, const std::vector<std::string> &searches,
                     const std::vector<std::string> &options, Errors &error) -> std::string;
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_RESOLV_CONF_H
