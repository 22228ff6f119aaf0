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
 * Description: provide runtime class resolver definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_RUNTIME_CLASS_RESOLVER_H
#define DAEMON_ENTRY_CRI_RUNTIME_CLASS_RESOLVER_H

#include <map>
#include <string>

#include "errors.h"

namespace podshim {
class RuntimeClassResolver {
public:
    virtual ~RuntimeClassResolver() = default;

    // an empty runtime class selects the default runtime handler
    virtual auto Resolve(const std::string &runtimeClass, Errors &error) -> std::string = 0;
};

// Resolves through the cri-runtimes table of the daemon configuration.
class ConfigRuntimeClassResolver : public RuntimeClassResolver {
public:
    ConfigRuntimeClassResolver(const std::map<std::string, std::string> &criRuntimes,
                               const std::string &defaultRuntime);
    virtual ~ConfigRuntimeClassResolver() = default;

    auto Resolve(const std::string &runtimeClass, Errors &error) -> std::string override;

private:
    std::map<std::string, std::string> m_criRuntimes;
    std::string m_defaultRuntime;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_RUNTIME_CLASS_RESOLVER_H
