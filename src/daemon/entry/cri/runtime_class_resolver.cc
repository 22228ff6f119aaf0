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
 * Description: provide runtime class resolver functions
 *********************************************************************************/
#include "runtime_class_resolver.h"

#include <isula_libutils/log.h>

#include "cri_constants.h"

namespace podshim {
ConfigRuntimeClassResolver::ConfigRuntimeClassResolver(const std::map<std::string, std::string> &criRuntimes,
                                                       const std::string &defaultRuntime)
    : m_criRuntimes(criRuntimes)
    , m_defaultRuntime(defaultRuntime.empty() ? CRI::Constants::defaultRuntime : defaultRuntime)
{
}

auto ConfigRuntimeClassResolver::Resolve(const std::string &runtimeClass, Errors &error) -> std::string
{
    if (runtimeClass.empty() || runtimeClass == m_defaultRuntime) {
        return m_defaultRuntime;
    }

    auto iter = m_criRuntimes.find(runtimeClass);
    if (iter == m_criRuntimes.end() || iter->second.empty()) {
        ERROR("Runtime class %s is not configured in cri-runtimes", runtimeClass.c_str());
        error.Errorf("no runtime for \"%s\" is configured", runtimeClass.c_str());
        return "";
    }

    return iter->second;
}
} // namespace podshim
