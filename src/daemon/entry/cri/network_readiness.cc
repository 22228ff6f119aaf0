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
 * Create: 2024-05-22
 * Description: provide sandbox network readiness store functions
 *********************************************************************************/
#include "network_readiness.h"

namespace podshim {
auto MemoryNetworkReadinessStore::Get(const std::string &podSandboxID) -> bool
{
    ReadGuard<RWMutex> lock(m_mutex);
    auto iter = m_ready.find(podSandboxID);
    return iter != m_ready.end() && iter->second;
}

void MemoryNetworkReadinessStore::Set(const std::string &podSandboxID, bool ready)
{
    WriteGuard<RWMutex> lock(m_mutex);
    m_ready[podSandboxID] = ready;
}

void MemoryNetworkReadinessStore::Delete(const std::string &podSandboxID)
{
    WriteGuard<RWMutex> lock(m_mutex);
    m_ready.erase(podSandboxID);
}

auto MemoryNetworkReadinessStore::Contains(const std::string &podSandboxID) -> bool
{
    ReadGuard<RWMutex> lock(m_mutex);
    return m_ready.find(podSandboxID) != m_ready.end();
}
} // namespace podshim
