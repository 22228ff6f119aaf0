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
 * Description: provide sandbox network readiness store definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_NETWORK_READINESS_H
#define DAEMON_ENTRY_CRI_NETWORK_READINESS_H

#include <map>
#include <string>

#include "read_write_lock.h"

namespace podshim {
// Sandbox id to "pod network usable" flag. A missing entry reads as not ready.
class NetworkReadinessStore {
public:
    virtual ~NetworkReadinessStore() = default;

    virtual auto Get(const std::string &podSandboxID) -> bool = 0;
    virtual void Set(const std::string &podSandboxID, bool ready) = 0;
    virtual void Delete(const std::string &podSandboxID) = 0;
    virtual auto Contains(const std::string &podSandboxID) -> bool = 0;
};

class MemoryNetworkReadinessStore : public NetworkReadinessStore {
public:
    MemoryNetworkReadinessStore() = default;
    virtual ~MemoryNetworkReadinessStore() = default;

    auto Get(const std::string &podSandboxID) -> bool override;
    void Set(const std::string &podSandboxID, bool ready) override;
    void Delete(const std::string &podSandboxID) override;
    auto Contains(const std::string &podSandboxID) -> bool override;

private:
    RWMutex m_mutex;
    std::map<std::string, bool> m_ready;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_NETWORK_READINESS_H
