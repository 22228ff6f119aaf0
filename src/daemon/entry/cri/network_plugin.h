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
 * Description: provide network plugin definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_NETWORK_PLUGIN_H
#define DAEMON_ENTRY_CRI_NETWORK_PLUGIN_H
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "errors.h"

namespace podshim {
namespace Network {
class NetworkPlugin {
public:
    virtual ~NetworkPlugin() = default;

    virtual void Init(Errors &error) = 0;

    virtual auto Name() const -> const std::string & = 0;

    // podSandboxID is the composite container id, <runtime>://<engine id>
    virtual void SetUpPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                          const std::map<std::string, std::string> &annotations,
                          const std::map<std::string, std::string> &options, Errors &error) = 0;

    virtual void TearDownPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                             Errors &error) = 0;

    virtual void Status(Errors &error) = 0;
};

class NoopNetworkPlugin : public NetworkPlugin {
public:
    NoopNetworkPlugin() = default;
    virtual ~NoopNetworkPlugin() = default;

    void Init(Errors &error) override;

    auto Name() const -> const std::string & override;

    void SetUpPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                  const std::map<std::string, std::string> &annotations,
                  const std::map<std::string, std::string> &options, Errors &error) override;

    void TearDownPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                     Errors &error) override;

    void Status(Errors &error) override;

private:
    const std::string DEFAULT_PLUGIN_NAME { "kubernetes.io/no-op" };
};

class PodLock {
public:
    PodLock() = default;
    ~PodLock() = default;

    uint32_t GetRefcount() const
    {
        return m_refcount;
    }

    void Increase()
    {
        m_refcount++;
    }

    void Decrease()
    {
        m_refcount--;
    }

    void Lock()
    {
        m_mu.lock();
    }

    void Unlock()
    {
        m_mu.unlock();
    }

private:
    // in-flight operations of this pod, the lock leaves the pod map at zero
    uint32_t m_refcount { 0 };
    std::mutex m_mu;
};

// Serialises plugin calls per pod, calls for different pods run in parallel.
class PluginManager {
public:
    explicit PluginManager(std::shared_ptr<NetworkPlugin> plugin)
        : m_plugin(plugin)
    {
    }
    virtual ~PluginManager() = default;

    auto PluginName() const -> std::string;
    void Status(Errors &error);
    void SetUpPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                  const std::map<std::string, std::string> &annotations,
                  const std::map<std::string, std::string> &options, Errors &error);
    void TearDownPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                     Errors &error);

    // pods with an operation in flight, for tests
    auto InFlightPods() -> size_t;

private:
    void Lock(const std::string &fullPodName);
    void Unlock(const std::string &fullPodName);

    std::mutex m_podsLock;
    std::map<std::string, std::unique_ptr<PodLock>> m_pods;
    std::shared_ptr<NetworkPlugin> m_plugin { nullptr };
};

// An empty name selects the no-op plugin, otherwise the named plugin must be among plugins.
auto InitNetworkPlugin(const std::vector<std::shared_ptr<NetworkPlugin>> &plugins, const std::string &networkPluginName,
                       Errors &error) -> std::shared_ptr<NetworkPlugin>;
} // namespace Network
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_NETWORK_PLUGIN_H
