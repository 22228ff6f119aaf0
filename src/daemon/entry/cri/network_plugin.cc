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
 * Description: provide network plugin functions
 *********************************************************************************/
#include "network_plugin.h"

#include <isula_libutils/log.h>

namespace podshim {
namespace Network {
auto InitNetworkPlugin(const std::vector<std::shared_ptr<NetworkPlugin>> &plugins, const std::string &networkPluginName,
                       Errors &error) -> std::shared_ptr<NetworkPlugin>
{
    std::shared_ptr<NetworkPlugin> result { nullptr };
    std::map<std::string, std::shared_ptr<NetworkPlugin>> pluginMap;

    if (networkPluginName.empty()) {
        DEBUG("network plugin name empty, use no-op plugin");
        result = std::make_shared<NoopNetworkPlugin>();
        result->Init(error);
        return error.NotEmpty() ? nullptr : result;
    }

    for (const auto &plugin : plugins) {
        if (plugin == nullptr) {
            continue;
        }
        const std::string &tmpName = plugin->Name();
        if (pluginMap.find(tmpName) != pluginMap.end()) {
            WARN("Network plugin %s was registered more than once", tmpName.c_str());
            continue;
        }
        pluginMap[tmpName] = plugin;
    }

    auto iter = pluginMap.find(networkPluginName);
    if (iter == pluginMap.end()) {
        error.Errorf("network plugin %s not found", networkPluginName.c_str());
        return nullptr;
    }
    result = iter->second;

    Errors initErr;
    result->Init(initErr);
    if (initErr.NotEmpty()) {
        error.Errorf("network plugin %s failed init: %s", networkPluginName.c_str(), initErr.GetCMessage());
        return nullptr;
    }
    INFO("Loaded network plugin %s", networkPluginName.c_str());
    return result;
}

void PluginManager::Lock(const std::string &fullPodName)
{
    PodLock *lock { nullptr };

    {
        std::lock_guard<std::mutex> guard(m_podsLock);
        auto iter = m_pods.find(fullPodName);
        if (iter == m_pods.end()) {
            auto tmpLock = std::unique_ptr<PodLock>(new PodLock());
            lock = tmpLock.get();
            m_pods[fullPodName] = std::move(tmpLock);
        } else {
            lock = iter->second.get();
        }
        lock->Increase();
    }

    lock->Lock();
}

void PluginManager::Unlock(const std::string &fullPodName)
{
    std::lock_guard<std::mutex> guard(m_podsLock);

    auto iter = m_pods.find(fullPodName);
    if (iter == m_pods.end()) {
        WARN("Unbalanced pod lock unref for %s", fullPodName.c_str());
        return;
    }

    PodLock *lock = iter->second.get();
    if (lock->GetRefcount() == 0) {
        m_pods.erase(iter);
        WARN("Pod lock for %s still in map with zero refcount", fullPodName.c_str());
        return;
    }
    lock->Decrease();
    lock->Unlock();
    if (lock->GetRefcount() == 0) {
        m_pods.erase(iter);
    }
}

auto PluginManager::InFlightPods() -> size_t
{
    std::lock_guard<std::mutex> guard(m_podsLock);
    return m_pods.size();
}

auto PluginManager::PluginName() const -> std::string
{
    if (m_plugin != nullptr) {
        return m_plugin->Name();
    }
    return "";
}

void PluginManager::Status(Errors &error)
{
    if (m_plugin != nullptr) {
        m_plugin->Status(error);
    }
}

void PluginManager::SetUpPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                             const std::map<std::string, std::string> &annotations,
                             const std::map<std::string, std::string> &options, Errors &error)
{
    if (m_plugin == nullptr) {
        return;
    }

    std::string fullName = name + "_" + ns;
    Lock(fullName);
    INFO("Calling network plugin %s to set up pod %s", m_plugin->Name().c_str(), fullName.c_str());

    Errors tmpErr;
    m_plugin->SetUpPod(ns, name, podSandboxID, annotations, options, tmpErr);
    if (tmpErr.NotEmpty()) {
        error.Errorf("NetworkPlugin %s failed to set up pod %s network: %s", m_plugin->Name().c_str(),
                     fullName.c_str(), tmpErr.GetCMessage());
    }
    Unlock(fullName);
}

void PluginManager::TearDownPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                                Errors &error)
{
    if (m_plugin == nullptr) {
        return;
    }

    std::string fullName = name + "_" + ns;
    Lock(fullName);
    INFO("Calling network plugin %s to tear down pod %s", m_plugin->Name().c_str(), fullName.c_str());

    Errors tmpErr;
    m_plugin->TearDownPod(ns, name, podSandboxID, tmpErr);
    if (tmpErr.NotEmpty()) {
        error.Errorf("NetworkPlugin %s failed to teardown pod %s network: %s", m_plugin->Name().c_str(),
                     fullName.c_str(), tmpErr.GetCMessage());
    }
    Unlock(fullName);
}

void NoopNetworkPlugin::Init(Errors &error)
{
    (void)error;
}

auto NoopNetworkPlugin::Name() const -> const std::string &
{
    return DEFAULT_PLUGIN_NAME;
}

void NoopNetworkPlugin::SetUpPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                                 const std::map<std::string, std::string> &annotations,
                                 const std::map<std::string, std::string> &options, Errors &error)
{
    DEBUG("no-op network setup for pod %s_%s (%s)", name.c_str(), ns.c_str(), podSandboxID.c_str());
}

void NoopNetworkPlugin::TearDownPod(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                                    Errors &error)
{
    DEBUG("no-op network teardown for pod %s_%s (%s)", name.c_str(), ns.c_str(), podSandboxID.c_str());
}

void NoopNetworkPlugin::Status(Errors &error)
{
    return;
}
} // namespace Network
} // namespace podshim
