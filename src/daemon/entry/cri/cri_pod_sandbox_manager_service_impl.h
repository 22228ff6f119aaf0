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
 * Create: 2024-05-24
 * Description: provide pod sandbox manager service implementation definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_POD_SANDBOX_MANAGER_IMPL_H
#define DAEMON_ENTRY_CRI_POD_SANDBOX_MANAGER_IMPL_H
#include <memory>
#include <string>

#include "api.pb.h"
#include "checkpoint_handler.h"
#include "checkpoint_manager.h"
#include "container_engine.h"
#include "cri_pod_sandbox_manager_service.h"
#include "errors.h"
#include "network_plugin.h"
#include "network_readiness.h"
#include "resolv_conf.h"
#include "runtime_class_resolver.h"
#include "sandbox_conflict_resolver.h"

namespace podshim {
class PodSandboxManagerServiceImpl : public PodSandboxManagerService {
public:
    PodSandboxManagerServiceImpl(const std::string &podSandboxImage, std::shared_ptr<ContainerEngine> engine,
                                 std::shared_ptr<CheckpointManager> checkpointManager,
                                 std::shared_ptr<Network::PluginManager> pluginManager,
                                 std::shared_ptr<RuntimeClassResolver> runtimeClassResolver,
                                 std::shared_ptr<ResolvConfWriter> resolvConfWriter,
                                 std::shared_ptr<NetworkReadinessStore> networkReady);
    PodSandboxManagerServiceImpl(const PodSandboxManagerServiceImpl &) = delete;
    auto operator=(const PodSandboxManagerServiceImpl &) -> PodSandboxManagerServiceImpl & = delete;
    virtual ~PodSandboxManagerServiceImpl() = default;

    auto RunPodSandbox(const runtime::v1::PodSandboxConfig &config, const std::string &runtimeHandler,
                       const RequestContext &ctx, Errors &error) -> std::string override;

    auto GetSandboxImage() const -> const std::string &;

private:
    auto IsCancelled(const RequestContext &ctx, const runtime::v1::PodSandboxConfig &config, const char *stage,
                     Errors &error) -> bool;
    auto EnsureSandboxImageExists(const std::string &image, Errors &error) -> bool;
    auto CreateSandboxContainer(const SandboxCreationConfig &createConfig,
                                const runtime::v1::PodSandboxMetadata &metadata, Errors &error) -> std::string;
    void ConstructPodSandboxCheckpoint(const runtime::v1::PodSandboxConfig &config,
                                       CRI::PodSandboxCheckpoint &checkpoint);
    auto ParseCheckpointProtocol(runtime::v1::Protocol protocol) -> std::string;
    void SetupSandboxFiles(const std::string &podSandboxID, const runtime::v1::PodSandboxConfig &config,
                           Errors &error);
    void SetupSandboxNetwork(const runtime::v1::PodSandboxConfig &config, const std::string &podSandboxID,
                             const RequestContext &ctx, Errors &error);
    void CompensateNetworkFailure(const runtime::v1::PodSandboxConfig &config, const std::string &podSandboxID,
                                  const std::string &compositeID, const Errors &setupErr, Errors &error);

private:
    std::string m_podSandboxImage;
    std::shared_ptr<ContainerEngine> m_engine { nullptr };
    std::shared_ptr<CheckpointManager> m_checkpointManager { nullptr };
    std::shared_ptr<Network::PluginManager> m_pluginManager { nullptr };
    std::shared_ptr<RuntimeClassResolver> m_runtimeClassResolver { nullptr };
    std::shared_ptr<ResolvConfWriter> m_resolvConfWriter { nullptr };
    std::shared_ptr<NetworkReadinessStore> m_networkReady { nullptr };
    SandboxConflictResolver m_conflictResolver;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_POD_SANDBOX_MANAGER_IMPL_H
