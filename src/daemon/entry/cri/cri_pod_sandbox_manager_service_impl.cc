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
 * Description: provide pod sandbox manager service implementation
 *********************************************************************************/
#include "cri_pod_sandbox_manager_service_impl.h"

#include <map>
#include <vector>

#include <isula_libutils/log.h>

#include "cri_constants.h"
#include "cri_helpers.h"
#include "naming.h"
#include "provision_errors.h"
#include "sandbox_config_builder.h"

namespace podshim {
PodSandboxManagerServiceImpl::PodSandboxManagerServiceImpl(
    const std::string &podSandboxImage, std::shared_ptr<ContainerEngine> engine,
    std::shared_ptr<CheckpointManager> checkpointManager, std::shared_ptr<Network::PluginManager> pluginManager,
    std::shared_ptr<RuntimeClassResolver> runtimeClassResolver, std::shared_ptr<ResolvConfWriter> resolvConfWriter,
    std::shared_ptr<NetworkReadinessStore> networkReady)
    : m_podSandboxImage(podSandboxImage.empty() ? CRI::Constants::defaultSandboxImage : podSandboxImage)
    , m_engine(engine)
    , m_checkpointManager(checkpointManager)
    , m_pluginManager(pluginManager)
    , m_runtimeClassResolver(runtimeClassResolver)
    , m_resolvConfWriter(resolvConfWriter)
    , m_networkReady(networkReady)
    , m_conflictResolver(engine)
{
}

auto PodSandboxManagerServiceImpl::GetSandboxImage() const -> const std::string &
{
    return m_podSandboxImage;
}

auto PodSandboxManagerServiceImpl::IsCancelled(const RequestContext &ctx, const runtime::v1::PodSandboxConfig &config,
                                               const char *stage, Errors &error) -> bool
{
    if (!ctx.IsCancelled()) {
        return false;
    }

    WARN("Run pod sandbox for pod %s cancelled before %s", config.metadata().name().c_str(), stage);
    error.Errorf(PROVISION_CANCELLED, "run pod sandbox for pod \"%s\" cancelled before %s",
                 config.metadata().name().c_str(), stage);
    return true;
}

auto PodSandboxManagerServiceImpl::EnsureSandboxImageExists(const std::string &image, Errors &error) -> bool
{
    bool present = m_engine->ImageStatus(image, error);
    if (error.NotEmpty()) {
        return false;
    }
    if (present) {
        return true;
    }

    INFO("Sandbox image %s not found locally, pulling it", image.c_str());
    m_engine->PullImage(image, error);
    return error.Empty();
}

auto PodSandboxManagerServiceImpl::CreateSandboxContainer(const SandboxCreationConfig &createConfig,
                                                          const runtime::v1::PodSandboxMetadata &metadata,
                                                          Errors &error) -> std::string
{
    Errors createErr;

    std::string id = m_engine->CreateContainer(createConfig, createErr);
    if (createErr.Empty() && id.empty()) {
        createErr.SetError("engine returned an empty container id");
    }
    if (createErr.Empty()) {
        return id;
    }

    ConflictResolution resolution = m_conflictResolver.Resolve(createConfig, metadata, createErr);
    switch (resolution.outcome) {
        case ConflictOutcome::RESOLVED_TO_EXISTING:
            INFO("Recovered sandbox %s from a creation conflict, container id %s", createConfig.name.c_str(),
                 resolution.id.c_str());
            return resolution.id;
        case ConflictOutcome::NOT_A_CONFLICT:
        case ConflictOutcome::RESOLUTION_FAILED:
        default:
            error = resolution.error;
            return "";
    }
}

auto PodSandboxManagerServiceImpl::ParseCheckpointProtocol(runtime::v1::Protocol protocol) -> std::string
{
    switch (protocol) {
        case runtime::v1::UDP:
            return "udp";
        case runtime::v1::SCTP:
            return "sctp";
        case runtime::v1::TCP:
        default:
            return "tcp";
    }
}

void PodSandboxManagerServiceImpl::ConstructPodSandboxCheckpoint(const runtime::v1::PodSandboxConfig &config,
                                                                 CRI::PodSandboxCheckpoint &checkpoint)
{
    auto data = std::make_shared<CRI::CheckpointData>();

    checkpoint.SetName(config.metadata().name());
    checkpoint.SetNamespace(config.metadata().namespace_());

    for (const auto &pm : config.port_mappings()) {
        data->InsertPortMapping(CRI::PortMapping(ParseCheckpointProtocol(pm.protocol()), pm.container_port(),
                                                 pm.host_port()));
    }
    data->SetHostNetwork(config.linux().security_context().namespace_options().network() ==
                         runtime::v1::NamespaceMode::NODE);
    checkpoint.SetData(data);
}

void PodSandboxManagerServiceImpl::SetupSandboxFiles(const std::string &podSandboxID,
                                                     const runtime::v1::PodSandboxConfig &config, Errors &error)
{
    Errors tmpErr;
    const runtime::v1::DNSConfig &dns = config.dns_config();

    std::unique_ptr<ContainerInspectInfo> info = m_engine->InspectContainer(podSandboxID, tmpErr);
    if (tmpErr.NotEmpty() || info == nullptr) {
        error.Errorf(RESOLV_CONF_ERROR, "failed to inspect sandbox container for pod \"%s\": %s",
                     config.metadata().name().c_str(), tmpErr.NotEmpty() ? tmpErr.GetCMessage() : "no inspect data");
        return;
    }

    std::vector<std::string> servers(dns.servers().begin(), dns.servers().end());
    std::vector<std::string> searches(dns.searches().begin(), dns.searches().end());
    std::vector<std::string> options(dns.options().begin(), dns.options().end());

    m_resolvConfWriter->Rewrite(info->resolvConfPath, servers, searches, options, tmpErr);
    if (tmpErr.NotEmpty()) {
        error.Errorf(RESOLV_CONF_ERROR, "rewrite resolv.conf failed for pod \"%s\": %s",
                     config.metadata().name().c_str(), tmpErr.GetCMessage());
    }
}

void PodSandboxManagerServiceImpl::CompensateNetworkFailure(const runtime::v1::PodSandboxConfig &config,
                                                            const std::string &podSandboxID,
                                                            const std::string &compositeID, const Errors &setupErr,
                                                            Errors &error)
{
    const std::string &name = config.metadata().name();
    const std::string &ns = config.metadata().namespace_();
    std::vector<Errors> causes;
    Errors cause;

    cause.Errorf(NETWORK_SETUP_ERROR, "failed to set up sandbox container \"%s\" network for pod \"%s\": %s",
                 podSandboxID.c_str(), name.c_str(), setupErr.GetCMessage());
    ERROR("%s", cause.GetCMessage());
    causes.push_back(cause);

    // every step below runs even when the previous one failed
    Errors teardownErr;
    m_pluginManager->TearDownPod(ns, name, compositeID, teardownErr);
    if (teardownErr.NotEmpty()) {
        Errors teardownCause;
        teardownCause.Errorf(NETWORK_TEARDOWN_ERROR,
                             "failed to clean up sandbox container \"%s\" network for pod \"%s\": %s",
                             podSandboxID.c_str(), name.c_str(), teardownErr.GetCMessage());
        ERROR("%s", teardownCause.GetCMessage());
        causes.push_back(teardownCause);
    }

    Errors stopErr;
    m_engine->StopContainer(podSandboxID, CRI::Constants::DefaultSandboxGracePeriod, stopErr);
    if (stopErr.NotEmpty()) {
        Errors stopCause;
        stopCause.Errorf(SANDBOX_STOP_ERROR, "failed to stop sandbox container \"%s\" for pod \"%s\": %s",
                         podSandboxID.c_str(), name.c_str(), stopErr.GetCMessage());
        ERROR("%s", stopCause.GetCMessage());
        causes.push_back(stopCause);
    }

    error.SetAggregate(NETWORK_SETUP_ERROR, causes);
}

void PodSandboxManagerServiceImpl::SetupSandboxNetwork(const runtime::v1::PodSandboxConfig &config,
                                                       const std::string &podSandboxID, const RequestContext &ctx,
                                                       Errors &error)
{
    std::map<std::string, std::string> stdAnnos;
    std::map<std::string, std::string> options;
    std::string compositeID = CRINaming::BuildContainerID(CRI::Constants::runtimeName, podSandboxID);
    Errors setupErr;

    CRIHelpers::ProtobufAnnoMapToStd(config.annotations(), stdAnnos);

    if (config.has_dns_config()) {
        std::string dnsOption = CRIHelpers::DNSConfigToJSON(config.dns_config(), setupErr);
        if (setupErr.Empty()) {
            options[CRIHelpers::Constants::NETWORK_OPTION_DNS_KEY] = dnsOption;
        }
    }

    if (setupErr.Empty()) {
        m_pluginManager->SetUpPod(config.metadata().namespace_(), config.metadata().name(), compositeID, stdAnnos,
                                  options, setupErr);
    }
    // the network is up but the caller is gone, undo it like a failed setup
    if (setupErr.Empty() && ctx.IsCancelled()) {
        setupErr.Errorf(PROVISION_CANCELLED, "request cancelled during network setup");
    }

    if (setupErr.NotEmpty()) {
        CompensateNetworkFailure(config, podSandboxID, compositeID, setupErr, error);
        return;
    }

    m_networkReady->Set(podSandboxID, true);
    DEBUG("set %s ready", podSandboxID.c_str());
}

// Failures before the network stage leave the created container to the caller.
// Only a network stage failure is rolled back here.
auto PodSandboxManagerServiceImpl::RunPodSandbox(const runtime::v1::PodSandboxConfig &config,
                                                 const std::string &runtimeHandler, const RequestContext &ctx,
                                                 Errors &error) -> std::string
{
    std::string response_id;
    std::string resolvedRuntime;
    SandboxCreationConfig createConfig;
    CRI::PodSandboxCheckpoint checkpoint;
    Errors tmpErr;

    if (!config.has_metadata()) {
        error.SetError(CONFIG_TRANSLATION_ERROR, "sandbox config is missing metadata");
        return "";
    }
    const std::string &podName = config.metadata().name();

    // Step 1: Pull the image for the sandbox.
    if (IsCancelled(ctx, config, "image pull", error)) {
        return "";
    }
    const std::string &image = m_podSandboxImage;
    if (!EnsureSandboxImageExists(image, tmpErr)) {
        ERROR("Failed to pull sandbox image %s: %s", image.c_str(), tmpErr.GetCMessage());
        error.Errorf(IMAGE_PULL_ERROR, "failed to pull sandbox image %s: %s", image.c_str(), tmpErr.GetCMessage());
        return "";
    }

    // Step 2: Resolve the runtime handler and build the creation config.
    if (IsCancelled(ctx, config, "config translation", error)) {
        return "";
    }
    resolvedRuntime = m_runtimeClassResolver->Resolve(runtimeHandler, tmpErr);
    if (tmpErr.NotEmpty()) {
        ERROR("Failed to resolve runtime handler %s: %s", runtimeHandler.c_str(), tmpErr.GetCMessage());
        error.Errorf(UNKNOWN_RUNTIME_CLASS_ERROR, "failed to get sandbox runtime for pod \"%s\": %s",
                     podName.c_str(), tmpErr.GetCMessage());
        return "";
    }
    createConfig = MakeSandboxCreationConfig(config, image, resolvedRuntime, tmpErr);
    if (tmpErr.NotEmpty()) {
        error.Errorf(CONFIG_TRANSLATION_ERROR, "failed to make sandbox config for pod \"%s\": %s", podName.c_str(),
                     tmpErr.GetCMessage());
        return "";
    }

    // Step 3: Create the sandbox container.
    if (IsCancelled(ctx, config, "sandbox creation", error)) {
        return "";
    }
    response_id = CreateSandboxContainer(createConfig, config.metadata(), tmpErr);
    if (tmpErr.NotEmpty()) {
        ERROR("Failed to create sandbox container for pod %s: %s", podName.c_str(), tmpErr.GetCMessage());
        error.Errorf(SANDBOX_CREATE_ERROR, "failed to create a sandbox for pod \"%s\": %s", podName.c_str(),
                     tmpErr.GetCMessage());
        return "";
    }
    m_networkReady->Set(response_id, false);

    // Step 4: Checkpoint the sandbox, it must exist before the container starts.
    if (IsCancelled(ctx, config, "checkpoint", error)) {
        return "";
    }
    ConstructPodSandboxCheckpoint(config, checkpoint);
    m_checkpointManager->CreateCheckpoint(response_id, checkpoint, tmpErr);
    if (tmpErr.NotEmpty()) {
        ERROR("Failed to checkpoint sandbox %s: %s", response_id.c_str(), tmpErr.GetCMessage());
        error.Errorf(CHECKPOINT_ERROR, "failed to checkpoint sandbox \"%s\" for pod \"%s\": %s", response_id.c_str(),
                     podName.c_str(), tmpErr.GetCMessage());
        return "";
    }

    // Step 5: Start the sandbox container.
    if (IsCancelled(ctx, config, "sandbox start", error)) {
        return "";
    }
    m_engine->StartContainer(response_id, tmpErr);
    if (tmpErr.NotEmpty()) {
        ERROR("Failed to start sandbox container %s: %s", response_id.c_str(), tmpErr.GetCMessage());
        error.Errorf(SANDBOX_START_ERROR, "failed to start sandbox container for pod \"%s\": %s", podName.c_str(),
                     tmpErr.GetCMessage());
        return "";
    }

    // Step 6: Rewrite resolv.conf with the pod dns config.
    if (config.has_dns_config()) {
        if (IsCancelled(ctx, config, "resolv.conf rewrite", error)) {
            return "";
        }
        SetupSandboxFiles(response_id, config, error);
        if (error.NotEmpty()) {
            ERROR("%s", error.GetCMessage());
            return "";
        }
    }

    // Step 7: Setup networking for the sandbox.
    if (IsCancelled(ctx, config, "network setup", error)) {
        return "";
    }
    if (config.linux().security_context().namespace_options().network() == runtime::v1::NamespaceMode::NODE) {
        EVENT("Event: {Object: CRI, Type: Ran pod sandbox %s in host network}", response_id.c_str());
        return response_id;
    }

    SetupSandboxNetwork(config, response_id, ctx, error);
    if (error.NotEmpty()) {
        // the stopped sandbox is still handed back for inspection
        return response_id;
    }

    EVENT("Event: {Object: CRI, Type: Ran pod sandbox %s}", response_id.c_str());
    return response_id;
}
} // namespace podshim
