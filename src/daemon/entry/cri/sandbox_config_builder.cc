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
 * Description: provide sandbox creation config builder functions
 *********************************************************************************/
#include "sandbox_config_builder.h"

#include <isula_libutils/log.h>

#include "cri_constants.h"
#include "cri_helpers.h"
#include "cri_security_context.h"
#include "cxxutils.h"
#include "naming.h"

namespace podshim {
static void MakeSandboxLabels(const runtime::v1::PodSandboxConfig &c, const std::string &runtimeHandler,
                              SandboxCreationConfig &config, Errors &error)
{
    config.labels = CRIHelpers::MakeLabels(c.labels(), error);
    if (error.NotEmpty()) {
        return;
    }
    config.labels[CRIHelpers::Constants::CONTAINER_TYPE_LABEL_KEY] = CRIHelpers::Constants::CONTAINER_TYPE_LABEL_SANDBOX;
    // container name label of the infra container
    config.labels[CRIHelpers::Constants::KUBERNETES_CONTAINER_NAME_LABEL] = CRI::Constants::sandboxContainerName;
    config.labels[CRIHelpers::Constants::RUNTIME_HANDLER_LABEL_KEY] = runtimeHandler;
}

static void MakeSandboxAnnotations(const runtime::v1::PodSandboxConfig &c, SandboxCreationConfig &config,
                                   Errors &error)
{
    config.annotations = CRIHelpers::MakeAnnotations(c.annotations(), error);
    if (error.NotEmpty()) {
        return;
    }
    config.annotations[CRIHelpers::Constants::CONTAINER_TYPE_ANNOTATION_KEY] =
        CRIHelpers::Constants::CONTAINER_TYPE_ANNOTATION_SANDBOX;
    config.annotations[CRIHelpers::Constants::SANDBOX_NAMESPACE_ANNOTATION_KEY] = c.metadata().namespace_();
    config.annotations[CRIHelpers::Constants::SANDBOX_NAME_ANNOTATION_KEY] = c.metadata().name();
    config.annotations[CRIHelpers::Constants::SANDBOX_UID_ANNOTATION_KEY] = c.metadata().uid();
    config.annotations[CRIHelpers::Constants::SANDBOX_ATTEMPT_ANNOTATION_KEY] = std::to_string(c.metadata().attempt());
}

static void ApplySandboxLinuxOptions(const runtime::v1::LinuxPodSandboxConfig &lc, SandboxCreationConfig &config,
                                     Errors &error)
{
    CRISecurity::ApplySandboxSecurityContext(lc, config, error);
    if (error.NotEmpty()) {
        return;
    }

    config.cgroupParent = lc.cgroup_parent();

    if (static_cast<size_t>(lc.sysctls_size()) > CRI::Constants::MAX_SYSCTLS) {
        error.Errorf("Too many sysctls, the limit is %zu", CRI::Constants::MAX_SYSCTLS);
        return;
    }
    for (auto iter = lc.sysctls().begin(); iter != lc.sysctls().end(); ++iter) {
        config.sysctls[iter->first] = iter->second;
    }
}

static void MakeSandboxPortBindings(const runtime::v1::PodSandboxConfig &c, SandboxCreationConfig &config)
{
    for (const auto &pm : c.port_mappings()) {
        PortBinding binding;
        binding.protocol = CXXUtils::ToLower(runtime::v1::Protocol_Name(pm.protocol()));
        binding.containerPort = pm.container_port();
        binding.hostPort = pm.host_port();
        binding.hostIP = pm.host_ip();
        config.portBindings.push_back(binding);
    }
}

auto MakeSandboxCreationConfig(const runtime::v1::PodSandboxConfig &c, const std::string &image,
                               const std::string &runtimeHandler, Errors &error) -> SandboxCreationConfig
{
    SandboxCreationConfig config;

    if (!c.has_metadata()) {
        error.SetError("sandbox config is missing metadata");
        return config;
    }
    if (image.empty()) {
        error.SetError("sandbox image is empty");
        return config;
    }

    config.name = CRINaming::MakeSandboxName(c.metadata());
    config.image = image;
    config.runtime = runtimeHandler;

    MakeSandboxLabels(c, runtimeHandler, config, error);
    if (error.NotEmpty()) {
        return config;
    }
    MakeSandboxAnnotations(c, config, error);
    if (error.NotEmpty()) {
        return config;
    }

    config.hostname = c.hostname();

    // a missing linux section still yields the pod network namespace and default seccomp handling
    ApplySandboxLinuxOptions(c.linux(), config, error);
    if (error.NotEmpty()) {
        ERROR("Failed to apply linux options of sandbox %s: %s", config.name.c_str(), error.GetCMessage());
        return config;
    }

    MakeSandboxPortBindings(c, config);

    config.oomScoreAdj = CRI::Constants::PodInfraOOMAdj;
    config.cpuShares = CRI::Constants::DefaultSandboxCPUshares;
    config.memorySwap = CRI::Constants::DefaultMemorySwap;

    return config;
}
} // namespace podshim
