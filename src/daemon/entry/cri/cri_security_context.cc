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
 * Description: provide cri security context functions
 *********************************************************************************/
#include "cri_security_context.h"

#include <isula_libutils/log.h>

#include "cri_constants.h"
#include "cxxutils.h"

namespace podshim {
namespace CRISecurity {
namespace {
const std::string SECCOMP_UNCONFINED { "unconfined" };
const std::string SECCOMP_RUNTIME_DEFAULT { "runtime/default" };
const std::string SECCOMP_DOCKER_DEFAULT { "docker/default" };
const std::string SECCOMP_LOCALHOST_PREFIX { "localhost/" };
}

static auto SeccompOpt(const std::string &value, const char &separator) -> std::string
{
    return std::string("seccomp") + separator + value;
}

static auto LocalhostSeccompOpts(const std::string &path, const char &separator, Errors &error)
-> std::vector<std::string>
{
    if (path.empty() || path[0] != '/') {
        error.Errorf("seccomp localhost profile must be an absolute path: \"%s\"", path.c_str());
        return {};
    }
    return { SeccompOpt(path, separator) };
}

auto GetSeccompSecurityOpts(const runtime::v1::LinuxSandboxSecurityContext &sc, const char &separator,
                            Errors &error) -> std::vector<std::string>
{
    if (sc.has_seccomp()) {
        switch (sc.seccomp().profile_type()) {
            case runtime::v1::SecurityProfile::Unconfined:
                return { SeccompOpt(SECCOMP_UNCONFINED, separator) };
            case runtime::v1::SecurityProfile::RuntimeDefault:
                return {};
            case runtime::v1::SecurityProfile::Localhost:
                return LocalhostSeccompOpts(sc.seccomp().localhost_ref(), separator, error);
            default:
                error.Errorf("unknown seccomp profile type %d", static_cast<int>(sc.seccomp().profile_type()));
                return {};
        }
    }

    // deprecated string form
    const std::string &profile = sc.seccomp_profile_path();
    if (profile.empty() || profile == SECCOMP_UNCONFINED) {
        return { SeccompOpt(SECCOMP_UNCONFINED, separator) };
    }
    if (profile == SECCOMP_RUNTIME_DEFAULT || profile == SECCOMP_DOCKER_DEFAULT) {
        return {};
    }
    if (CXXUtils::HasPrefix(profile, SECCOMP_LOCALHOST_PREFIX)) {
        return LocalhostSeccompOpts(profile.substr(SECCOMP_LOCALHOST_PREFIX.length()), separator, error);
    }

    error.Errorf("unknown seccomp profile option: %s", profile.c_str());
    return {};
}

static void ModifySandboxNamespaceOptions(const runtime::v1::NamespaceOption &nsOpts, SandboxCreationConfig &config,
                                          Errors &error)
{
    if (nsOpts.network() == runtime::v1::NamespaceMode::TARGET || nsOpts.pid() == runtime::v1::NamespaceMode::TARGET ||
        nsOpts.ipc() == runtime::v1::NamespaceMode::TARGET) {
        error.SetError("target namespace mode is not supported for a pod sandbox");
        return;
    }

    if (nsOpts.pid() == runtime::v1::NamespaceMode::NODE) {
        config.pidMode = CRI::Constants::namespaceModeHost;
    }
    if (nsOpts.ipc() == runtime::v1::NamespaceMode::NODE) {
        config.ipcMode = CRI::Constants::namespaceModeHost;
    }

    if (nsOpts.network() == runtime::v1::NamespaceMode::NODE) {
        config.networkMode = CRI::Constants::namespaceModeHost;
        config.utsMode = CRI::Constants::namespaceModeHost;
    } else {
        // the network plugin owns the pod network namespace
        config.networkMode = CRI::Constants::namespaceModeNone;
    }
}

static void ModifySandboxUser(const runtime::v1::LinuxSandboxSecurityContext &sc, SandboxCreationConfig &config,
                              Errors &error)
{
    if (sc.has_run_as_group() && !sc.has_run_as_user()) {
        error.SetError("runAsGroup is specified without a runAsUser");
        return;
    }
    if (!sc.has_run_as_user()) {
        return;
    }

    config.user = std::to_string(sc.run_as_user().value());
    if (sc.has_run_as_group()) {
        config.user += ":" + std::to_string(sc.run_as_group().value());
    }
}

void ApplySandboxSecurityContext(const runtime::v1::LinuxPodSandboxConfig &lc, SandboxCreationConfig &config,
                                 Errors &error)
{
    const runtime::v1::LinuxSandboxSecurityContext &sc = lc.security_context();

    ModifySandboxUser(sc, config, error);
    if (error.NotEmpty()) {
        return;
    }

    for (const auto &group : sc.supplemental_groups()) {
        config.groupAdd.push_back(group);
    }
    config.readonlyRootfs = sc.readonly_rootfs();
    config.privileged = sc.privileged();

    ModifySandboxNamespaceOptions(sc.namespace_options(), config, error);
    if (error.NotEmpty()) {
        return;
    }

    std::vector<std::string> seccompOpts = GetSeccompSecurityOpts(sc, '=', error);
    if (error.NotEmpty()) {
        ERROR("Failed to generate seccomp security options: %s", error.GetCMessage());
        return;
    }
    config.securityOpt.insert(config.securityOpt.end(), seccompOpts.begin(), seccompOpts.end());
}
} // namespace CRISecurity
} // namespace podshim
