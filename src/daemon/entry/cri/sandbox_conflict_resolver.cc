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
 * Description: provide sandbox creation conflict resolver functions
 *********************************************************************************/
#include "sandbox_conflict_resolver.h"

#include <isula_libutils/log.h>

#include "cri_constants.h"
#include "cxxutils.h"
#include "naming.h"

namespace podshim {
namespace {
const size_t RANDOM_NAME_SUFFIX_BYTES = 4;
}

SandboxConflictResolver::SandboxConflictResolver(std::shared_ptr<ContainerEngine> engine)
    : m_engine(engine)
{
}

auto SandboxConflictResolver::IsSameSandbox(const ContainerInspectInfo &info,
                                            const runtime::v1::PodSandboxMetadata &metadata) -> bool
{
    runtime::v1::PodSandboxMetadata holder;
    Errors err;

    CRINaming::ParseSandboxIdentity(info.name, info.annotations, holder, err);
    if (err.NotEmpty()) {
        WARN("Container %s holding the sandbox name is not a sandbox: %s", info.id.c_str(), err.GetCMessage());
        return false;
    }

    return holder.name() == metadata.name() && holder.namespace_() == metadata.namespace_() &&
           holder.uid() == metadata.uid() && holder.attempt() == metadata.attempt();
}

// Removal raced with someone else, the name may still be reserved by the engine.
auto SandboxConflictResolver::RecreateWithRandomName(const SandboxCreationConfig &config) -> ConflictResolution
{
    SandboxCreationConfig randomized = config;
    ConflictResolution result;
    Errors createErr;

    randomized.name = config.name + CRI::Constants::nameDelimiter + CXXUtils::RandomHex(RANDOM_NAME_SUFFIX_BYTES);
    WARN("Create sandbox %s again with randomized name %s", config.name.c_str(), randomized.name.c_str());

    result.id = m_engine->CreateContainer(randomized, createErr);
    if (createErr.NotEmpty()) {
        result.outcome = ConflictOutcome::RESOLUTION_FAILED;
        result.id.clear();
        result.error.Errorf(createErr.GetCode(), "failed to create sandbox %s with randomized name: %s",
                            config.name.c_str(), createErr.GetCMessage());
        return result;
    }
    result.outcome = ConflictOutcome::RESOLVED_TO_EXISTING;
    return result;
}

auto SandboxConflictResolver::Resolve(const SandboxCreationConfig &config,
                                      const runtime::v1::PodSandboxMetadata &metadata,
                                      const Errors &createErr) -> ConflictResolution
{
    ConflictResolution result;
    Errors err;

    if (createErr.GetCode() != ENGINE_ERR_CONFLICT) {
        result.outcome = ConflictOutcome::NOT_A_CONFLICT;
        result.error = createErr;
        return result;
    }

    WARN("Sandbox name %s is in use, try to recover from the creation conflict", config.name.c_str());

    std::unique_ptr<ContainerInspectInfo> holder = m_engine->InspectContainer(config.name, err);
    if (err.NotEmpty() || holder == nullptr) {
        if (err.GetCode() == ENGINE_ERR_NOT_FOUND) {
            return RecreateWithRandomName(config);
        }
        result.outcome = ConflictOutcome::RESOLUTION_FAILED;
        result.error.Errorf(err.GetCode(), "failed to inspect conflicting container %s: %s", config.name.c_str(),
                            err.NotEmpty() ? err.GetCMessage() : "no inspect data");
        return result;
    }

    if (!IsSameSandbox(*holder, metadata)) {
        result.outcome = ConflictOutcome::RESOLUTION_FAILED;
        result.error.Errorf(ENGINE_ERR_CONFLICT, "name %s is held by container %s of another sandbox",
                            config.name.c_str(), holder->id.c_str());
        return result;
    }

    if (holder->running) {
        result.outcome = ConflictOutcome::RESOLUTION_FAILED;
        result.error.Errorf(ENGINE_ERR_CONFLICT, "container %s of sandbox %s is still running", holder->id.c_str(),
                            config.name.c_str());
        return result;
    }

    INFO("Remove leftover sandbox container %s of a previous attempt", holder->id.c_str());
    m_engine->RemoveContainer(holder->id, true, err);
    if (err.NotEmpty()) {
        if (err.GetCode() == ENGINE_ERR_NOT_FOUND) {
            return RecreateWithRandomName(config);
        }
        result.outcome = ConflictOutcome::RESOLUTION_FAILED;
        result.error.Errorf(err.GetCode(), "failed to remove conflicting container %s: %s", holder->id.c_str(),
                            err.GetCMessage());
        return result;
    }

    Errors recreateErr;
    result.id = m_engine->CreateContainer(config, recreateErr);
    if (recreateErr.NotEmpty()) {
        result.outcome = ConflictOutcome::RESOLUTION_FAILED;
        result.id.clear();
        result.error.Errorf(recreateErr.GetCode(), "failed to create sandbox %s after removing %s: %s",
                            config.name.c_str(), holder->id.c_str(), recreateErr.GetCMessage());
        return result;
    }

    result.outcome = ConflictOutcome::RESOLVED_TO_EXISTING;
    return result;
}
} // namespace podshim
