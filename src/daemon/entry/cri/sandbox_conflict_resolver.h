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
 * Description: provide sandbox creation conflict resolver definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_SANDBOX_CONFLICT_RESOLVER_H
#define DAEMON_ENTRY_CRI_SANDBOX_CONFLICT_RESOLVER_H

#include <memory>
#include <string>

#include "api.pb.h"
#include "container_engine.h"
#include "errors.h"

namespace podshim {
enum class ConflictOutcome {
    NOT_A_CONFLICT,
    RESOLVED_TO_EXISTING,
    RESOLUTION_FAILED,
};

struct ConflictResolution {
    ConflictOutcome outcome { ConflictOutcome::NOT_A_CONFLICT };
    // engine id of the sandbox container, set when resolved
    std::string id;
    // the original create error for NOT_A_CONFLICT, the recovery error for RESOLUTION_FAILED
    Errors error;
};

// Recovers a sandbox create that failed because a previous attempt of the same
// sandbox left a container holding the name.
class SandboxConflictResolver {
public:
    explicit SandboxConflictResolver(std::shared_ptr<ContainerEngine> engine);
    virtual ~SandboxConflictResolver() = default;

    auto Resolve(const SandboxCreationConfig &config, const runtime::v1::PodSandboxMetadata &metadata,
                 const Errors &createErr) -> ConflictResolution;

private:
    auto RecreateWithRandomName(const SandboxCreationConfig &config) -> ConflictResolution;
    auto IsSameSandbox(const ContainerInspectInfo &info, const runtime::v1::PodSandboxMetadata &metadata) -> bool;

private:
    std::shared_ptr<ContainerEngine> m_engine;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_SANDBOX_CONFLICT_RESOLVER_H
