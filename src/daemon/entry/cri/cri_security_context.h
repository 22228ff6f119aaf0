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
 * Description: provide cri security context definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CRI_SECURITY_CONTEXT_H
#define DAEMON_ENTRY_CRI_CRI_SECURITY_CONTEXT_H
#include <string>
#include <vector>

#include "api.pb.h"
#include "container_engine.h"
#include "errors.h"

namespace podshim {
namespace CRISecurity {
void ApplySandboxSecurityContext(const runtime::v1::LinuxPodSandboxConfig &lc, SandboxCreationConfig &config,
                                 Errors &error);

// security options for the sandbox seccomp profile, empty for the runtime default
auto GetSeccompSecurityOpts(const runtime::v1::LinuxSandboxSecurityContext &sc, const char &separator,
                            Errors &error) -> std::vector<std::string>;
} // namespace CRISecurity
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_CRI_SECURITY_CONTEXT_H
