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
 * Description: provide sandbox creation config builder definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_SANDBOX_CONFIG_BUILDER_H
#define DAEMON_ENTRY_CRI_SANDBOX_CONFIG_BUILDER_H

#include <string>

#include "api.pb.h"
#include "container_engine.h"
#include "errors.h"

namespace podshim {
// Translates a pod sandbox config into the engine creation config. No I/O.
auto MakeSandboxCreationConfig(const runtime::v1::PodSandboxConfig &c, const std::string &image,
                               const std::string &runtimeHandler, Errors &error) -> SandboxCreationConfig;
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_SANDBOX_CONFIG_BUILDER_H
