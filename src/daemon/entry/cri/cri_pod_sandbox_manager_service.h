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
 * Description: provide pod sandbox manager service definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_POD_SANDBOX_MANAGER_H
#define DAEMON_ENTRY_CRI_POD_SANDBOX_MANAGER_H
#include <string>

#include "api.pb.h"
#include "errors.h"
#include "request_context.h"

namespace podshim {
class PodSandboxManagerService {
public:
    PodSandboxManagerService() = default;
    virtual ~PodSandboxManagerService() = default;

    // Creates and starts the sandbox of a pod. On a network setup failure the id of
    // the stopped sandbox is returned together with the error.
    virtual auto RunPodSandbox(const runtime::v1::PodSandboxConfig &config, const std::string &runtimeHandler,
                               const RequestContext &ctx, Errors &error) -> std::string = 0;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_POD_SANDBOX_MANAGER_H
