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
 * Create: 2024-05-27
 * Description: provide cri v1 runtime service definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CONNECT_GRPC_CRI_V1_RUNTIME_RUNTIME_SERVICE_H
#define DAEMON_ENTRY_CONNECT_GRPC_CRI_V1_RUNTIME_RUNTIME_SERVICE_H

#include <memory>

#include <grpc++/grpc++.h>

#include "api.grpc.pb.h"
#include "cri_pod_sandbox_manager_service.h"
#include "errors.h"
#include "request_context.h"

namespace podshim {
// Cancellation follows the client, a nullptr context is never cancelled.
class GrpcRequestContext : public RequestContext {
public:
    explicit GrpcRequestContext(grpc::ServerContext *context)
        : m_context(context)
    {
    }
    virtual ~GrpcRequestContext() = default;

    auto IsCancelled() const -> bool override
    {
        return m_context != nullptr && m_context->IsCancelled();
    }

private:
    grpc::ServerContext *m_context;
};

// Implement of runtime RuntimeService
class RuntimeV1RuntimeServiceImpl : public runtime::v1::RuntimeService::Service {
public:
    explicit RuntimeV1RuntimeServiceImpl(std::shared_ptr<PodSandboxManagerService> podSandboxManager);
    virtual ~RuntimeV1RuntimeServiceImpl() = default;

    grpc::Status RunPodSandbox(grpc::ServerContext *context, const runtime::v1::RunPodSandboxRequest *request,
                               runtime::v1::RunPodSandboxResponse *reply) override;

private:
    auto ToGRPCStatus(Errors &err) -> grpc::Status;

    std::shared_ptr<PodSandboxManagerService> m_podSandboxManager;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CONNECT_GRPC_CRI_V1_RUNTIME_RUNTIME_SERVICE_H
