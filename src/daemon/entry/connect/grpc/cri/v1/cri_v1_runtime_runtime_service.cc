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
 * Description: provide cri v1 runtime service functions
 *********************************************************************************/
#include "cri_v1_runtime_runtime_service.h"

#include <isula_libutils/log.h>

#include "provision_errors.h"

namespace podshim {
RuntimeV1RuntimeServiceImpl::RuntimeV1RuntimeServiceImpl(std::shared_ptr<PodSandboxManagerService> podSandboxManager)
    : m_podSandboxManager(podSandboxManager)
{
}

auto RuntimeV1RuntimeServiceImpl::ToGRPCStatus(Errors &err) -> grpc::Status
{
    if (err.Empty()) {
        return grpc::Status::OK;
    }
    if (err.GetCode() == PROVISION_CANCELLED) {
        return grpc::Status(grpc::StatusCode::CANCELLED, err.GetMessage());
    }
    return grpc::Status(grpc::StatusCode::UNKNOWN, err.GetMessage());
}

grpc::Status RuntimeV1RuntimeServiceImpl::RunPodSandbox(grpc::ServerContext *context,
                                                        const runtime::v1::RunPodSandboxRequest *request,
                                                        runtime::v1::RunPodSandboxResponse *reply)
{
    Errors error;

    if (request == nullptr || reply == nullptr) {
        ERROR("Invalid input arguments");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid input arguments");
    }
    if (!request->has_config() || !request->config().has_metadata()) {
        ERROR("Invalid input arguments: sandbox config metadata is required");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "sandbox config metadata is required");
    }

    EVENT("Event: {Object: CRI, Type: Running Pod: %s}", request->config().metadata().name().c_str());

    GrpcRequestContext ctx(context);
    std::string responseID =
        m_podSandboxManager->RunPodSandbox(request->config(), request->runtime_handler(), ctx, error);
    if (error.NotEmpty()) {
        if (!responseID.empty()) {
            ERROR("Object: CRI, Type: Failed to run pod, sandbox %s left stopped: %s", responseID.c_str(),
                  error.GetCMessage());
        } else {
            ERROR("Object: CRI, Type: Failed to run pod: %s", error.GetCMessage());
        }
        return ToGRPCStatus(error);
    }
    if (responseID.empty()) {
        ERROR("Object: CRI, Type: Failed to run pod: empty sandbox id");
        return grpc::Status(grpc::StatusCode::UNKNOWN, "empty sandbox id");
    }
    reply->set_pod_sandbox_id(responseID);

    EVENT("Event: {Object: CRI, Type: Run Pod: %s success}", responseID.c_str());

    return grpc::Status::OK;
}
} // namespace podshim
