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
 * Description: provide grpc server definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CONNECT_GRPC_GRPC_SERVICE_H
#define DAEMON_ENTRY_CONNECT_GRPC_GRPC_SERVICE_H

#include <memory>
#include <string>

#include <grpc++/grpc++.h>

#include "cri_pod_sandbox_manager_service.h"
#include "cri_v1_runtime_runtime_service.h"
#include "errors.h"

namespace podshim {
class GRPCServerImpl {
public:
    explicit GRPCServerImpl(std::shared_ptr<PodSandboxManagerService> podSandboxManager);
    virtual ~GRPCServerImpl() = default;

    // listen is unix:///path or tcp://host:port
    void Init(const std::string &listen, Errors &err);
    void Wait();
    void Shutdown();

private:
    void ListeningPort(const std::string &listen, Errors &err);

    RuntimeV1RuntimeServiceImpl m_runtimeService;
    grpc::ServerBuilder m_builder;
    std::string m_socketPath;
    std::unique_ptr<grpc::Server> m_server;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CONNECT_GRPC_GRPC_SERVICE_H
