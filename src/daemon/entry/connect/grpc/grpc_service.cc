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
 * Description: provide grpc server functions
 *********************************************************************************/
#include "grpc_service.h"

#include <cerrno>
#include <unistd.h>

#include <isula_libutils/log.h>

#include "cxxutils.h"

namespace podshim {
namespace {
const std::string UNIX_SOCKET_PREFIX { "unix://" };
const std::string TCP_SOCKET_PREFIX { "tcp://" };
}

GRPCServerImpl::GRPCServerImpl(std::shared_ptr<PodSandboxManagerService> podSandboxManager)
    : m_runtimeService(podSandboxManager)
{
}

void GRPCServerImpl::ListeningPort(const std::string &listen, Errors &err)
{
    std::string address = listen;

    if (CXXUtils::HasPrefix(listen, UNIX_SOCKET_PREFIX)) {
        m_socketPath = listen.substr(UNIX_SOCKET_PREFIX.length());
        // a stale socket of a previous run blocks the bind
        if (unlink(m_socketPath.c_str()) < 0 && errno != ENOENT) {
            SYSWARN("Failed to remove stale socket '%s'.", m_socketPath.c_str());
        }
    } else if (CXXUtils::HasPrefix(listen, TCP_SOCKET_PREFIX)) {
        address = listen.substr(TCP_SOCKET_PREFIX.length());
    } else {
        err.Errorf("unsupported listen address %s", listen.c_str());
        return;
    }

    m_builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    INFO("Server listening on %s", listen.c_str());
}

void GRPCServerImpl::Init(const std::string &listen, Errors &err)
{
    if (listen.empty()) {
        err.SetError("podshim listen address is empty");
        return;
    }

    ListeningPort(listen, err);
    if (err.NotEmpty()) {
        ERROR("Listening GRPC port failed: %s", err.GetCMessage());
        return;
    }

    m_builder.RegisterService(&m_runtimeService);

    m_server = m_builder.BuildAndStart();
    if (m_server == nullptr) {
        ERROR("Failed to build and start grpc m_server");
        err.SetError("failed to build and start grpc server");
    }
}

void GRPCServerImpl::Wait()
{
    if (m_server != nullptr) {
        m_server->Wait();
    }
}

void GRPCServerImpl::Shutdown()
{
    if (m_server != nullptr) {
        m_server->Shutdown();
    }

    // remove the socket file on shutdown
    if (!m_socketPath.empty() && unlink(m_socketPath.c_str()) < 0 && errno != ENOENT) {
        SYSWARN("Failed to remove '%s'.", m_socketPath.c_str());
    }
}
} // namespace podshim
