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
 * Create: 2024-05-22
 * Description: gRPC client of the container engine
 *********************************************************************************/
#include "grpc_engine_client.h"

#include <chrono>

#include <isula_libutils/log.h>

#include "cxxutils.h"

namespace podshim {
namespace {
const std::string UNIX_SOCKET_PREFIX { "unix://" };
const std::string TCP_PREFIX { "tcp://" };
} // namespace

GrpcEngineClient::GrpcEngineClient(const std::string &address, int64_t deadline)
    : m_address(address), m_deadline(deadline)
{
    if (CXXUtils::HasPrefix(m_address, TCP_PREFIX)) {
        m_address = m_address.substr(TCP_PREFIX.length());
    } else if (!CXXUtils::HasPrefix(m_address, UNIX_SOCKET_PREFIX)) {
        m_address = UNIX_SOCKET_PREFIX + m_address;
    }
    m_stub = podshim::engine::EngineService::NewStub(grpc::CreateChannel(m_address,
                                                                         grpc::InsecureChannelCredentials()));
}

GrpcEngineClient::GrpcEngineClient(std::unique_ptr<podshim::engine::EngineService::StubInterface> stub,
                                   int64_t deadline)
    : m_deadline(deadline), m_stub(std::move(stub))
{
}

void GrpcEngineClient::SetDeadline(grpc::ClientContext &context, int64_t extraSecs)
{
    if (m_deadline <= 0) {
        return;
    }
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(m_deadline + extraSecs));
}

void GrpcEngineClient::StatusToError(const std::string &call, const grpc::Status &status, Errors &error)
{
    int code = 0;

    switch (status.error_code()) {
        case grpc::StatusCode::NOT_FOUND:
            code = ENGINE_ERR_NOT_FOUND;
            break;
        case grpc::StatusCode::ALREADY_EXISTS:
            code = ENGINE_ERR_CONFLICT;
            break;
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            code = ENGINE_ERR_UNAVAILABLE;
            break;
        default:
            break;
    }

    ERROR("Engine %s request failed, error_code: %d: %s", call.c_str(), status.error_code(),
          status.error_message().c_str());
    error.Errorf(code, "%s", status.error_message().empty() ? (call + " failed").c_str() :
                 status.error_message().c_str());
}

auto GrpcEngineClient::ImageStatus(const std::string &image, Errors &error) -> bool
{
    grpc::ClientContext context;
    podshim::engine::ImageStatusRequest request;
    podshim::engine::ImageStatusResponse response;

    SetDeadline(context);
    request.set_image(image);
    grpc::Status status = m_stub->ImageStatus(&context, request, &response);
    if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
        DEBUG("Image %s is not present", image.c_str());
        return false;
    }
    if (!status.ok()) {
        StatusToError("image status", status, error);
        return false;
    }
    return true;
}

void GrpcEngineClient::PullImage(const std::string &image, Errors &error)
{
    grpc::ClientContext context;
    podshim::engine::PullImageRequest request;
    podshim::engine::PullImageResponse response;

    // pulls are not bounded by the call deadline
    request.set_image(image);
    grpc::Status status = m_stub->PullImage(&context, request, &response);
    if (!status.ok()) {
        StatusToError("pull image", status, error);
        return;
    }
    if (response.image_ref().empty()) {
        error.Errorf("pull image %s returned an empty reference", image.c_str());
        return;
    }
    INFO("Pulled image %s: %s", image.c_str(), response.image_ref().c_str());
}

void GrpcEngineClient::InitCreateRequest(podshim::engine::CreateContainerRequest &request,
                                         const SandboxCreationConfig &config)
{
    request.set_name(config.name);
    request.set_image(config.image);
    request.set_runtime(config.runtime);
    request.mutable_labels()->insert(config.labels.begin(), config.labels.end());
    request.mutable_annotations()->insert(config.annotations.begin(), config.annotations.end());
    request.set_hostname(config.hostname);
    request.set_cgroup_parent(config.cgroupParent);
    request.mutable_sysctls()->insert(config.sysctls.begin(), config.sysctls.end());
    request.set_network_mode(config.networkMode);
    request.set_uts_mode(config.utsMode);
    request.set_ipc_mode(config.ipcMode);
    request.set_pid_mode(config.pidMode);
    request.set_user(config.user);
    for (const auto gid : config.groupAdd) {
        request.add_group_add(gid);
    }
    request.set_readonly_rootfs(config.readonlyRootfs);
    request.set_privileged(config.privileged);
    for (const auto &opt : config.securityOpt) {
        request.add_security_opt(opt);
    }
    for (const auto &binding : config.portBindings) {
        podshim::engine::PortBinding *pb = request.add_port_bindings();
        pb->set_protocol(binding.protocol);
        pb->set_container_port(binding.containerPort);
        pb->set_host_port(binding.hostPort);
        pb->set_host_ip(binding.hostIP);
    }
    request.set_oom_score_adj(config.oomScoreAdj);
    request.set_cpu_shares(config.cpuShares);
    request.set_memory_swap(config.memorySwap);
}

auto GrpcEngineClient::CreateContainer(const SandboxCreationConfig &config, Errors &error) -> std::string
{
    grpc::ClientContext context;
    podshim::engine::CreateContainerRequest request;
    podshim::engine::CreateContainerResponse response;

    SetDeadline(context);
    InitCreateRequest(request, config);
    grpc::Status status = m_stub->CreateContainer(&context, request, &response);
    if (!status.ok()) {
        StatusToError("create container", status, error);
        return "";
    }
    if (response.id().empty()) {
        error.Errorf("create container %s returned an empty id", config.name.c_str());
        return "";
    }
    return response.id();
}

void GrpcEngineClient::StartContainer(const std::string &id, Errors &error)
{
    grpc::ClientContext context;
    podshim::engine::StartContainerRequest request;
    podshim::engine::StartContainerResponse response;

    SetDeadline(context);
    request.set_id(id);
    grpc::Status status = m_stub->StartContainer(&context, request, &response);
    if (!status.ok()) {
        StatusToError("start container", status, error);
    }
}

void GrpcEngineClient::StopContainer(const std::string &id, int64_t timeout, Errors &error)
{
    grpc::ClientContext context;
    podshim::engine::StopContainerRequest request;
    podshim::engine::StopContainerResponse response;

    // leave room for the grace period on top of the call deadline
    SetDeadline(context, timeout);
    request.set_id(id);
    request.set_timeout(timeout);
    grpc::Status status = m_stub->StopContainer(&context, request, &response);
    if (!status.ok()) {
        StatusToError("stop container", status, error);
    }
}

void GrpcEngineClient::RemoveContainer(const std::string &id, bool force, Errors &error)
{
    grpc::ClientContext context;
    podshim::engine::RemoveContainerRequest request;
    podshim::engine::RemoveContainerResponse response;

    SetDeadline(context);
    request.set_id(id);
    request.set_force(force);
    grpc::Status status = m_stub->RemoveContainer(&context, request, &response);
    if (!status.ok()) {
        StatusToError("remove container", status, error);
    }
}

auto GrpcEngineClient::InspectContainer(const std::string &id, Errors &error) -> std::unique_ptr<ContainerInspectInfo>
{
    grpc::ClientContext context;
    podshim::engine::InspectContainerRequest request;
    podshim::engine::InspectContainerResponse response;

    SetDeadline(context);
    request.set_id(id);
    grpc::Status status = m_stub->InspectContainer(&context, request, &response);
    if (!status.ok()) {
        StatusToError("inspect container", status, error);
        return nullptr;
    }

    std::unique_ptr<ContainerInspectInfo> info(new ContainerInspectInfo);
    info->id = response.id();
    info->name = response.name();
    info->running = response.running();
    info->resolvConfPath = response.resolv_conf_path();
    for (const auto &iter : response.labels()) {
        info->labels[iter.first] = iter.second;
    }
    for (const auto &iter : response.annotations()) {
        info->annotations[iter.first] = iter.second;
    }
    return info;
}
} // namespace podshim
