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
#ifndef DAEMON_MODULES_ENGINE_GRPC_ENGINE_CLIENT_H
#define DAEMON_MODULES_ENGINE_GRPC_ENGINE_CLIENT_H

#include <memory>
#include <string>

#include <grpc++/grpc++.h>

#include "engine.grpc.pb.h"
#include "container_engine.h"

namespace podshim {
class GrpcEngineClient : public ContainerEngine {
public:
    GrpcEngineClient(const std::string &address, int64_t deadline);
    // takes an already built stub, used by tests
    GrpcEngineClient(std::unique_ptr<podshim::engine::EngineService::StubInterface> stub, int64_t deadline);
    ~GrpcEngineClient() override = default;

    auto ImageStatus(const std::string &image, Errors &error) -> bool override;

    void PullImage(const std::string &image, Errors &error) override;

    auto CreateContainer(const SandboxCreationConfig &config, Errors &error) -> std::string override;

    void StartContainer(const std::string &id, Errors &error) override;

    void StopContainer(const std::string &id, int64_t timeout, Errors &error) override;

    void RemoveContainer(const std::string &id, bool force, Errors &error) override;

    auto InspectContainer(const std::string &id, Errors &error) -> std::unique_ptr<ContainerInspectInfo> override;

private:
    void SetDeadline(grpc::ClientContext &context, int64_t extraSecs = 0);
    void InitCreateRequest(podshim::engine::CreateContainerRequest &request, const SandboxCreationConfig &config);
    void StatusToError(const std::string &call, const grpc::Status &status, Errors &error);

    std::string m_address;
    int64_t m_deadline;
    std::unique_ptr<podshim::engine::EngineService::StubInterface> m_stub;
};
} // namespace podshim

#endif // DAEMON_MODULES_ENGINE_GRPC_ENGINE_CLIENT_H
