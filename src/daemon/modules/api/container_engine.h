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
 * Description: container engine interface used by the pod sandbox service
 *********************************************************************************/
#ifndef DAEMON_MODULES_API_CONTAINER_ENGINE_H
#define DAEMON_MODULES_API_CONTAINER_ENGINE_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "errors.h"

namespace podshim {
// Error codes an engine sets on Errors, callers classify failures by code and never by message text.
enum EngineErrorCode {
    ENGINE_ERR_NOT_FOUND = 1001,
    ENGINE_ERR_CONFLICT = 1002,
    ENGINE_ERR_UNAVAILABLE = 1003,
};

struct PortBinding {
    std::string protocol;
    int32_t containerPort { 0 };
    int32_t hostPort { 0 };
    std::string hostIP;
};

// Engine native description of a sandbox container.
struct SandboxCreationConfig {
    std::string name;
    std::string image;
    std::string runtime;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
    std::string hostname;
    std::string cgroupParent;
    std::map<std::string, std::string> sysctls;
    std::string networkMode;
    std::string utsMode;
    std::string ipcMode;
    std::string pidMode;
    std::string user;
    std::vector<int64_t> groupAdd;
    bool readonlyRootfs { false };
    bool privileged { false };
    std::vector<std::string> securityOpt;
    std::vector<PortBinding> portBindings;
    int64_t oomScoreAdj { 0 };
    int64_t cpuShares { 0 };
    int64_t memorySwap { 0 };
};

struct ContainerInspectInfo {
    std::string id;
    std::string name;
    bool running { false };
    std::string resolvConfPath;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
};

class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    // true when the image is present locally. An absent image is not an error.
    virtual auto ImageStatus(const std::string &image, Errors &error) -> bool = 0;

    virtual void PullImage(const std::string &image, Errors &error) = 0;

    // returns the engine id of the new container
    virtual auto CreateContainer(const SandboxCreationConfig &config, Errors &error) -> std::string = 0;

    virtual void StartContainer(const std::string &id, Errors &error) = 0;

    virtual void StopContainer(const std::string &id, int64_t timeout, Errors &error) = 0;

    virtual void RemoveContainer(const std::string &id, bool force, Errors &error) = 0;

    virtual auto InspectContainer(const std::string &id, Errors &error) -> std::unique_ptr<ContainerInspectInfo> = 0;
};
} // namespace podshim

#endif // DAEMON_MODULES_API_CONTAINER_ENGINE_H
