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
 * Create: 2024-05-21
 * Description: provide sandbox checkpoint model definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CHECKPOINT_HANDLER_H
#define DAEMON_ENTRY_CRI_CHECKPOINT_HANDLER_H
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <isula_libutils/cri_checkpoint.h>

#include "errors.h"

namespace podshim {
namespace CRI {
const std::string SANDBOX_CHECKPOINT_DIR { "sandbox" };

class PortMapping {
public:
    PortMapping() = default;
    PortMapping(const std::string &protocol, int32_t containerPort, int32_t hostPort)
        : m_protocol(protocol), m_containerPort(containerPort), m_hostPort(hostPort)
    {
    }

    void PortMappingToCStruct(cri_port_mapping **pmapping, Errors &error) const;
    void CStructToPortMapping(const cri_port_mapping *pmapping);

    auto GetProtocol() const -> const std::string &;
    void SetProtocol(const std::string &protocol);
    auto GetContainerPort() const -> int32_t;
    void SetContainerPort(int32_t containerPort);
    auto GetHostPort() const -> int32_t;
    void SetHostPort(int32_t hostPort);

    bool operator==(const PortMapping &other) const;

private:
    std::string m_protocol;
    int32_t m_containerPort { 0 };
    int32_t m_hostPort { 0 };
};

class CheckpointData {
public:
    void CheckpointDataToCStruct(cri_checkpoint_data **data, Errors &error) const;
    void CStructToCheckpointData(const cri_checkpoint_data *data);

    auto GetPortMappings() const -> const std::vector<PortMapping> &;
    void InsertPortMapping(const PortMapping &portMapping);
    auto GetHostNetwork() const -> bool;
    void SetHostNetwork(bool hostNetwork);

private:
    std::vector<PortMapping> m_portMappings;
    bool m_hostNetwork { false };
};

// Durable projection of a sandbox request, enough to rebuild its identity after a restart.
class PodSandboxCheckpoint {
public:
    PodSandboxCheckpoint() = default;
    ~PodSandboxCheckpoint() = default;
    void CheckpointToCStruct(cri_checkpoint **checkpoint, Errors &error) const;
    void CStructToCheckpoint(const cri_checkpoint *checkpoint);

    auto GetVersion() const -> const std::string &;
    void SetVersion(const std::string &version);
    auto GetName() const -> const std::string &;
    void SetName(const std::string &name);
    auto GetNamespace() const -> const std::string &;
    void SetNamespace(const std::string &ns);
    auto GetData() const -> std::shared_ptr<CheckpointData>;
    void SetData(const std::shared_ptr<CheckpointData> &data);
    auto GetCheckSum() const -> const std::string &;
    void SetCheckSum(const std::string &checkSum);

private:
    std::string m_version { "v1" };
    std::string m_name;
    std::string m_namespace;
    std::shared_ptr<CheckpointData> m_data { nullptr };
    std::string m_checkSum;
};
} // namespace CRI
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_CHECKPOINT_HANDLER_H
