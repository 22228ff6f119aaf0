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
 * Description: provide sandbox checkpoint model functions
 *********************************************************************************/
#include "checkpoint_handler.h"

#include <cstdint>
#include <cstdlib>

#include <isula_libutils/log.h>
#include <isula_libutils/utils_memory.h>

namespace podshim {
namespace CRI {
auto PortMapping::GetProtocol() const -> const std::string &
{
    return m_protocol;
}

void PortMapping::SetProtocol(const std::string &protocol)
{
    m_protocol = protocol;
}

auto PortMapping::GetContainerPort() const -> int32_t
{
    return m_containerPort;
}

void PortMapping::SetContainerPort(int32_t containerPort)
{
    m_containerPort = containerPort;
}

auto PortMapping::GetHostPort() const -> int32_t
{
    return m_hostPort;
}

void PortMapping::SetHostPort(int32_t hostPort)
{
    m_hostPort = hostPort;
}

bool PortMapping::operator==(const PortMapping &other) const
{
    return m_protocol == other.m_protocol && m_containerPort == other.m_containerPort &&
           m_hostPort == other.m_hostPort;
}

void PortMapping::PortMappingToCStruct(cri_port_mapping **pmapping, Errors &error) const
{
    cri_port_mapping *mapping { nullptr };

    if (pmapping == nullptr) {
        return;
    }

    mapping = static_cast<cri_port_mapping *>(isula_common_calloc_s(sizeof(cri_port_mapping)));
    if (mapping == nullptr) {
        error.SetError("Out of memory");
        return;
    }
    mapping->protocol = isula_strdup_s(m_protocol.c_str());
    mapping->container_port = static_cast<int32_t *>(isula_common_calloc_s(sizeof(int32_t)));
    mapping->host_port = static_cast<int32_t *>(isula_common_calloc_s(sizeof(int32_t)));
    if (mapping->container_port == nullptr || mapping->host_port == nullptr) {
        error.SetError("Out of memory");
        free_cri_port_mapping(mapping);
        return;
    }
    *(mapping->container_port) = m_containerPort;
    *(mapping->host_port) = m_hostPort;

    *pmapping = mapping;
}

void PortMapping::CStructToPortMapping(const cri_port_mapping *pmapping)
{
    if (pmapping == nullptr) {
        return;
    }
    if (pmapping->protocol != nullptr) {
        m_protocol = pmapping->protocol;
    }
    if (pmapping->container_port != nullptr) {
        m_containerPort = *(pmapping->container_port);
    }
    if (pmapping->host_port != nullptr) {
        m_hostPort = *(pmapping->host_port);
    }
}

auto CheckpointData::GetPortMappings() const -> const std::vector<PortMapping> &
{
    return m_portMappings;
}

void CheckpointData::InsertPortMapping(const PortMapping &portMapping)
{
    m_portMappings.push_back(portMapping);
}

auto CheckpointData::GetHostNetwork() const -> bool
{
    return m_hostNetwork;
}

void CheckpointData::SetHostNetwork(bool hostNetwork)
{
    m_hostNetwork = hostNetwork;
}

void CheckpointData::CheckpointDataToCStruct(cri_checkpoint_data **data, Errors &error) const
{
    cri_checkpoint_data *out { nullptr };
    size_t len = m_portMappings.size();

    if (data == nullptr) {
        return;
    }

    out = static_cast<cri_checkpoint_data *>(isula_common_calloc_s(sizeof(cri_checkpoint_data)));
    if (out == nullptr) {
        error.SetError("Out of memory");
        return;
    }
    out->host_network = m_hostNetwork;

    if (len > 0) {
        if (len > SIZE_MAX / sizeof(cri_port_mapping *)) {
            error.SetError("Invalid port mapping size");
            goto err_out;
        }
        out->port_mappings = static_cast<cri_port_mapping **>(isula_common_calloc_s(sizeof(cri_port_mapping *) * len));
        if (out->port_mappings == nullptr) {
            error.SetError("Out of memory");
            goto err_out;
        }
        for (const auto &mapping : m_portMappings) {
            cri_port_mapping *tmp { nullptr };
            mapping.PortMappingToCStruct(&tmp, error);
            if (error.NotEmpty()) {
                goto err_out;
            }
            out->port_mappings[out->port_mappings_len++] = tmp;
        }
    }

    *data = out;
    return;

err_out:
    free_cri_checkpoint_data(out);
}

void CheckpointData::CStructToCheckpointData(const cri_checkpoint_data *data)
{
    if (data == nullptr) {
        return;
    }

    m_hostNetwork = data->host_network;
    m_portMappings.clear();
    for (size_t i = 0; data->port_mappings != nullptr && i < data->port_mappings_len; i++) {
        PortMapping mapping;
        mapping.CStructToPortMapping(data->port_mappings[i]);
        m_portMappings.push_back(mapping);
    }
}

auto PodSandboxCheckpoint::GetVersion() const -> const std::string &
{
    return m_version;
}

void PodSandboxCheckpoint::SetVersion(const std::string &version)
{
    m_version = version;
}

auto PodSandboxCheckpoint::GetName() const -> const std::string &
{
    return m_name;
}

void PodSandboxCheckpoint::SetName(const std::string &name)
{
    m_name = name;
}

auto PodSandboxCheckpoint::GetNamespace() const -> const std::string &
{
    return m_namespace;
}

void PodSandboxCheckpoint::SetNamespace(const std::string &ns)
{
    m_namespace = ns;
}

auto PodSandboxCheckpoint::GetData() const -> std::shared_ptr<CheckpointData>
{
    return m_data;
}

void PodSandboxCheckpoint::SetData(const std::shared_ptr<CheckpointData> &data)
{
    m_data = data;
}

auto PodSandboxCheckpoint::GetCheckSum() const -> const std::string &
{
    return m_checkSum;
}

void PodSandboxCheckpoint::SetCheckSum(const std::string &checkSum)
{
    m_checkSum = checkSum;
}

void PodSandboxCheckpoint::CheckpointToCStruct(cri_checkpoint **checkpoint, Errors &error) const
{
    cri_checkpoint *out { nullptr };

    if (checkpoint == nullptr) {
        return;
    }

    out = static_cast<cri_checkpoint *>(isula_common_calloc_s(sizeof(cri_checkpoint)));
    if (out == nullptr) {
        error.SetError("Out of memory");
        return;
    }

    if (m_data != nullptr) {
        m_data->CheckpointDataToCStruct(&out->data, error);
        if (error.NotEmpty()) {
            ERROR("Failed to convert checkpoint data of %s: %s", m_name.c_str(), error.GetCMessage());
            free_cri_checkpoint(out);
            return;
        }
    }

    out->version = isula_strdup_s(m_version.c_str());
    out->name = isula_strdup_s(m_name.c_str());
    out->ns = isula_strdup_s(m_namespace.c_str());
    if (!m_checkSum.empty()) {
        out->checksum = isula_strdup_s(m_checkSum.c_str());
    }

    *checkpoint = out;
}

void PodSandboxCheckpoint::CStructToCheckpoint(const cri_checkpoint *checkpoint)
{
    if (checkpoint == nullptr) {
        return;
    }

    if (checkpoint->data != nullptr) {
        m_data = std::make_shared<CheckpointData>();
        m_data->CStructToCheckpointData(checkpoint->data);
    }
    if (checkpoint->version != nullptr) {
        m_version = checkpoint->version;
    }
    if (checkpoint->name != nullptr) {
        m_name = checkpoint->name;
    }
    if (checkpoint->ns != nullptr) {
        m_namespace = checkpoint->ns;
    }
    if (checkpoint->checksum != nullptr) {
        m_checkSum = checkpoint->checksum;
    }
}
} // namespace CRI
} // namespace podshim
