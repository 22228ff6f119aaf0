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
 * Description: provide sandbox checkpoint store definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CHECKPOINT_MANAGER_H
#define DAEMON_ENTRY_CRI_CHECKPOINT_MANAGER_H

#include <mutex>
#include <string>
#include <vector>

#include "checkpoint_handler.h"
#include "errors.h"

namespace podshim {
class CheckpointManager {
public:
    virtual ~CheckpointManager() = default;

    virtual void CreateCheckpoint(const std::string &id, CRI::PodSandboxCheckpoint &checkpoint, Errors &error) = 0;
    virtual void GetCheckpoint(const std::string &id, CRI::PodSandboxCheckpoint &checkpoint, Errors &error) = 0;
    // removing a missing checkpoint is not an error
    virtual void RemoveCheckpoint(const std::string &id, Errors &error) = 0;
    virtual auto ListCheckpoints(Errors &error) -> std::vector<std::string> = 0;
};

// Keeps one file per sandbox under <rootDir>/sandbox.
class FileCheckpointManager : public CheckpointManager {
public:
    explicit FileCheckpointManager(const std::string &rootDir);
    virtual ~FileCheckpointManager() = default;

    void CreateCheckpoint(const std::string &id, CRI::PodSandboxCheckpoint &checkpoint, Errors &error) override;
    void GetCheckpoint(const std::string &id, CRI::PodSandboxCheckpoint &checkpoint, Errors &error) override;
    void RemoveCheckpoint(const std::string &id, Errors &error) override;
    auto ListCheckpoints(Errors &error) -> std::vector<std::string> override;

    auto GetCheckpointDir() const -> const std::string &;

private:
    auto CheckpointPath(const std::string &id) const -> std::string;

private:
    std::string m_dir;
    std::mutex m_mutex;
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_CHECKPOINT_MANAGER_H
