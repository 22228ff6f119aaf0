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
 * Description: provide sandbox checkpoint store functions
 *********************************************************************************/
#include "checkpoint_manager.h"

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <isula_libutils/log.h>

#include "cri_helpers.h"
#include "cxxutils.h"

namespace podshim {
namespace {
const mode_t CHECKPOINT_DIR_MODE = 0700;
const mode_t CHECKPOINT_FILE_MODE = 0600;
}

FileCheckpointManager::FileCheckpointManager(const std::string &rootDir)
    : m_dir(rootDir + "/" + CRI::SANDBOX_CHECKPOINT_DIR)
{
}

auto FileCheckpointManager::GetCheckpointDir() const -> const std::string &
{
    return m_dir;
}

auto FileCheckpointManager::CheckpointPath(const std::string &id) const -> std::string
{
    return m_dir + "/" + id;
}

void FileCheckpointManager::CreateCheckpoint(const std::string &id, CRI::PodSandboxCheckpoint &checkpoint,
                                             Errors &error)
{
    std::string data;

    if (!CRIHelpers::ValidateCheckpointKey(id, error)) {
        return;
    }

    data = CRIHelpers::CreateCheckpoint(checkpoint, error);
    if (error.NotEmpty()) {
        ERROR("Failed to generate checkpoint for %s: %s", id.c_str(), error.GetCMessage());
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    CXXUtils::EnsureDir(m_dir, CHECKPOINT_DIR_MODE, error);
    if (error.NotEmpty()) {
        return;
    }
    CXXUtils::AtomicWriteFile(CheckpointPath(id), data, CHECKPOINT_FILE_MODE, error);
    if (error.NotEmpty()) {
        ERROR("Failed to write checkpoint for %s: %s", id.c_str(), error.GetCMessage());
        return;
    }
    DEBUG("Wrote checkpoint of sandbox %s", id.c_str());
}

void FileCheckpointManager::GetCheckpoint(const std::string &id, CRI::PodSandboxCheckpoint &checkpoint,
                                          Errors &error)
{
    std::string data;

    if (!CRIHelpers::ValidateCheckpointKey(id, error)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        data = CXXUtils::ReadFile(CheckpointPath(id), error);
    }
    if (error.NotEmpty()) {
        return;
    }

    CRIHelpers::GetCheckpoint(data, checkpoint, error);
    if (error.NotEmpty()) {
        ERROR("Failed to load checkpoint of %s: %s", id.c_str(), error.GetCMessage());
    }
}

void FileCheckpointManager::RemoveCheckpoint(const std::string &id, Errors &error)
{
    if (!CRIHelpers::ValidateCheckpointKey(id, error)) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = CheckpointPath(id);
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        SYSERROR("Failed to remove checkpoint %s", path.c_str());
        error.Errorf("failed to remove checkpoint %s: %s", id.c_str(), strerror(errno));
    }
}

auto FileCheckpointManager::ListCheckpoints(Errors &error) -> std::vector<std::string>
{
    std::vector<std::string> ids;
    struct dirent *entry { nullptr };

    std::lock_guard<std::mutex> lock(m_mutex);
    DIR *dir = opendir(m_dir.c_str());
    if (dir == nullptr) {
        if (errno == ENOENT) {
            return ids;
        }
        error.Errorf("failed to open checkpoint directory %s: %s", m_dir.c_str(), strerror(errno));
        return ids;
    }

    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        Errors keyErr;
        // skip dot entries and leftovers of interrupted writes
        if (name == "." || name == ".." || name.find(".tmp-") != std::string::npos) {
            continue;
        }
        if (!CRIHelpers::ValidateCheckpointKey(name, keyErr)) {
            WARN("Ignore invalid checkpoint file %s", name.c_str());
            continue;
        }
        ids.push_back(name);
    }
    (void)closedir(dir);
    return ids;
}
} // namespace podshim
