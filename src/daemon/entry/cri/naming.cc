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
 * Create: 2024-05-20
 * Description: provide naming functions
 *********************************************************************************/
#include "naming.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <vector>

#include <isula_libutils/log.h>

#include "cri_constants.h"
#include "cri_helpers.h"
#include "cxxutils.h"

namespace podshim {
namespace CRINaming {
static auto ParseAttempt(const std::string &value, uint32_t &attempt) -> bool
{
    char *end = nullptr;

    if (value.empty()) {
        return false;
    }
    errno = 0;
    unsigned long long v = strtoull(value.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || v > UINT32_MAX) {
        return false;
    }
    attempt = static_cast<uint32_t>(v);
    return true;
}

std::string MakeSandboxName(const runtime::v1::PodSandboxMetadata &metadata)
{
    std::vector<std::string> parts {
        CRI::Constants::kubePrefix, CRI::Constants::sandboxContainerName, metadata.name(),
        metadata.namespace_(), metadata.uid(), std::to_string(metadata.attempt())
    };

    return CXXUtils::StringsJoin(parts, CRI::Constants::nameDelimiter);
}

void ParseSandboxName(const std::string &name, runtime::v1::PodSandboxMetadata &metadata, Errors &err)
{
    std::vector<std::string> items = CXXUtils::Split(name, CRI::Constants::nameDelimiterChar);
    uint32_t attempt = 0;

    if (items.size() != 6) {
        err.Errorf("failed to parse the sandbox name: %s", name.c_str());
        return;
    }

    if (items[0] != CRI::Constants::kubePrefix || items[1] != CRI::Constants::sandboxContainerName) {
        err.Errorf("container is not a sandbox managed by kubernetes: %s", name.c_str());
        return;
    }

    if (!ParseAttempt(items[5], attempt)) {
        ERROR("Failed to parse the attempt of sandbox name %s", name.c_str());
        err.Errorf("failed to parse the sandbox name %s", name.c_str());
        return;
    }

    metadata.set_name(items[2]);
    metadata.set_namespace_(items[3]);
    metadata.set_uid(items[4]);
    metadata.set_attempt(attempt);
}

void ParseSandboxIdentity(const std::string &name, const std::map<std::string, std::string> &annotations,
                          runtime::v1::PodSandboxMetadata &metadata, Errors &err)
{
    auto nameIter = annotations.find(CRIHelpers::Constants::SANDBOX_NAME_ANNOTATION_KEY);
    auto nsIter = annotations.find(CRIHelpers::Constants::SANDBOX_NAMESPACE_ANNOTATION_KEY);
    auto uidIter = annotations.find(CRIHelpers::Constants::SANDBOX_UID_ANNOTATION_KEY);
    auto attemptIter = annotations.find(CRIHelpers::Constants::SANDBOX_ATTEMPT_ANNOTATION_KEY);

    if (nameIter == annotations.end() || nsIter == annotations.end()) {
        err.Errorf("annotations of %s don't contain the sandbox name and namespace", name.c_str());
        return;
    }
    metadata.set_name(nameIter->second);
    metadata.set_namespace_(nsIter->second);

    if (uidIter != annotations.end() && attemptIter != annotations.end()) {
        uint32_t attempt = 0;
        if (!ParseAttempt(attemptIter->second, attempt)) {
            err.Errorf("invalid sandbox attempt annotation %s", attemptIter->second.c_str());
            return;
        }
        metadata.set_uid(uidIter->second);
        metadata.set_attempt(attempt);
        return;
    }

    // containers created without the uid or attempt annotations still carry them in the name
    runtime::v1::PodSandboxMetadata fromName;
    ParseSandboxName(CXXUtils::HasPrefix(name, "/") ? name.substr(1) : name, fromName, err);
    if (err.NotEmpty()) {
        return;
    }
    metadata.set_uid(fromName.uid());
    metadata.set_attempt(fromName.attempt());
}

std::string BuildContainerID(const std::string &runtime, const std::string &id)
{
    return runtime + "://" + id;
}
} // namespace CRINaming
} // namespace podshim
