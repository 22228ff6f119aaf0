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
 * Description: provide naming function definition
 *********************************************************************************/

#ifndef DAEMON_ENTRY_CRI_NAMING_H
#define DAEMON_ENTRY_CRI_NAMING_H

#include <map>
#include <string>

#include "api.pb.h"
#include "errors.h"

namespace podshim {
namespace CRINaming {
// k8s_POD_<name>_<namespace>_<uid>_<attempt>
std::string MakeSandboxName(const runtime::v1::PodSandboxMetadata &metadata);

void ParseSandboxName(const std::string &name, runtime::v1::PodSandboxMetadata &metadata, Errors &err);

// reads the sandbox identity annotations, falls back to the container name for uid and attempt
void ParseSandboxIdentity(const std::string &name, const std::map<std::string, std::string> &annotations,
                          runtime::v1::PodSandboxMetadata &metadata, Errors &err);

// <runtime>://<id>
std::string BuildContainerID(const std::string &runtime, const std::string &id);
} // namespace CRINaming
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_NAMING_H
