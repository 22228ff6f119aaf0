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
 * Description: provide cri constants definition
 *********************************************************************************/
#include "cri_constants.h"

namespace podshim {
namespace CRI {
const std::string Constants::namespaceModeHost { "host" };
const std::string Constants::namespaceModeNone { "none" };
const std::string Constants::nameDelimiter { "_" };
const std::string Constants::kubePrefix { "k8s" };
const std::string Constants::sandboxContainerName { "POD" };
const std::string Constants::runtimeName { "podshim" };
const std::string Constants::defaultSandboxImage { "registry.k8s.io/pause:3.9" };
const std::string Constants::defaultRuntime { "runc" };
} // namespace CRI
} // namespace podshim
