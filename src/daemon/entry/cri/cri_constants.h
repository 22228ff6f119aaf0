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
#ifndef DAEMON_ENTRY_CRI_CRI_CONSTANTS_H
#define DAEMON_ENTRY_CRI_CRI_CONSTANTS_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace podshim {
namespace CRI {
class Constants {
public:
    const static std::string namespaceModeHost;
    const static std::string namespaceModeNone;
    // sandboxname default values
    const static std::string nameDelimiter;
    constexpr static char nameDelimiterChar { '_' };
    const static std::string kubePrefix;
    const static std::string sandboxContainerName;
    // prefix of the composite container id handed to network plugins
    const static std::string runtimeName;
    const static std::string defaultSandboxImage;
    const static std::string defaultRuntime;

    // infra container defaults
    constexpr static int64_t DefaultMemorySwap { 0 };
    constexpr static int64_t DefaultSandboxCPUshares { 2 };
    constexpr static int64_t PodInfraOOMAdj { -998 };
    // Termination grace period
    constexpr static int64_t DefaultSandboxGracePeriod { 10 };

    constexpr static int MAX_DNS_SEARCHES { 6 };
    constexpr static size_t MAX_SYSCTLS { 1024 };
    constexpr static size_t MAX_LABELS { 1024 };
};
} // namespace CRI
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_CRI_CONSTANTS_H
