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
 * Create: 2024-05-23
 * Description: error codes reported by pod sandbox provisioning
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_PROVISION_ERRORS_H
#define DAEMON_ENTRY_CRI_PROVISION_ERRORS_H

namespace podshim {
// Set on Errors::SetCode by RunPodSandbox, one per failing stage.
enum ProvisionErrorCode {
    IMAGE_PULL_ERROR = 2001,
    CONFIG_TRANSLATION_ERROR,
    UNKNOWN_RUNTIME_CLASS_ERROR,
    SANDBOX_CREATE_ERROR,
    CHECKPOINT_ERROR,
    SANDBOX_START_ERROR,
    RESOLV_CONF_ERROR,
    // aggregate of the setup failure and any teardown or stop failure
    NETWORK_SETUP_ERROR,
    NETWORK_TEARDOWN_ERROR,
    SANDBOX_STOP_ERROR,
    PROVISION_CANCELLED,
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_PROVISION_ERRORS_H
