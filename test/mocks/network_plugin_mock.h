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
 * Create: 2024-06-03
 * Description: provide network plugin mock
 ******************************************************************************/

#ifndef _PODSHIM_TEST_MOCKS_NETWORK_PLUGIN_MOCK_H
#define _PODSHIM_TEST_MOCKS_NETWORK_PLUGIN_MOCK_H

#include <gmock/gmock.h>

#include "network_plugin.h"

namespace podshim {
// Name() returns a reference, tests must set it up with ReturnRef.
class MockNetworkPlugin : public Network::NetworkPlugin {
public:
    MockNetworkPlugin() = default;
    virtual ~MockNetworkPlugin() = default;

    MOCK_METHOD1(Init, void(Errors &error));
    MOCK_CONST_METHOD0(Name, const std::string &());
    MOCK_METHOD6(SetUpPod, void(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                                const std::map<std::string, std::string> &annotations,
                                const std::map<std::string, std::string> &options, Errors &error));
    MOCK_METHOD4(TearDownPod, void(const std::string &ns, const std::string &name, const std::string &podSandboxID,
                                   Errors &error));
    MOCK_METHOD1(Status, void(Errors &error));
};
} // namespace podshim

#endif
