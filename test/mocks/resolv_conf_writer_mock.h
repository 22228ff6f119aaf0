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
 * Description: provide resolv.conf writer mock
 ******************************************************************************/

#ifndef _PODSHIM_TEST_MOCKS_RESOLV_CONF_WRITER_MOCK_H
#define _PODSHIM_TEST_MOCKS_RESOLV_CONF_WRITER_MOCK_H

#include <gmock/gmock.h>

#include "resolv_conf.h"

namespace podshim {
class MockResolvConfWriter : public ResolvConfWriter {
public:
    MockResolvConfWriter() = default;
    virtual ~MockResolvConfWriter() = default;

    MOCK_METHOD5(Rewrite, void(const std::string &path, const std::vector<std::string> &servers,
                               const std::vector<std::string> &searches, const std::vector<std::string> &options,
                               Errors &error));
};
} // namespace podshim

#endif
