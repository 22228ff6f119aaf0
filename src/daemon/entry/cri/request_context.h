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
 * Description: provide request context definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_REQUEST_CONTEXT_H
#define DAEMON_ENTRY_CRI_REQUEST_CONTEXT_H

#include <atomic>

namespace podshim {
// Carries the cancellation state of one CRI request.
class RequestContext {
public:
    virtual ~RequestContext() = default;
    virtual auto IsCancelled() const -> bool = 0;
};

class CancellableRequestContext : public RequestContext {
public:
    CancellableRequestContext() = default;
    virtual ~CancellableRequestContext() = default;

    auto IsCancelled() const -> bool override
    {
        return m_cancelled.load();
    }

    void Cancel()
    {
        m_cancelled.store(true);
    }

private:
    std::atomic<bool> m_cancelled { false };
};
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_REQUEST_CONTEXT_H
