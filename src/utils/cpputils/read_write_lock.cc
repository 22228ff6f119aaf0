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
 * Description: provide read write lock implementation
 *********************************************************************************/

#include "read_write_lock.h"

void RWMutex::rdlock()
{
    std::unique_lock<std::mutex> lk(m_mutex);
    m_readCond.wait(lk, [this]() {
        return !m_writer && m_waitingWriters == 0;
    });
    ++m_readers;
}

void RWMutex::wrlock()
{
    std::unique_lock<std::mutex> lk(m_mutex);
    ++m_waitingWriters;
    m_writeCond.wait(lk, [this]() {
        return !m_writer && m_readers == 0;
    });
    --m_waitingWriters;
    m_writer = true;
}

void RWMutex::unlock()
{
    std::lock_guard<std::mutex> lk(m_mutex);

    if (m_writer) {
        m_writer = false;
    } else if (m_readers > 0) {
        --m_readers;
    } else {
        // unbalanced unlock
        return;
    }

    if (m_waitingWriters > 0) {
        if (m_readers == 0) {
            m_writeCond.notify_one();
        }
        return;
    }
    m_readCond.notify_all();
}
