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
 * Description: provide read write lock definition
 *********************************************************************************/
#ifndef UTILS_CPPUTILS_READ_WRITE_LOCK_H
#define UTILS_CPPUTILS_READ_WRITE_LOCK_H

#include <condition_variable>
#include <mutex>

// Writer preferring reader/writer lock: once a writer waits, new readers queue behind it.
class RWMutex {
public:
    RWMutex() = default;
    ~RWMutex() = default;
    RWMutex(const RWMutex &) = delete;
    RWMutex(RWMutex &&) = delete;
    RWMutex &operator=(const RWMutex &) = delete;
    RWMutex &operator=(RWMutex &&) = delete;

    void rdlock();
    void wrlock();
    void unlock();

private:
    long m_readers { 0 };
    bool m_writer { false };
    long m_waitingWriters { 0 };
    std::mutex m_mutex;
    std::condition_variable m_readCond;
    std::condition_variable m_writeCond;
};

template<typename RWMutexType>
class ReadGuard {
public:
    explicit ReadGuard(RWMutexType &lock) : m_lock(lock)
    {
        m_lock.rdlock();
    }
    virtual ~ReadGuard()
    {
        m_lock.unlock();
    }

    ReadGuard() = delete;
    ReadGuard(const ReadGuard &) = delete;
    ReadGuard &operator=(const ReadGuard &) = delete;

private:
    RWMutexType &m_lock;
};

template<typename RWMutexType>
class WriteGuard {
public:
    explicit WriteGuard(RWMutexType &lock) : m_lock(lock)
    {
        m_lock.wrlock();
    }
    virtual ~WriteGuard()
    {
        m_lock.unlock();
    }

    WriteGuard() = delete;
    WriteGuard(const WriteGuard &) = delete;
    WriteGuard &operator=(const WriteGuard &) = delete;

private:
    RWMutexType &m_lock;
};

#endif // UTILS_CPPUTILS_READ_WRITE_LOCK_H
