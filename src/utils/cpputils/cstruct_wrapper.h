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
 * Create: 2024-05-21
 * Description: owner of isula_libutils generated C structs
 *********************************************************************************/
#ifndef UTILS_CPPUTILS_CSTRUCT_WRAPPER_H
#define UTILS_CPPUTILS_CSTRUCT_WRAPPER_H

#include <memory>
#include <isula_libutils/utils_memory.h>

// Owns one generated C struct and frees it with its free_<type> function.
template<typename T>
class CStructWrapper {
public:
    CStructWrapper(T *ptr, void (*deleter)(T *)) : m_ptr(ptr), m_deleter(deleter) {}
    ~CStructWrapper()
    {
        reset(nullptr);
    }

    CStructWrapper(const CStructWrapper &) = delete;
    CStructWrapper &operator=(const CStructWrapper &) = delete;

    T *get() const
    {
        return m_ptr;
    }

    T *operator->() const
    {
        return m_ptr;
    }

    // gives up ownership
    T *move()
    {
        T *ptr = m_ptr;
        m_ptr = nullptr;
        return ptr;
    }

    void reset(T *ptr)
    {
        if (m_ptr != nullptr && m_deleter != nullptr) {
            m_deleter(m_ptr);
        }
        m_ptr = ptr;
    }

private:
    T *m_ptr;
    void (*m_deleter)(T *);
};

template<typename T>
std::unique_ptr<CStructWrapper<T>> makeUniquePtrCStructWrapper(void (*deleter)(T *))
{
    T *ptr = static_cast<T *>(isula_common_calloc_s(sizeof(T)));
    if (ptr == nullptr) {
        return nullptr;
    }

    return std::unique_ptr<CStructWrapper<T>>(new CStructWrapper<T>(ptr, deleter));
}

template<typename T>
std::unique_ptr<CStructWrapper<T>> makeUniquePtrCStructWrapper(T *ptr, void (*deleter)(T *))
{
    if (ptr == nullptr) {
        return nullptr;
    }
    return std::unique_ptr<CStructWrapper<T>>(new CStructWrapper<T>(ptr, deleter));
}

#endif // UTILS_CPPUTILS_CSTRUCT_WRAPPER_H
