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
 * Description: provide err function definition
 *********************************************************************************/
#ifndef UTILS_CPPUTILS_ERRORS_H
#define UTILS_CPPUTILS_ERRORS_H

#include <string>
#include <vector>

class Errors {
public:
    Errors();
    Errors(const Errors &copy)
        : m_message(copy.m_message), m_code(copy.m_code), m_causes(copy.m_causes)
    {
    }
    Errors &operator=(const Errors &);
    virtual ~Errors();

    void Clear();
    std::string &GetMessage();
    const char *GetCMessage() const;
    int GetCode() const;
    void SetCode(int code);
    bool Empty() const;
    bool NotEmpty() const;

    void AppendError(const std::string &msg);
    void SetError(const std::string &msg);
    void SetError(const char *msg);
    void SetError(int code, const std::string &msg);
    void Errorf(const char *fmt, ...);
    void Errorf(int code, const char *fmt, ...);

    void SetAggregate(const std::vector<std::string> &msgs);
    // keeps every cause in order, the message is rendered from all of them
    void SetAggregate(int code, const std::vector<Errors> &causes);
    bool IsAggregate() const;
    const std::vector<Errors> &GetCauses() const;

private:
    std::string m_message;
    int m_code { 0 };
    std::vector<Errors> m_causes;
};

#endif // UTILS_CPPUTILS_ERRORS_H
