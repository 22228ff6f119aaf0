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
 * Description: provide err functions
 ********************************************************************************/

#include "errors.h"

#include <cstdarg>
#include <cstdio>

namespace {
auto FormatMessage(const char *fmt, va_list argp) -> std::string
{
    char errbuf[BUFSIZ + 1] { 0 };

    int ret = vsnprintf(errbuf, BUFSIZ, fmt, argp);
    if (ret < 0 || ret >= BUFSIZ) {
        return "Error message is too long";
    }

    return errbuf;
}
} // namespace

Errors::Errors()
{
    m_message.clear();
    m_code = 0;
}

Errors &Errors::operator=(const Errors &other)
{
    if (&other == this) {
        return *this;
    }

    m_message = other.m_message;
    m_code = other.m_code;
    m_causes = other.m_causes;
    return *this;
}

Errors::~Errors()
{
    Clear();
}

void Errors::Clear()
{
    m_message.clear();
    m_code = 0;
    m_causes.clear();
}

std::string &Errors::GetMessage()
{
    return m_message;
}

const char *Errors::GetCMessage() const
{
    return m_message.empty() ? "" : m_message.c_str();
}

int Errors::GetCode() const
{
    return m_code;
}

void Errors::SetCode(int code)
{
    m_code = code;
}

bool Errors::Empty() const
{
    return (m_message.empty() && (m_code == 0));
}

bool Errors::NotEmpty() const
{
    return !Empty();
}

void Errors::SetError(const char *msg)
{
    m_message = msg ? msg : "";
}

void Errors::SetError(const std::string &msg)
{
    m_message = msg;
}

void Errors::SetError(int code, const std::string &msg)
{
    m_code = code;
    m_message = msg;
}

void Errors::AppendError(const std::string &msg)
{
    m_message.append(msg);
}

void Errors::SetAggregate(const std::vector<std::string> &msgs)
{
    std::string result;
    size_t size = msgs.size();

    if (size == 0) {
        return;
    }

    if (size == 1) {
        m_message = msgs[0];
        return;
    }

    result = "[" + msgs[0];
    for (size_t i = 1; i < size; i++) {
        result += " " + msgs[i];
    }
    result += "]";
    m_message = result;
}

void Errors::SetAggregate(int code, const std::vector<Errors> &causes)
{
    std::vector<std::string> msgs;

    if (causes.empty()) {
        return;
    }

    for (const auto &cause : causes) {
        msgs.push_back(cause.GetCMessage());
    }
    SetAggregate(msgs);
    m_code = code;
    m_causes = causes;
}

bool Errors::IsAggregate() const
{
    return !m_causes.empty();
}

const std::vector<Errors> &Errors::GetCauses() const
{
    return m_causes;
}

void Errors::Errorf(const char *fmt, ...)
{
    va_list argp;

    va_start(argp, fmt);
    m_message = FormatMessage(fmt, argp);
    va_end(argp);
}

void Errors::Errorf(int code, const char *fmt, ...)
{
    va_list argp;

    va_start(argp, fmt);
    m_message = FormatMessage(fmt, argp);
    va_end(argp);
    m_code = code;
}
