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
 * Description: c++ common tools.
 * Author: zhangwei
 * Create: 2024-05-20
 ******************************************************************************/
#ifndef UTILS_CPPUTILS_CXXUTILS_H
#define UTILS_CPPUTILS_CXXUTILS_H

#include <sys/types.h>

#include <string>
#include <vector>

#include "errors.h"

namespace CXXUtils {
std::vector<std::string> Split(const std::string &str, char delimiter);

std::string StringsJoin(const std::vector<std::string> &vec, const std::string &sep);

std::string ToLower(const std::string &str);

bool HasPrefix(const std::string &str, const std::string &prefix);

// returns true when str matches the extended POSIX regular expression pattern
bool RegMatch(const std::string &pattern, const std::string &str);

// n random bytes rendered as 2*n lower-case hex characters
std::string RandomHex(size_t n);

auto ReadFile(const std::string &path, Errors &error) -> std::string;

// writes content to a temporary sibling and renames it over path
void AtomicWriteFile(const std::string &path, const std::string &content, mode_t mode, Errors &error);

// truncates and rewrites an existing file in place, a missing file is an error
void RewriteFile(const std::string &path, const std::string &content, Errors &error);

void EnsureDir(const std::string &path, mode_t mode, Errors &error);
} // namespace CXXUtils

#endif // UTILS_CPPUTILS_CXXUTILS_H
