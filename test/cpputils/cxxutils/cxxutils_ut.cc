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
 * Description: cxxutils unit test
 ******************************************************************************/

#include <cstdio>
#include <cstdlib>
#include <sys/stat.h>

#include <gtest/gtest.h>

#include "cxxutils.h"

TEST(CxxUtilsUnitTest, SplitAndJoin)
{
    std::vector<std::string> parts = CXXUtils::Split("k8s_POD_web__0", '_');

    ASSERT_EQ(parts.size(), 5U);
    EXPECT_EQ(parts[3], "");
    EXPECT_EQ(CXXUtils::StringsJoin(parts, "_"), "k8s_POD_web__0");
    EXPECT_EQ(CXXUtils::StringsJoin({}, ","), "");
}

TEST(CxxUtilsUnitTest, Strings)
{
    EXPECT_EQ(CXXUtils::ToLower("SCTP"), "sctp");
    EXPECT_TRUE(CXXUtils::HasPrefix("unix:///run/podshim.sock", "unix://"));
    EXPECT_FALSE(CXXUtils::HasPrefix("unix", "unix://"));
    EXPECT_TRUE(CXXUtils::RegMatch("^[a-z0-9]+$", "abc123"));
    EXPECT_FALSE(CXXUtils::RegMatch("^[a-z0-9]+$", "abc/123"));
}

TEST(CxxUtilsUnitTest, RandomHex)
{
    std::string first = CXXUtils::RandomHex(4);
    std::string second = CXXUtils::RandomHex(4);

    EXPECT_EQ(first.size(), 8U);
    EXPECT_TRUE(CXXUtils::RegMatch("^[0-9a-f]+$", first));
    EXPECT_NE(first, second);
}

TEST(CxxUtilsUnitTest, FileHelpers)
{
    Errors err;
    Errors missingErr;
    char tmpl[] = "/tmp/podshim-cxxutils-XXXXXX";
    char *dir = mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    std::string nested = std::string(dir) + "/a/b";
    struct stat st;

    CXXUtils::EnsureDir(nested, 0700, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    ASSERT_EQ(stat(nested.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));

    CXXUtils::AtomicWriteFile(nested + "/data", "first", 0600, err);
    CXXUtils::AtomicWriteFile(nested + "/data", "second", 0600, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(CXXUtils::ReadFile(nested + "/data", err), "second");

    CXXUtils::RewriteFile(nested + "/data", "3rd", err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(CXXUtils::ReadFile(nested + "/data", err), "3rd");

    (void)CXXUtils::ReadFile(nested + "/missing", missingErr);
    EXPECT_TRUE(missingErr.NotEmpty());

    missingErr.Clear();
    CXXUtils::RewriteFile(nested + "/missing", "content", missingErr);
    EXPECT_TRUE(missingErr.NotEmpty());
    EXPECT_NE(stat((nested + "/missing").c_str(), &st), 0);

    std::string cmd = "rm -rf " + std::string(dir);
    if (system(cmd.c_str()) != 0) {
        fprintf(stderr, "failed to clean %s\n", dir);
    }
}
