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
 * Create: 2024-06-07
 * Description: runtime class resolver unit test
 ******************************************************************************/

#include <gtest/gtest.h>

#include "runtime_class_resolver.h"

TEST(RuntimeClassResolverUnitTest, ResolveDefault)
{
    Errors err;
    podshim::ConfigRuntimeClassResolver resolver({}, "");

    EXPECT_EQ(resolver.Resolve("", err), "runc");
    EXPECT_EQ(resolver.Resolve("runc", err), "runc");
    EXPECT_TRUE(err.Empty());
}

TEST(RuntimeClassResolverUnitTest, ResolveConfiguredRuntime)
{
    Errors err;
    podshim::ConfigRuntimeClassResolver resolver({ { "kata", "io.containerd.kata.v2" }, { "broken", "" } }, "crun");

    EXPECT_EQ(resolver.Resolve("", err), "crun");
    EXPECT_EQ(resolver.Resolve("kata", err), "io.containerd.kata.v2");
    EXPECT_TRUE(err.Empty());
}

TEST(RuntimeClassResolverUnitTest, ResolveUnknownRuntime)
{
    Errors unknownErr;
    Errors emptyErr;
    podshim::ConfigRuntimeClassResolver resolver({ { "broken", "" } }, "runc");

    EXPECT_TRUE(resolver.Resolve("gvisor", unknownErr).empty());
    EXPECT_TRUE(unknownErr.NotEmpty());
    EXPECT_TRUE(resolver.Resolve("broken", emptyErr).empty());
    EXPECT_TRUE(emptyErr.NotEmpty());
}
