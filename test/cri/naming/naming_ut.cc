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
 * Create: 2024-06-05
 * Description: naming unit test
 ******************************************************************************/

#include <gtest/gtest.h>

#include "cri_helpers.h"
#include "naming.h"

TEST(NamingUnitTest, MakeSandboxName)
{
    runtime::v1::PodSandboxMetadata metadata;
    metadata.set_name("web");
    metadata.set_namespace_("default");
    metadata.set_uid("uid-1");
    metadata.set_attempt(3);

    EXPECT_EQ(podshim::CRINaming::MakeSandboxName(metadata), "k8s_POD_web_default_uid-1_3");
}

TEST(NamingUnitTest, ParseSandboxName)
{
    Errors err;
    runtime::v1::PodSandboxMetadata metadata;

    podshim::CRINaming::ParseSandboxName("k8s_POD_web_default_uid-1_3", metadata, err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(metadata.name(), "web");
    EXPECT_EQ(metadata.namespace_(), "default");
    EXPECT_EQ(metadata.uid(), "uid-1");
    EXPECT_EQ(metadata.attempt(), 3U);
}

TEST(NamingUnitTest, ParseSandboxNameInvalid)
{
    Errors fieldsErr;
    Errors prefixErr;
    Errors attemptErr;
    runtime::v1::PodSandboxMetadata metadata;

    podshim::CRINaming::ParseSandboxName("k8s_POD_web_default_uid-1", metadata, fieldsErr);
    EXPECT_TRUE(fieldsErr.NotEmpty());

    podshim::CRINaming::ParseSandboxName("k8s_app_web_default_uid-1_0", metadata, prefixErr);
    EXPECT_TRUE(prefixErr.NotEmpty());

    podshim::CRINaming::ParseSandboxName("k8s_POD_web_default_uid-1_x1", metadata, attemptErr);
    EXPECT_TRUE(attemptErr.NotEmpty());
}

TEST(NamingUnitTest, ParseSandboxIdentityFromAnnotations)
{
    Errors err;
    runtime::v1::PodSandboxMetadata metadata;
    std::map<std::string, std::string> annotations {
        { podshim::CRIHelpers::Constants::SANDBOX_NAME_ANNOTATION_KEY, "web" },
        { podshim::CRIHelpers::Constants::SANDBOX_NAMESPACE_ANNOTATION_KEY, "default" },
        { podshim::CRIHelpers::Constants::SANDBOX_UID_ANNOTATION_KEY, "uid-1" },
        { podshim::CRIHelpers::Constants::SANDBOX_ATTEMPT_ANNOTATION_KEY, "2" },
    };

    podshim::CRINaming::ParseSandboxIdentity("/renamed", annotations, metadata, err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(metadata.uid(), "uid-1");
    EXPECT_EQ(metadata.attempt(), 2U);
}

TEST(NamingUnitTest, ParseSandboxIdentityFallsBackToName)
{
    Errors err;
    runtime::v1::PodSandboxMetadata metadata;
    std::map<std::string, std::string> annotations {
        { podshim::CRIHelpers::Constants::SANDBOX_NAME_ANNOTATION_KEY, "web" },
        { podshim::CRIHelpers::Constants::SANDBOX_NAMESPACE_ANNOTATION_KEY, "default" },
    };

    podshim::CRINaming::ParseSandboxIdentity("/k8s_POD_web_default_uid-9_4", annotations, metadata, err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(metadata.name(), "web");
    EXPECT_EQ(metadata.uid(), "uid-9");
    EXPECT_EQ(metadata.attempt(), 4U);
}

TEST(NamingUnitTest, ParseSandboxIdentityWithoutAnnotations)
{
    Errors err;
    runtime::v1::PodSandboxMetadata metadata;
    std::map<std::string, std::string> annotations;

    podshim::CRINaming::ParseSandboxIdentity("k8s_POD_web_default_uid-9_4", annotations, metadata, err);

    EXPECT_TRUE(err.NotEmpty());
}

TEST(NamingUnitTest, BuildContainerID)
{
    EXPECT_EQ(podshim::CRINaming::BuildContainerID("podshim", "abc123"), "podshim://abc123");
}
