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
 * Create: 2024-06-06
 * Description: sandbox config builder unit test
 ******************************************************************************/

#include <gtest/gtest.h>

#include "cri_constants.h"
#include "cri_helpers.h"
#include "sandbox_config_builder.h"

namespace {
const std::string DUMMY_IMAGE = "registry.k8s.io/pause:3.9";

auto CreateTestPodSandboxConfig() -> runtime::v1::PodSandboxConfig
{
    runtime::v1::PodSandboxConfig config;

    config.mutable_metadata()->set_name("web");
    config.mutable_metadata()->set_namespace_("default");
    config.mutable_metadata()->set_uid("uid-1");
    config.mutable_metadata()->set_attempt(1);
    config.set_hostname("web-0");
    (*config.mutable_labels())["app"] = "web";
    (*config.mutable_annotations())["team"] = "frontend";
    config.mutable_linux()->set_cgroup_parent("/kubepods/besteffort/poduid-1");
    (*config.mutable_linux()->mutable_sysctls())["net.core.somaxconn"] = "1024";
    return config;
}
} // namespace

TEST(SandboxConfigBuilderUnitTest, MakeSandboxCreationConfig)
{
    Errors err;
    runtime::v1::PodSandboxConfig c = CreateTestPodSandboxConfig();
    runtime::v1::PortMapping *pm = c.add_port_mappings();
    pm->set_protocol(runtime::v1::SCTP);
    pm->set_container_port(9000);
    pm->set_host_port(19000);
    pm->set_host_ip("127.0.0.1");

    podshim::SandboxCreationConfig config = podshim::MakeSandboxCreationConfig(c, DUMMY_IMAGE, "runc", err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(config.name, "k8s_POD_web_default_uid-1_1");
    EXPECT_EQ(config.image, DUMMY_IMAGE);
    EXPECT_EQ(config.runtime, "runc");
    EXPECT_EQ(config.hostname, "web-0");
    EXPECT_EQ(config.cgroupParent, "/kubepods/besteffort/poduid-1");
    EXPECT_EQ(config.sysctls["net.core.somaxconn"], "1024");
    EXPECT_EQ(config.labels["app"], "web");
    EXPECT_EQ(config.labels[podshim::CRIHelpers::Constants::CONTAINER_TYPE_LABEL_KEY],
              podshim::CRIHelpers::Constants::CONTAINER_TYPE_LABEL_SANDBOX);
    EXPECT_EQ(config.labels[podshim::CRIHelpers::Constants::KUBERNETES_CONTAINER_NAME_LABEL], "POD");
    EXPECT_EQ(config.labels[podshim::CRIHelpers::Constants::RUNTIME_HANDLER_LABEL_KEY], "runc");
    EXPECT_EQ(config.annotations["team"], "frontend");
    EXPECT_EQ(config.annotations[podshim::CRIHelpers::Constants::SANDBOX_NAME_ANNOTATION_KEY], "web");
    EXPECT_EQ(config.annotations[podshim::CRIHelpers::Constants::SANDBOX_NAMESPACE_ANNOTATION_KEY], "default");
    EXPECT_EQ(config.annotations[podshim::CRIHelpers::Constants::SANDBOX_UID_ANNOTATION_KEY], "uid-1");
    EXPECT_EQ(config.annotations[podshim::CRIHelpers::Constants::SANDBOX_ATTEMPT_ANNOTATION_KEY], "1");
    EXPECT_EQ(config.networkMode, "none");
    EXPECT_TRUE(config.utsMode.empty());
    ASSERT_EQ(config.portBindings.size(), 1U);
    EXPECT_EQ(config.portBindings[0].protocol, "sctp");
    EXPECT_EQ(config.portBindings[0].containerPort, 9000);
    EXPECT_EQ(config.portBindings[0].hostPort, 19000);
    EXPECT_EQ(config.portBindings[0].hostIP, "127.0.0.1");
    EXPECT_EQ(config.oomScoreAdj, podshim::CRI::Constants::PodInfraOOMAdj);
    EXPECT_EQ(config.cpuShares, podshim::CRI::Constants::DefaultSandboxCPUshares);
    EXPECT_EQ(config.memorySwap, podshim::CRI::Constants::DefaultMemorySwap);
}

TEST(SandboxConfigBuilderUnitTest, MakeSandboxCreationConfigWithoutLinux)
{
    Errors err;
    runtime::v1::PodSandboxConfig c;
    c.mutable_metadata()->set_name("web");
    c.mutable_metadata()->set_namespace_("default");

    podshim::SandboxCreationConfig config = podshim::MakeSandboxCreationConfig(c, DUMMY_IMAGE, "runc", err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(config.networkMode, "none");
    ASSERT_EQ(config.securityOpt.size(), 1U);
    EXPECT_EQ(config.securityOpt[0], "seccomp=unconfined");
}

TEST(SandboxConfigBuilderUnitTest, MakeSandboxCreationConfigHostNetwork)
{
    Errors err;
    runtime::v1::PodSandboxConfig c = CreateTestPodSandboxConfig();
    c.mutable_linux()->mutable_security_context()->mutable_namespace_options()->set_network(
        runtime::v1::NamespaceMode::NODE);

    podshim::SandboxCreationConfig config = podshim::MakeSandboxCreationConfig(c, DUMMY_IMAGE, "runc", err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(config.networkMode, "host");
    EXPECT_EQ(config.utsMode, "host");
}

TEST(SandboxConfigBuilderUnitTest, MakeSandboxCreationConfigInvalid)
{
    Errors metaErr;
    Errors imageErr;
    Errors sysctlErr;
    runtime::v1::PodSandboxConfig noMeta;
    runtime::v1::PodSandboxConfig tooManySysctls = CreateTestPodSandboxConfig();

    (void)podshim::MakeSandboxCreationConfig(noMeta, DUMMY_IMAGE, "runc", metaErr);
    EXPECT_TRUE(metaErr.NotEmpty());

    (void)podshim::MakeSandboxCreationConfig(CreateTestPodSandboxConfig(), "", "runc", imageErr);
    EXPECT_TRUE(imageErr.NotEmpty());

    for (size_t i = 0; i <= podshim::CRI::Constants::MAX_SYSCTLS; i++) {
        (*tooManySysctls.mutable_linux()->mutable_sysctls())["kernel.test" + std::to_string(i)] = "1";
    }
    (void)podshim::MakeSandboxCreationConfig(tooManySysctls, DUMMY_IMAGE, "runc", sysctlErr);
    EXPECT_TRUE(sysctlErr.NotEmpty());
}
