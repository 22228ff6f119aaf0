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
 * Description: network plugin manager unit test
 ******************************************************************************/

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "network_plugin.h"
#include "network_plugin_mock.h"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::ReturnRef;

namespace {
const std::string DUMMY_PLUGIN_NAME = "cni";
}

class NetworkPluginManagerTest : public testing::Test {
protected:
    void SetUp() override
    {
        m_plugin = std::make_shared<NiceMock<podshim::MockNetworkPlugin>>();
        ON_CALL(*m_plugin, Name()).WillByDefault(ReturnRef(DUMMY_PLUGIN_NAME));
        m_manager = std::unique_ptr<podshim::Network::PluginManager>(new podshim::Network::PluginManager(m_plugin));
    }

    std::shared_ptr<NiceMock<podshim::MockNetworkPlugin>> m_plugin;
    std::unique_ptr<podshim::Network::PluginManager> m_manager;
};

TEST_F(NetworkPluginManagerTest, SetUpAndTearDownPod)
{
    Errors err;
    std::map<std::string, std::string> annotations { { "team", "frontend" } };
    std::map<std::string, std::string> options;

    EXPECT_CALL(*m_plugin, SetUpPod("default", "web", "podshim://abc123", annotations, options, _)).Times(1);
    EXPECT_CALL(*m_plugin, TearDownPod("default", "web", "podshim://abc123", _)).Times(1);

    m_manager->SetUpPod("default", "web", "podshim://abc123", annotations, options, err);
    EXPECT_TRUE(err.Empty()) << err.GetMessage();
    m_manager->TearDownPod("default", "web", "podshim://abc123", err);
    EXPECT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(m_manager->PluginName(), DUMMY_PLUGIN_NAME);
    EXPECT_EQ(m_manager->InFlightPods(), 0U);
}

TEST_F(NetworkPluginManagerTest, SetUpPodFailed)
{
    Errors err;

    EXPECT_CALL(*m_plugin, SetUpPod(_, _, _, _, _, _))
    .WillOnce(Invoke([](const std::string &ns, const std::string &name, const std::string &podSandboxID,
                        const std::map<std::string, std::string> &annotations,
                        const std::map<std::string, std::string> &options, Errors &error) {
        error.SetError("port busy");
    }));

    m_manager->SetUpPod("default", "web", "podshim://abc123", {}, {}, err);

    EXPECT_THAT(err.GetMessage(), HasSubstr("port busy"));
    EXPECT_THAT(err.GetMessage(), HasSubstr("web_default"));
    EXPECT_EQ(m_manager->InFlightPods(), 0U);
}

TEST_F(NetworkPluginManagerTest, SamePodOperationsAreSerialized)
{
    std::atomic<int> inside { 0 };
    std::atomic<int> maxInside { 0 };
    auto slowCall = [&inside, &maxInside]() {
        int now = ++inside;
        int prev = maxInside.load();
        while (now > prev && !maxInside.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --inside;
    };

    EXPECT_CALL(*m_plugin, SetUpPod(_, _, _, _, _, _))
    .WillRepeatedly(Invoke([&slowCall](const std::string &ns, const std::string &name,
                                       const std::string &podSandboxID,
                                       const std::map<std::string, std::string> &annotations,
                                       const std::map<std::string, std::string> &options, Errors &error) {
        slowCall();
    }));
    EXPECT_CALL(*m_plugin, TearDownPod(_, _, _, _))
    .WillRepeatedly(Invoke([&slowCall](const std::string &ns, const std::string &name,
                                       const std::string &podSandboxID, Errors &error) {
        slowCall();
    }));

    std::thread setup([this]() {
        Errors err;
        m_manager->SetUpPod("default", "web", "podshim://abc123", {}, {}, err);
    });
    std::thread teardown([this]() {
        Errors err;
        m_manager->TearDownPod("default", "web", "podshim://abc123", err);
    });
    setup.join();
    teardown.join();

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(m_manager->InFlightPods(), 0U);
}

TEST(NetworkPluginUnitTest, InitNoopPlugin)
{
    Errors err;

    std::shared_ptr<podshim::Network::NetworkPlugin> plugin = podshim::Network::InitNetworkPlugin({}, "", err);

    ASSERT_NE(plugin, nullptr);
    EXPECT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(plugin->Name(), "kubernetes.io/no-op");
}

TEST(NetworkPluginUnitTest, InitNamedPlugin)
{
    Errors err;
    Errors missingErr;
    auto cni = std::make_shared<NiceMock<podshim::MockNetworkPlugin>>();
    ON_CALL(*cni, Name()).WillByDefault(ReturnRef(DUMMY_PLUGIN_NAME));
    std::vector<std::shared_ptr<podshim::Network::NetworkPlugin>> plugins { cni };

    EXPECT_CALL(*cni, Init(_)).Times(1);

    std::shared_ptr<podshim::Network::NetworkPlugin> plugin = podshim::Network::InitNetworkPlugin(plugins, "cni",
                                                                                                  err);
    EXPECT_EQ(plugin, cni);
    EXPECT_TRUE(err.Empty()) << err.GetMessage();

    EXPECT_EQ(podshim::Network::InitNetworkPlugin(plugins, "calico", missingErr), nullptr);
    EXPECT_TRUE(missingErr.NotEmpty());
}

TEST(NetworkPluginUnitTest, InitPluginFailed)
{
    Errors err;
    auto cni = std::make_shared<NiceMock<podshim::MockNetworkPlugin>>();
    ON_CALL(*cni, Name()).WillByDefault(ReturnRef(DUMMY_PLUGIN_NAME));
    std::vector<std::shared_ptr<podshim::Network::NetworkPlugin>> plugins { cni };

    EXPECT_CALL(*cni, Init(_)).WillOnce(Invoke([](Errors &error) {
        error.SetError("no networks found in /etc/cni/net.d");
    }));

    EXPECT_EQ(podshim::Network::InitNetworkPlugin(plugins, "cni", err), nullptr);
    EXPECT_THAT(err.GetMessage(), HasSubstr("no networks found"));
}
