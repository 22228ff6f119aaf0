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
 * Create: 2024-06-08
 * Description: daemon config unit test
 ******************************************************************************/

#include <gtest/gtest.h>

#include "daemon_config.h"

TEST(DaemonConfigUnitTest, Defaults)
{
    podshim::DaemonConfig config;

    EXPECT_EQ(config.GetState(), podshim::DEFAULT_STATE_DIR);
    EXPECT_EQ(config.GetLogLevel(), podshim::DEFAULT_LOG_LEVEL);
    EXPECT_EQ(config.GetLogDriver(), podshim::DEFAULT_LOG_DRIVER);
    EXPECT_TRUE(config.GetPodSandboxImage().empty());
    EXPECT_TRUE(config.GetNetworkPlugin().empty());
    EXPECT_TRUE(config.GetCriRuntimes().empty());
}

TEST(DaemonConfigUnitTest, LoadData)
{
    Errors err;
    podshim::DaemonConfig config;
    std::string data = "{\"state\": \"/var/lib/podshim-test\","
                       " \"pod-sandbox-image\": \"registry.example.com/pause:3.9\","
                       " \"default-runtime\": \"crun\","
                       " \"log-level\": \"DEBUG\","
                       " \"cri-runtimes\": {\"kata\": \"io.containerd.kata.v2\"}}";

    config.LoadData(data, err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(config.GetState(), "/var/lib/podshim-test");
    EXPECT_EQ(config.GetPodSandboxImage(), "registry.example.com/pause:3.9");
    EXPECT_EQ(config.GetDefaultRuntime(), "crun");
    EXPECT_EQ(config.GetLogLevel(), "DEBUG");
    ASSERT_EQ(config.GetCriRuntimes().size(), 1U);
    EXPECT_EQ(config.GetCriRuntimes()["kata"], "io.containerd.kata.v2");
}

TEST(DaemonConfigUnitTest, LoadInvalidData)
{
    Errors syntaxErr;
    Errors levelErr;
    Errors stateErr;
    podshim::DaemonConfig config;

    config.LoadData("{\"state\": ", syntaxErr);
    EXPECT_TRUE(syntaxErr.NotEmpty());

    config.LoadData("{\"log-level\": \"VERBOSE\"}", levelErr);
    EXPECT_TRUE(levelErr.NotEmpty());

    config.LoadData("{\"state\": \"relative/dir\"}", stateErr);
    EXPECT_TRUE(stateErr.NotEmpty());
}

TEST(DaemonConfigUnitTest, LogLevelOverride)
{
    Errors err;
    podshim::DaemonConfig config;
    podshim::DaemonOptions options;

    config.LoadData("{\"log-level\": \"WARN\"}", err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    options.logLevel = "TRACE";
    config.ApplyOptions(options);

    EXPECT_EQ(config.GetLogLevel(), "TRACE");
}

TEST(DaemonOptionsUnitTest, ParseDaemonOptions)
{
    Errors err;
    podshim::DaemonOptions options;
    char arg0[] = "podshimd";
    char arg1[] = "--config";
    char arg2[] = "/etc/podshim/daemon.json";
    char arg3[] = "-H";
    char arg4[] = "unix:///run/podshim.sock";
    char arg5[] = "--log-level=DEBUG";
    char *argv[] = { arg0, arg1, arg2, arg3, arg4, arg5, nullptr };

    podshim::ParseDaemonOptions(6, argv, options, err);

    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(options.configFile, "/etc/podshim/daemon.json");
    EXPECT_EQ(options.listen, "unix:///run/podshim.sock");
    EXPECT_EQ(options.engineEndpoint, "unix:///var/run/podshim/engine.sock");
    EXPECT_EQ(options.logLevel, "DEBUG");
    EXPECT_FALSE(options.help);
}

TEST(DaemonOptionsUnitTest, ParseDaemonOptionsInvalid)
{
    Errors unknownErr;
    Errors levelErr;
    podshim::DaemonOptions unknownOptions;
    podshim::DaemonOptions levelOptions;
    char arg0[] = "podshimd";
    char unknown[] = "--bogus";
    char level[] = "--log-level=LOUD";
    char *unknownArgv[] = { arg0, unknown, nullptr };
    char *levelArgv[] = { arg0, level, nullptr };

    podshim::ParseDaemonOptions(2, unknownArgv, unknownOptions, unknownErr);
    EXPECT_TRUE(unknownErr.NotEmpty());

    podshim::ParseDaemonOptions(2, levelArgv, levelOptions, levelErr);
    EXPECT_TRUE(levelErr.NotEmpty());
}
