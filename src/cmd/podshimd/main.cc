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
 * Create: 2024-05-28
 * Description: podshimd main
 *********************************************************************************/
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <pthread.h>
#include <thread>
#include <vector>

#include <isula_libutils/log.h>

#include "checkpoint_manager.h"
#include "cri_pod_sandbox_manager_service_impl.h"
#include "daemon_config.h"
#include "errors.h"
#include "grpc_engine_client.h"
#include "grpc_service.h"
#include "network_plugin.h"
#include "network_readiness.h"
#include "resolv_conf.h"
#include "runtime_class_resolver.h"

namespace {
// seconds granted to every engine call except image pulls
const int64_t ENGINE_REQUEST_DEADLINE = 120;

auto InitLog(const podshim::DaemonConfig &config, Errors &err) -> bool
{
    static std::string priority;
    static std::string driver;
    struct isula_libutils_log_config lconf = { 0 };

    priority = config.GetLogLevel();
    driver = config.GetLogDriver();
    lconf.name = "podshimd";
    lconf.file = nullptr;
    lconf.priority = priority.c_str();
    lconf.driver = driver.c_str();
    if (isula_libutils_log_enable(&lconf) != 0) {
        err.Errorf("failed to init log with driver %s", driver.c_str());
        return false;
    }
    return true;
}

auto NewPodSandboxManager(const podshim::DaemonConfig &config, const podshim::DaemonOptions &options, Errors &err)
-> std::shared_ptr<podshim::PodSandboxManagerService>
{
    std::vector<std::shared_ptr<podshim::Network::NetworkPlugin>> plugins;

    auto plugin = podshim::Network::InitNetworkPlugin(plugins, config.GetNetworkPlugin(), err);
    if (err.NotEmpty()) {
        return nullptr;
    }

    auto engine = std::make_shared<podshim::GrpcEngineClient>(options.engineEndpoint, ENGINE_REQUEST_DEADLINE);
    auto checkpointManager = std::make_shared<podshim::FileCheckpointManager>(config.GetState());
    auto pluginManager = std::make_shared<podshim::Network::PluginManager>(plugin);
    auto runtimeClassResolver =
        std::make_shared<podshim::ConfigRuntimeClassResolver>(config.GetCriRuntimes(), config.GetDefaultRuntime());
    auto resolvConfWriter = std::make_shared<podshim::FileResolvConfWriter>();
    auto networkReady = std::make_shared<podshim::MemoryNetworkReadinessStore>();

    INFO("Use network plugin %s, sandbox image %s", pluginManager->PluginName().c_str(),
         config.GetPodSandboxImage().empty() ? "(default)" : config.GetPodSandboxImage().c_str());

    return std::make_shared<podshim::PodSandboxManagerServiceImpl>(config.GetPodSandboxImage(), engine,
                                                                   checkpointManager, pluginManager,
                                                                   runtimeClassResolver, resolvConfWriter,
                                                                   networkReady);
}
}

int main(int argc, char **argv)
{
    podshim::DaemonOptions options;
    podshim::DaemonConfig config;
    Errors err;
    sigset_t signals;

    podshim::ParseDaemonOptions(argc, argv, options, err);
    if (err.NotEmpty()) {
        fprintf(stderr, "%s\n", err.GetCMessage());
        podshim::PrintDaemonUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (options.help) {
        podshim::PrintDaemonUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    config.LoadFile(options.configFile, err);
    if (err.NotEmpty()) {
        fprintf(stderr, "%s\n", err.GetCMessage());
        return EXIT_FAILURE;
    }
    config.ApplyOptions(options);

    if (!InitLog(config, err)) {
        fprintf(stderr, "%s\n", err.GetCMessage());
        return EXIT_FAILURE;
    }

    auto podSandboxManager = NewPodSandboxManager(config, options, err);
    if (podSandboxManager == nullptr) {
        ERROR("Failed to init pod sandbox manager: %s", err.GetCMessage());
        return EXIT_FAILURE;
    }

    // grpc threads inherit the mask, only the signal thread below sees these
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        ERROR("Failed to block termination signals");
        return EXIT_FAILURE;
    }

    podshim::GRPCServerImpl server(podSandboxManager);
    server.Init(options.listen, err);
    if (err.NotEmpty()) {
        ERROR("Failed to start grpc server: %s", err.GetCMessage());
        return EXIT_FAILURE;
    }

    std::thread signalThread([&server, &signals]() {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            EVENT("Event: {Object: podshimd, Type: Received signal %d, shutting down}", sig);
        }
        server.Shutdown();
    });

    EVENT("Event: {Object: podshimd, Type: Started, listening on %s}", options.listen.c_str());
    server.Wait();
    signalThread.join();

    EVENT("Event: {Object: podshimd, Type: Stopped}");
    return EXIT_SUCCESS;
}
