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
 * Description: provide podshim daemon configuration definition
 *********************************************************************************/
#ifndef DAEMON_CONFIG_DAEMON_CONFIG_H
#define DAEMON_CONFIG_DAEMON_CONFIG_H

#include <map>
#include <memory>
#include <string>

#include <isula_libutils/isulad_daemon_configs.h>

#include "cstruct_wrapper.h"
#include "errors.h"

namespace podshim {
const std::string DEFAULT_LISTEN_ADDRESS { "unix:///var/run/podshim.sock" };
// engine adapters serving podshim.engine.EngineService listen here
const std::string DEFAULT_ENGINE_ENDPOINT { "unix:///var/run/podshim/engine.sock" };
const std::string DEFAULT_STATE_DIR { "/var/lib/podshim" };
const std::string DEFAULT_LOG_LEVEL { "INFO" };
const std::string DEFAULT_LOG_DRIVER { "stdout" };

struct DaemonOptions {
    std::string configFile;
    std::string listen { DEFAULT_LISTEN_ADDRESS };
    std::string engineEndpoint { DEFAULT_ENGINE_ENDPOINT };
    // overrides log-level of the config file when set
    std::string logLevel;
    bool help { false };
};

// getopt_long based parser of the podshimd command line
void ParseDaemonOptions(int argc, char **argv, DaemonOptions &options, Errors &err);

void PrintDaemonUsage(const char *progname);

// Settings of daemon.json, in the isulad daemon.json format.
class DaemonConfig {
public:
    DaemonConfig() = default;
    ~DaemonConfig() = default;
    DaemonConfig(const DaemonConfig &) = delete;
    DaemonConfig &operator=(const DaemonConfig &) = delete;

    void LoadFile(const std::string &path, Errors &err);
    void LoadData(const std::string &data, Errors &err);
    void ApplyOptions(const DaemonOptions &options);

    auto GetState() const -> std::string;
    auto GetPodSandboxImage() const -> std::string;
    auto GetNetworkPlugin() const -> std::string;
    auto GetDefaultRuntime() const -> std::string;
    auto GetCriRuntimes() const -> std::map<std::string, std::string>;
    auto GetLogLevel() const -> std::string;
    auto GetLogDriver() const -> std::string;

private:
    void Validate(Errors &err);

    std::unique_ptr<CStructWrapper<isulad_daemon_configs>> m_conf;
    std::string m_logLevelOverride;
};
} // namespace podshim

#endif // DAEMON_CONFIG_DAEMON_CONFIG_H
