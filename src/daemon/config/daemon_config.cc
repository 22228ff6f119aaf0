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
 * Description: provide podshim daemon configuration functions
 *********************************************************************************/
#include "daemon_config.h"

#include <cstdio>
#include <cstdlib>
#include <getopt.h>

#include <isula_libutils/log.h>

#include "cxxutils.h"

namespace podshim {
namespace {
const std::string VALID_LOG_LEVELS[] = { "FATAL", "ALERT", "CRIT", "ERROR", "WARN", "NOTICE", "INFO", "DEBUG", "TRACE" };

auto OptionalString(const char *value, const std::string &def) -> std::string
{
    return (value != nullptr && value[0] != '\0') ? std::string(value) : def;
}

auto IsValidLogLevel(const std::string &level) -> bool
{
    for (const auto &valid : VALID_LOG_LEVELS) {
        if (valid == level) {
            return true;
        }
    }
    return false;
}
}

void PrintDaemonUsage(const char *progname)
{
    printf("Usage: %s [OPTIONS]\n\n", progname);
    printf("CRI pod sandbox shim daemon\n\n");
    printf("Options:\n");
    printf("  -c, --config string            daemon.json to load\n");
    printf("  -H, --listen string            CRI listen address (default \"%s\")\n", DEFAULT_LISTEN_ADDRESS.c_str());
    printf("  -e, --engine-endpoint string   container engine address (default \"%s\")\n",
           DEFAULT_ENGINE_ENDPOINT.c_str());
    printf("  -l, --log-level string         FATAL, ALERT, CRIT, ERROR, WARN, NOTICE, INFO, DEBUG or TRACE\n");
    printf("  -h, --help                     print usage\n");
}

void ParseDaemonOptions(int argc, char **argv, DaemonOptions &options, Errors &err)
{
    static const struct option longOptions[] = {
        { "config", required_argument, nullptr, 'c' },
        { "listen", required_argument, nullptr, 'H' },
        { "engine-endpoint", required_argument, nullptr, 'e' },
        { "log-level", required_argument, nullptr, 'l' },
        { "help", no_argument, nullptr, 'h' },
        { nullptr, 0, nullptr, 0 },
    };
    int opt = 0;

    // getopt state is process wide
    optind = 1;
    opterr = 0;
    while ((opt = getopt_long(argc, argv, "c:H:e:l:h", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                options.configFile = optarg;
                break;
            case 'H':
                options.listen = optarg;
                break;
            case 'e':
                options.engineEndpoint = optarg;
                break;
            case 'l':
                options.logLevel = optarg;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                err.Errorf("unknown or incomplete option: %s", argv[optind - 1]);
                return;
        }
    }

    if (optind < argc) {
        err.Errorf("unexpected argument: %s", argv[optind]);
        return;
    }
    if (!options.logLevel.empty() && !IsValidLogLevel(options.logLevel)) {
        err.Errorf("invalid log level: %s", options.logLevel.c_str());
    }
}

void DaemonConfig::LoadFile(const std::string &path, Errors &err)
{
    parser_error perr { nullptr };

    if (path.empty()) {
        m_conf = makeUniquePtrCStructWrapper<isulad_daemon_configs>(free_isulad_daemon_configs);
        if (m_conf == nullptr) {
            err.SetError("Out of memory");
        }
        return;
    }

    m_conf = makeUniquePtrCStructWrapper<isulad_daemon_configs>(
        isulad_daemon_configs_parse_file(path.c_str(), nullptr, &perr), free_isulad_daemon_configs);
    if (m_conf == nullptr) {
        err.Errorf("failed to load daemon config %s: %s", path.c_str(), perr != nullptr ? perr : "unknown error");
        free(perr);
        return;
    }
    free(perr);
    Validate(err);
}

void DaemonConfig::LoadData(const std::string &data, Errors &err)
{
    parser_error perr { nullptr };

    m_conf = makeUniquePtrCStructWrapper<isulad_daemon_configs>(
        isulad_daemon_configs_parse_data(data.c_str(), nullptr, &perr), free_isulad_daemon_configs);
    if (m_conf == nullptr) {
        err.Errorf("failed to parse daemon config: %s", perr != nullptr ? perr : "unknown error");
        free(perr);
        return;
    }
    free(perr);
    Validate(err);
}

void DaemonConfig::Validate(Errors &err)
{
    std::string level = GetLogLevel();

    if (!IsValidLogLevel(level)) {
        err.Errorf("invalid log-level in daemon config: %s", level.c_str());
        return;
    }
    if (!CXXUtils::HasPrefix(GetState(), "/")) {
        err.Errorf("state directory must be an absolute path: %s", GetState().c_str());
    }
}

void DaemonConfig::ApplyOptions(const DaemonOptions &options)
{
    m_logLevelOverride = options.logLevel;
}

auto DaemonConfig::GetState() const -> std::string
{
    return m_conf == nullptr ? DEFAULT_STATE_DIR : OptionalString(m_conf->get()->state, DEFAULT_STATE_DIR);
}

auto DaemonConfig::GetPodSandboxImage() const -> std::string
{
    return m_conf == nullptr ? "" : OptionalString(m_conf->get()->pod_sandbox_image, "");
}

auto DaemonConfig::GetNetworkPlugin() const -> std::string
{
    return m_conf == nullptr ? "" : OptionalString(m_conf->get()->network_plugin, "");
}

auto DaemonConfig::GetDefaultRuntime() const -> std::string
{
    return m_conf == nullptr ? "" : OptionalString(m_conf->get()->default_runtime, "");
}

auto DaemonConfig::GetCriRuntimes() const -> std::map<std::string, std::string>
{
    std::map<std::string, std::string> runtimes;

    if (m_conf == nullptr || m_conf->get()->cri_runtimes == nullptr) {
        return runtimes;
    }

    json_map_string_string *criRuntimes = m_conf->get()->cri_runtimes;
    for (size_t i = 0; i < criRuntimes->len; i++) {
        if (criRuntimes->keys[i] == nullptr || criRuntimes->values[i] == nullptr) {
            WARN("CRI runtimes key or value is null");
            continue;
        }
        runtimes[criRuntimes->keys[i]] = criRuntimes->values[i];
    }
    return runtimes;
}

auto DaemonConfig::GetLogLevel() const -> std::string
{
    if (!m_logLevelOverride.empty()) {
        return m_logLevelOverride;
    }
    return m_conf == nullptr ? DEFAULT_LOG_LEVEL : OptionalString(m_conf->get()->log_level, DEFAULT_LOG_LEVEL);
}

auto DaemonConfig::GetLogDriver() const -> std::string
{
    return m_conf == nullptr ? DEFAULT_LOG_DRIVER : OptionalString(m_conf->get()->log_driver, DEFAULT_LOG_DRIVER);
}
} // namespace podshim
