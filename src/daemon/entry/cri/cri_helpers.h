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
 * Create: 2024-05-21
 * Description: provide cri helpers functions
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CRI_HELPERS_H
#define DAEMON_ENTRY_CRI_CRI_HELPERS_H
#include <map>
#include <string>

#include "api.pb.h"
#include "checkpoint_handler.h"
#include "errors.h"

namespace podshim {
namespace CRIHelpers {
class Constants {
public:
    static const std::string CONTAINER_TYPE_LABEL_KEY;
    static const std::string CONTAINER_TYPE_LABEL_SANDBOX;
    static const std::string KUBERNETES_CONTAINER_NAME_LABEL;
    // runtime handler of the sandbox, sibling containers of the pod are created with it
    static const std::string RUNTIME_HANDLER_LABEL_KEY;
    static const std::string CONTAINER_TYPE_ANNOTATION_KEY;
    static const std::string CONTAINER_TYPE_ANNOTATION_SANDBOX;
    static const std::string SANDBOX_NAME_ANNOTATION_KEY;
    static const std::string SANDBOX_NAMESPACE_ANNOTATION_KEY;
    static const std::string SANDBOX_UID_ANNOTATION_KEY;
    static const std::string SANDBOX_ATTEMPT_ANNOTATION_KEY;
    // network plugin option carrying the pod dns config as json
    static const std::string NETWORK_OPTION_DNS_KEY;
    static const size_t MAX_CHECKPOINT_KEY_LEN { 250 };
};

auto MakeLabels(const google::protobuf::Map<std::string, std::string> &mapLabels, Errors &error)
-> std::map<std::string, std::string>;

auto MakeAnnotations(const google::protobuf::Map<std::string, std::string> &mapAnnotations, Errors &error)
-> std::map<std::string, std::string>;

void ProtobufAnnoMapToStd(const google::protobuf::Map<std::string, std::string> &annotations,
                          std::map<std::string, std::string> &newAnnos);

// parser errors of isula_libutils may be left unset on failure
auto ParserErrorMessage(const char *err) -> const char *;

auto sha256(const std::string &val) -> std::string;

auto ValidateCheckpointKey(const std::string &key, Errors &error) -> bool;

auto CreateCheckpoint(CRI::PodSandboxCheckpoint &checkpoint, Errors &error) -> std::string;

void GetCheckpoint(const std::string &jsonCheckPoint, CRI::PodSandboxCheckpoint &checkpoint, Errors &error);

auto DNSConfigToJSON(const runtime::v1::DNSConfig &dns, Errors &error) -> std::string;
} // namespace CRIHelpers
} // namespace podshim

#endif // DAEMON_ENTRY_CRI_CRI_HELPERS_H
