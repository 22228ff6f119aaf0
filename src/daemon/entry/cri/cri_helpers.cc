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
#include "cri_helpers.h"

#include <cstdio>
#include <cstdlib>

#include <google/protobuf/util/json_util.h>
#include <isula_libutils/cri_checkpoint.h>
#include <isula_libutils/log.h>
#include <isula_libutils/utils_memory.h>
#include <openssl/evp.h>

#include "cri_constants.h"
#include "cstruct_wrapper.h"
#include "cxxutils.h"

namespace podshim {
namespace CRIHelpers {
const std::string Constants::CONTAINER_TYPE_LABEL_KEY { "cri.podshim.type" };
const std::string Constants::CONTAINER_TYPE_LABEL_SANDBOX { "podsandbox" };
const std::string Constants::KUBERNETES_CONTAINER_NAME_LABEL { "io.kubernetes.container.name" };
const std::string Constants::RUNTIME_HANDLER_LABEL_KEY { "cri.podshim.runtime-handler" };
const std::string Constants::CONTAINER_TYPE_ANNOTATION_KEY { "io.kubernetes.cri.container-type" };
const std::string Constants::CONTAINER_TYPE_ANNOTATION_SANDBOX { "sandbox" };
const std::string Constants::SANDBOX_NAME_ANNOTATION_KEY { "io.kubernetes.cri.sandbox-name" };
const std::string Constants::SANDBOX_NAMESPACE_ANNOTATION_KEY { "io.kubernetes.cri.sandbox-namespace" };
const std::string Constants::SANDBOX_UID_ANNOTATION_KEY { "io.kubernetes.cri.sandbox-uid" };
const std::string Constants::SANDBOX_ATTEMPT_ANNOTATION_KEY { "io.kubernetes.cri.sandbox-attempt" };
const std::string Constants::NETWORK_OPTION_DNS_KEY { "dns" };

static auto CopyBoundedMap(const google::protobuf::Map<std::string, std::string> &input, const char *what,
                           Errors &error) -> std::map<std::string, std::string>
{
    std::map<std::string, std::string> out;

    if (static_cast<size_t>(input.size()) > CRI::Constants::MAX_LABELS) {
        ERROR("Too many %s: %zu", what, static_cast<size_t>(input.size()));
        error.Errorf("too many %s, the limit is %zu", what, CRI::Constants::MAX_LABELS);
        return out;
    }

    for (auto iter = input.begin(); iter != input.end(); ++iter) {
        out[iter->first] = iter->second;
    }
    return out;
}

auto MakeLabels(const google::protobuf::Map<std::string, std::string> &mapLabels, Errors &error)
-> std::map<std::string, std::string>
{
    return CopyBoundedMap(mapLabels, "labels", error);
}

auto MakeAnnotations(const google::protobuf::Map<std::string, std::string> &mapAnnotations, Errors &error)
-> std::map<std::string, std::string>
{
    return CopyBoundedMap(mapAnnotations, "annotations", error);
}

void ProtobufAnnoMapToStd(const google::protobuf::Map<std::string, std::string> &annotations,
                          std::map<std::string, std::string> &newAnnos)
{
    for (auto &iter : annotations) {
        newAnnos[iter.first] = iter.second;
    }
}

auto ParserErrorMessage(const char *err) -> const char *
{
    return err != nullptr ? err : "unknown";
}

auto sha256(const std::string &val) -> std::string
{
    unsigned char hash[EVP_MAX_MD_SIZE] = { 0 };
    unsigned int hashLen { 0 };
    char outputBuffer[(EVP_MAX_MD_SIZE * 2) + 1] { 0 };

    if (EVP_Digest(val.data(), val.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1) {
        ERROR("Failed to compute sha256 digest");
        return "";
    }

    for (unsigned int i = 0; i < hashLen; i++) {
        int ret = snprintf(outputBuffer + (i * 2), 3, "%02x", static_cast<unsigned int>(hash[i]));
        if (ret >= 3 || ret < 0) {
            return "";
        }
    }

    return outputBuffer;
}

auto ValidateCheckpointKey(const std::string &key, Errors &error) -> bool
{
    const std::string PATTERN { "^[a-zA-Z0-9._-]+$" };

    if (!key.empty() && key.size() <= Constants::MAX_CHECKPOINT_KEY_LEN && CXXUtils::RegMatch(PATTERN, key)) {
        return true;
    }

    error.Errorf("invalid key: %s", key.c_str());
    return false;
}

// The checksum covers the json generated without the checksum field.
auto CreateCheckpoint(CRI::PodSandboxCheckpoint &checkpoint, Errors &error) -> std::string
{
    cri_checkpoint *criCheckpoint { nullptr };
    struct parser_context ctx {
        OPT_GEN_SIMPLIFY, 0
    };
    parser_error err { nullptr };
    char *jsonStr { nullptr };
    std::string result;

    checkpoint.SetCheckSum("");
    checkpoint.CheckpointToCStruct(&criCheckpoint, error);
    if (error.NotEmpty()) {
        goto out;
    }

    jsonStr = cri_checkpoint_generate_json(criCheckpoint, &ctx, &err);
    if (jsonStr == nullptr) {
        error.Errorf("Generate cri checkpoint json failed: %s", ParserErrorMessage(err));
        goto out;
    }
    checkpoint.SetCheckSum(sha256(jsonStr));
    if (checkpoint.GetCheckSum().empty()) {
        error.SetError("checksum is empty");
        goto out;
    }
    criCheckpoint->checksum = isula_strdup_s(checkpoint.GetCheckSum().c_str());

    free(jsonStr);
    jsonStr = cri_checkpoint_generate_json(criCheckpoint, &ctx, &err);
    if (jsonStr == nullptr) {
        error.Errorf("Generate cri checkpoint json failed: %s", ParserErrorMessage(err));
        goto out;
    }

    result = jsonStr;
out:
    free(err);
    free(jsonStr);
    free_cri_checkpoint(criCheckpoint);
    return result;
}

void GetCheckpoint(const std::string &jsonCheckPoint, CRI::PodSandboxCheckpoint &checkpoint, Errors &error)
{
    struct parser_context ctx {
        OPT_GEN_SIMPLIFY, 0
    };
    parser_error err { nullptr };
    std::string storedChecksum;
    char *jsonStr { nullptr };

    std::unique_ptr<CStructWrapper<cri_checkpoint>> criCheckpoint = makeUniquePtrCStructWrapper<cri_checkpoint>(
        cri_checkpoint_parse_data(jsonCheckPoint.c_str(), &ctx, &err), free_cri_checkpoint);
    if (criCheckpoint == nullptr) {
        ERROR("Failed to unmarshal checkpoint: %s", ParserErrorMessage(err));
        error.SetError("failed to unmarshal checkpoint");
        free(err);
        return;
    }

    if (criCheckpoint->get()->checksum == nullptr) {
        error.SetError("checkpoint is corrupted: missing checksum");
        return;
    }
    storedChecksum = criCheckpoint->get()->checksum;
    free(criCheckpoint->get()->checksum);
    criCheckpoint->get()->checksum = nullptr;

    jsonStr = cri_checkpoint_generate_json(criCheckpoint->get(), &ctx, &err);
    if (jsonStr == nullptr) {
        error.Errorf("Generate cri json str failed: %s", err);
        free(err);
        return;
    }

    if (storedChecksum != sha256(jsonStr)) {
        ERROR("Checksum of checkpoint is not valid");
        error.SetError("checkpoint is corrupted");
        free(jsonStr);
        return;
    }
    free(jsonStr);

    checkpoint.CStructToCheckpoint(criCheckpoint->get());
    checkpoint.SetCheckSum(storedChecksum);
}

auto DNSConfigToJSON(const runtime::v1::DNSConfig &dns, Errors &error) -> std::string
{
    std::string out;
    google::protobuf::util::JsonPrintOptions options;

    options.preserve_proto_field_names = true;
    auto status = google::protobuf::util::MessageToJsonString(dns, &out, options);
    if (!status.ok()) {
        error.Errorf("failed to marshal dns config: %s", status.ToString().c_str());
        return "";
    }
    return out;
}
} // namespace CRIHelpers
} // namespace podshim
