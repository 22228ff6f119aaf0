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
 * Description: checkpoint unit test
 ******************************************************************************/

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <unistd.h>

#include <gtest/gtest.h>

#include "checkpoint_handler.h"
#include "checkpoint_manager.h"
#include "cri_helpers.h"
#include "cxxutils.h"

namespace {
auto CreateTestCheckpoint() -> podshim::CRI::PodSandboxCheckpoint
{
    podshim::CRI::PodSandboxCheckpoint checkpoint;
    auto data = std::make_shared<podshim::CRI::CheckpointData>();

    checkpoint.SetName("web");
    checkpoint.SetNamespace("default");
    data->InsertPortMapping(podshim::CRI::PortMapping("tcp", 80, 8080));
    data->InsertPortMapping(podshim::CRI::PortMapping("udp", 53, 0));
    data->SetHostNetwork(false);
    checkpoint.SetData(data);
    return checkpoint;
}
} // namespace

TEST(CheckpointUnitTest, Sha256)
{
    EXPECT_EQ(podshim::CRIHelpers::sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CheckpointUnitTest, ParserErrorMessage)
{
    char parserErr[] = "syntax error at offset 1";

    EXPECT_STREQ(podshim::CRIHelpers::ParserErrorMessage(nullptr), "unknown");
    EXPECT_STREQ(podshim::CRIHelpers::ParserErrorMessage(parserErr), "syntax error at offset 1");
}

TEST(CheckpointUnitTest, ValidateCheckpointKey)
{
    Errors err;

    EXPECT_TRUE(podshim::CRIHelpers::ValidateCheckpointKey("abc123.def-ghi_0", err));
    EXPECT_FALSE(podshim::CRIHelpers::ValidateCheckpointKey("", err));
    EXPECT_FALSE(podshim::CRIHelpers::ValidateCheckpointKey("../escape", err));
    EXPECT_FALSE(podshim::CRIHelpers::ValidateCheckpointKey(std::string(251, 'a'), err));
}

TEST(CheckpointUnitTest, CreateAndGetCheckpoint)
{
    Errors err;
    podshim::CRI::PodSandboxCheckpoint checkpoint = CreateTestCheckpoint();
    podshim::CRI::PodSandboxCheckpoint loaded;

    std::string json = podshim::CRIHelpers::CreateCheckpoint(checkpoint, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_FALSE(checkpoint.GetCheckSum().empty());

    podshim::CRIHelpers::GetCheckpoint(json, loaded, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(loaded.GetName(), "web");
    EXPECT_EQ(loaded.GetNamespace(), "default");
    EXPECT_EQ(loaded.GetCheckSum(), checkpoint.GetCheckSum());
    ASSERT_NE(loaded.GetData(), nullptr);
    EXPECT_EQ(loaded.GetData()->GetPortMappings(), checkpoint.GetData()->GetPortMappings());
}

TEST(CheckpointUnitTest, GetCorruptedCheckpoint)
{
    Errors err;
    Errors corruptErr;
    Errors garbageErr;
    podshim::CRI::PodSandboxCheckpoint checkpoint = CreateTestCheckpoint();
    podshim::CRI::PodSandboxCheckpoint loaded;

    std::string json = podshim::CRIHelpers::CreateCheckpoint(checkpoint, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    size_t pos = json.find("web");
    ASSERT_NE(pos, std::string::npos);
    json.replace(pos, 3, "www");

    podshim::CRIHelpers::GetCheckpoint(json, loaded, corruptErr);
    EXPECT_TRUE(corruptErr.NotEmpty());

    podshim::CRIHelpers::GetCheckpoint("{not json", loaded, garbageErr);
    EXPECT_TRUE(garbageErr.NotEmpty());
}

class FileCheckpointManagerTest : public testing::Test {
protected:
    void SetUp() override
    {
        char tmpl[] = "/tmp/podshim-checkpoint-XXXXXX";
        char *dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        m_rootDir = dir;
        m_manager = std::unique_ptr<podshim::FileCheckpointManager>(new podshim::FileCheckpointManager(m_rootDir));
    }

    void TearDown() override
    {
        std::string cmd = "rm -rf " + m_rootDir;
        if (system(cmd.c_str()) != 0) {
            fprintf(stderr, "failed to clean %s\n", m_rootDir.c_str());
        }
    }

    std::string m_rootDir;
    std::unique_ptr<podshim::FileCheckpointManager> m_manager;
};

TEST_F(FileCheckpointManagerTest, CreateGetListRemove)
{
    Errors err;
    podshim::CRI::PodSandboxCheckpoint checkpoint = CreateTestCheckpoint();
    podshim::CRI::PodSandboxCheckpoint loaded;

    m_manager->CreateCheckpoint("abc123", checkpoint, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(access((m_manager->GetCheckpointDir() + "/abc123").c_str(), F_OK), 0);

    m_manager->GetCheckpoint("abc123", loaded, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(loaded.GetName(), "web");

    std::vector<std::string> ids = m_manager->ListCheckpoints(err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    ASSERT_EQ(ids.size(), 1U);
    EXPECT_EQ(ids[0], "abc123");

    m_manager->RemoveCheckpoint("abc123", err);
    EXPECT_TRUE(err.Empty()) << err.GetMessage();
    m_manager->RemoveCheckpoint("abc123", err);
    EXPECT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_TRUE(m_manager->ListCheckpoints(err).empty());
}

TEST_F(FileCheckpointManagerTest, OverwriteCheckpoint)
{
    Errors err;
    podshim::CRI::PodSandboxCheckpoint first = CreateTestCheckpoint();
    podshim::CRI::PodSandboxCheckpoint second = CreateTestCheckpoint();
    podshim::CRI::PodSandboxCheckpoint loaded;

    second.SetName("api");
    m_manager->CreateCheckpoint("abc123", first, err);
    m_manager->CreateCheckpoint("abc123", second, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();

    m_manager->GetCheckpoint("abc123", loaded, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    EXPECT_EQ(loaded.GetName(), "api");
}

TEST_F(FileCheckpointManagerTest, InvalidKeyAndMissingCheckpoint)
{
    Errors keyErr;
    Errors missingErr;
    Errors listErr;
    podshim::CRI::PodSandboxCheckpoint checkpoint = CreateTestCheckpoint();

    m_manager->CreateCheckpoint("../abc", checkpoint, keyErr);
    EXPECT_TRUE(keyErr.NotEmpty());

    m_manager->GetCheckpoint("missing", checkpoint, missingErr);
    EXPECT_TRUE(missingErr.NotEmpty());

    // the directory is created lazily by the first write
    EXPECT_TRUE(m_manager->ListCheckpoints(listErr).empty());
    EXPECT_TRUE(listErr.Empty());
}
