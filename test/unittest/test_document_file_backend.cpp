/**
 * @file test_document_file_backend.cpp
 * @brief Unit tests for DocumentFileBackend (layout, atomic persist, recovery)
 * @date 2025-12-02
 */

#include <gtest/gtest.h>
#include <lap/core/CCore.hpp>
#include <lap/core/CPath.hpp>
#include <lap/core/CFile.hpp>
#include "CDocumentFileBackend.hpp"
#include "CStoragePathManager.hpp"

using namespace lap::core;
using namespace lap::hrms;
using json = nlohmann::json;

class DocumentFileBackendTest : public ::testing::Test {
protected:
    String storageRoot;
    String instancePath;
    UniqueHandle<DocumentFileBackend> backend;

    void SetUp() override {
        storageRoot = "/tmp/hrms_file_backend_test";
        if (Path::isDirectory(storageRoot)) {
            Path::removeDirectory(storageRoot, true);
        }

        instancePath = CStoragePathManager::getInstancePath(storageRoot, "unit");
        backend = MakeUnique<DocumentFileBackend>(storageRoot, "unit");
    }

    void TearDown() override {
        backend.reset();
        if (Path::isDirectory(storageRoot)) {
            Path::removeDirectory(storageRoot, true);
        }
    }

    String currentPath() const {
        return CStoragePathManager::getDocumentPath(instancePath, LAP_HRMS_CATEGORY_CURRENT, LAP_HRMS_DOCUMENT_FILE);
    }

    String updatePath() const {
        return CStoragePathManager::getDocumentPath(instancePath, LAP_HRMS_CATEGORY_UPDATE, LAP_HRMS_DOCUMENT_FILE);
    }

    String redundancyPath() const {
        return CStoragePathManager::getDocumentPath(instancePath, LAP_HRMS_CATEGORY_REDUNDANCY, LAP_HRMS_REDUNDANCY_FILE);
    }

    void writeRaw(const String& path, const String& content) {
        ASSERT_TRUE(File::Util::WriteBinary(path, reinterpret_cast<const UInt8*>(content.data()), content.size(), true));
    }

    json readJson(const String& path) {
        Vector<UInt8> data;
        EXPECT_TRUE(File::Util::ReadBinary(path, data));
        return json::parse(String(data.begin(), data.end()));
    }
};

TEST_F(DocumentFileBackendTest, Constructor_CreatesLayout) {
    EXPECT_TRUE(backend->available());
    EXPECT_TRUE(backend->SupportsPersistence());
    EXPECT_EQ(backend->GetBackendType(), BackendType::kFile);
    EXPECT_TRUE(Path::isDirectory(instancePath + "/current"));
    EXPECT_TRUE(Path::isDirectory(instancePath + "/update"));
    EXPECT_TRUE(Path::isDirectory(instancePath + "/redundancy"));
}

TEST_F(DocumentFileBackendTest, Load_FirstRunReturnsAndPersistsDefault) {
    auto result = backend->Load();
    ASSERT_TRUE(result.HasValue());
    EXPECT_TRUE(result.Value() == Document());

    ASSERT_TRUE(File::Util::exists(currentPath()));
    json stored = readJson(currentPath());
    for (auto collection : kAllCollections) {
        ASSERT_TRUE(stored.contains(CollectionName(collection)));
        EXPECT_TRUE(stored[CollectionName(collection)].is_array());
    }
    EXPECT_FALSE(File::Util::exists(updatePath()));
}

TEST_F(DocumentFileBackendTest, Load_EmptyFileTreatedAsFirstRun) {
    writeRaw(currentPath(), "");
    auto result = backend->Load();
    ASSERT_TRUE(result.HasValue());
    EXPECT_TRUE(result.Value() == Document());
}

TEST_F(DocumentFileBackendTest, Persist_ThenLoad_Identical) {
    Document doc;
    doc.Upsert(Collection::kEmployees, {{"id", "e1"}, {"name", "A"}});
    doc.Upsert(Collection::kAttendance, {{"id", "a1"}, {"employeeId", "e1"}, {"date", "2024-01-01"}});

    ASSERT_TRUE(backend->Persist(doc).HasValue());
    EXPECT_FALSE(File::Util::exists(updatePath()));

    DocumentFileBackend reopened(storageRoot, "unit");
    auto result = reopened.Load();
    ASSERT_TRUE(result.HasValue());
    EXPECT_TRUE(result.Value() == doc);
}

TEST_F(DocumentFileBackendTest, Persist_KeepsPreviousVersionInRedundancy) {
    Document first;
    first.Upsert(Collection::kEmployees, {{"id", "e1"}, {"name", "A"}});
    ASSERT_TRUE(backend->Persist(first).HasValue());

    Document second = first;
    second.Upsert(Collection::kEmployees, {{"id", "e1"}, {"name", "B"}});
    ASSERT_TRUE(backend->Persist(second).HasValue());

    ASSERT_TRUE(File::Util::exists(redundancyPath()));
    EXPECT_EQ(readJson(redundancyPath())["employees"][0]["name"], "A");
    EXPECT_EQ(readJson(currentPath())["employees"][0]["name"], "B");
}

TEST_F(DocumentFileBackendTest, Persist_WithoutRedundancy) {
    DocumentFileBackend plain(storageRoot, "plain", false);
    Document doc;
    ASSERT_TRUE(plain.Persist(doc).HasValue());
    doc.Upsert(Collection::kLeaves, {{"id", "l1"}});
    ASSERT_TRUE(plain.Persist(doc).HasValue());

    String plainPath = CStoragePathManager::getInstancePath(storageRoot, "plain");
    EXPECT_FALSE(File::Util::exists(
        CStoragePathManager::getDocumentPath(plainPath, LAP_HRMS_CATEGORY_REDUNDANCY, LAP_HRMS_REDUNDANCY_FILE)));
}

TEST_F(DocumentFileBackendTest, Load_CorruptedCurrentRecoversFromRedundancy) {
    Document first;
    first.Upsert(Collection::kEmployees, {{"id", "e1"}, {"name", "A"}});
    ASSERT_TRUE(backend->Persist(first).HasValue());

    Document second = first;
    second.Upsert(Collection::kEmployees, {{"id", "e2"}, {"name", "B"}});
    ASSERT_TRUE(backend->Persist(second).HasValue());

    writeRaw(currentPath(), "{ \"employees\": [ {\"id\": ");

    auto result = backend->Load();
    ASSERT_TRUE(result.HasValue());
    EXPECT_TRUE(result.Value() == first);

    // current/ was restored, redundancy kept
    EXPECT_EQ(readJson(currentPath())["employees"].size(), 1u);
    EXPECT_TRUE(File::Util::exists(redundancyPath()));
}

TEST_F(DocumentFileBackendTest, Load_CorruptedWithoutRedundancyFails) {
    writeRaw(currentPath(), "not json");

    auto result = backend->Load();
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(static_cast<HrmsErrc>(result.Error().Value()), HrmsErrc::kIntegrityCorrupted);
}

TEST_F(DocumentFileBackendTest, Load_StructurallyInvalidIsCorrupted) {
    writeRaw(currentPath(), "{\"employees\": {\"id\": \"e1\"}}");

    auto result = backend->Load();
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(static_cast<HrmsErrc>(result.Error().Value()), HrmsErrc::kIntegrityCorrupted);
}

TEST_F(DocumentFileBackendTest, Load_MissingCollectionsDefaultToEmpty) {
    writeRaw(currentPath(), "{\"employees\": [{\"id\": \"e1\"}]}");

    auto result = backend->Load();
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().Count(Collection::kEmployees), 1u);
    EXPECT_EQ(result.Value().Count(Collection::kUsers), 0u);
}

TEST_F(DocumentFileBackendTest, GetSize_MatchesFile) {
    auto empty = backend->GetSize();
    ASSERT_TRUE(empty.HasValue());
    EXPECT_EQ(empty.Value(), 0u);

    ASSERT_TRUE(backend->Persist(Document()).HasValue());
    auto size = backend->GetSize();
    ASSERT_TRUE(size.HasValue());
    EXPECT_GT(size.Value(), 0u);
}

TEST_F(DocumentFileBackendTest, UnavailableRoot_ReportsStorageUnavailable) {
    writeRaw(storageRoot + "/blocker", "x");

    // instance path below a regular file cannot be created
    DocumentFileBackend broken(storageRoot + "/blocker", "unit");
    EXPECT_FALSE(broken.available());

    auto load = broken.Load();
    ASSERT_FALSE(load.HasValue());
    EXPECT_EQ(static_cast<HrmsErrc>(load.Error().Value()), HrmsErrc::kStorageUnavailable);

    auto persist = broken.Persist(Document());
    ASSERT_FALSE(persist.HasValue());
}

TEST(DocumentMemoryBackendTest, PersistThenLoad) {
    DocumentMemoryBackend backend;
    EXPECT_TRUE(backend.available());
    EXPECT_FALSE(backend.SupportsPersistence());
    EXPECT_EQ(backend.GetBackendType(), BackendType::kMemory);

    auto initial = backend.Load();
    ASSERT_TRUE(initial.HasValue());
    EXPECT_TRUE(initial.Value() == Document());

    Document doc;
    doc.Upsert(Collection::kNotifications, {{"id", "n1"}, {"text", "hello"}});
    ASSERT_TRUE(backend.Persist(doc).HasValue());

    auto loaded = backend.Load();
    ASSERT_TRUE(loaded.HasValue());
    EXPECT_TRUE(loaded.Value() == doc);

    auto size = backend.GetSize();
    ASSERT_TRUE(size.HasValue());
    EXPECT_EQ(size.Value(), doc.ToJson().dump().size());
}

TEST(DocumentBackendFactoryTest, CreatesConfiguredBackend) {
    HrmsConfig config;
    config.backendType = BackendType::kMemory;
    auto memory = CreateDocumentBackend(config);
    ASSERT_NE(memory, nullptr);
    EXPECT_EQ(memory->GetBackendType(), BackendType::kMemory);

    config.backendType = BackendType::kFile;
    config.storageRoot = "/tmp/hrms_factory_test";
    auto file = CreateDocumentBackend(config);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->GetBackendType(), BackendType::kFile);
    EXPECT_TRUE(file->available());

    file.reset();
    Path::removeDirectory("/tmp/hrms_factory_test", true);
}
