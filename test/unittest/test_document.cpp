/**
 * @file test_document.cpp
 * @brief Unit tests for Document (collections, identity, upsert, removal)
 * @date 2025-12-02
 */

#include <gtest/gtest.h>
#include "CDocument.hpp"

using namespace lap::hrms;
using namespace lap::core;
using json = nlohmann::json;

TEST(DocumentTest, Default_HasFiveEmptyCollections) {
    Document doc;
    for (auto collection : kAllCollections) {
        EXPECT_TRUE(doc.GetCollection(collection).is_array()) << CollectionName(collection);
        EXPECT_EQ(doc.Count(collection), 0u);
    }

    json root = doc.ToJson();
    EXPECT_EQ(root.size(), 5u);
    EXPECT_TRUE(root["users"].is_array());
    EXPECT_TRUE(root["notifications"].is_array());
}

TEST(DocumentTest, CollectionFromName_KnownAndUnknown) {
    Collection collection;
    EXPECT_TRUE(CollectionFromName("leaves", collection));
    EXPECT_EQ(collection, Collection::kLeaves);
    EXPECT_TRUE(CollectionFromName("attendance", collection));
    EXPECT_EQ(collection, Collection::kAttendance);
    EXPECT_FALSE(CollectionFromName("payroll", collection));
    EXPECT_FALSE(CollectionFromName("", collection));
}

TEST(DocumentTest, FromJson_NullGivesDefault) {
    auto result = Document::FromJson(json());
    ASSERT_TRUE(result.HasValue());
    EXPECT_TRUE(result.Value() == Document());
}

TEST(DocumentTest, FromJson_MissingCollectionsDefaultToEmpty) {
    json root = {{"employees", json::array({{{"id", "e1"}, {"name", "A"}}})}};
    auto result = Document::FromJson(root);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().Count(Collection::kEmployees), 1u);
    EXPECT_EQ(result.Value().Count(Collection::kLeaves), 0u);
    EXPECT_TRUE(result.Value().GetCollection(Collection::kUsers).is_array());
}

TEST(DocumentTest, FromJson_NullCollectionDefaultsToEmpty) {
    json root = {{"leaves", nullptr}};
    auto result = Document::FromJson(root);
    ASSERT_TRUE(result.HasValue());
    EXPECT_TRUE(result.Value().GetCollection(Collection::kLeaves).is_array());
}

TEST(DocumentTest, FromJson_RejectsNonObjectRoot) {
    auto result = Document::FromJson(json::array());
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(static_cast<HrmsErrc>(result.Error().Value()), HrmsErrc::kIntegrityCorrupted);
}

TEST(DocumentTest, FromJson_RejectsNonArrayCollection) {
    json root = {{"employees", {{"id", "e1"}}}};
    auto result = Document::FromJson(root);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(static_cast<HrmsErrc>(result.Error().Value()), HrmsErrc::kIntegrityCorrupted);
}

TEST(DocumentTest, FromJson_RejectsNonObjectRecord) {
    json root = {{"employees", json::array({"e1"})}};
    auto result = Document::FromJson(root);
    ASSERT_FALSE(result.HasValue());
}

TEST(DocumentTest, ToJson_FromJson_PreservesOrder) {
    Document doc;
    doc.Upsert(Collection::kNotifications, {{"id", "n2"}, {"text", "second"}});
    doc.Upsert(Collection::kNotifications, {{"id", "n1"}, {"text", "first"}});

    auto reloaded = Document::FromJson(doc.ToJson());
    ASSERT_TRUE(reloaded.HasValue());
    EXPECT_TRUE(reloaded.Value() == doc);
    EXPECT_EQ(reloaded.Value().GetCollection(Collection::kNotifications)[0]["id"], "n2");
}

TEST(DocumentTest, Upsert_AppendsWhenAbsent) {
    Document doc;
    auto outcome = doc.Upsert(Collection::kEmployees, {{"id", "e1"}, {"name", "A"}});
    EXPECT_EQ(outcome.kind, ChangeKind::kCreated);
    EXPECT_EQ(outcome.stored["name"], "A");
    EXPECT_EQ(doc.Count(Collection::kEmployees), 1u);
}

TEST(DocumentTest, Upsert_ShallowMergeKeepsAbsentFields) {
    Document doc;
    doc.Upsert(Collection::kEmployees, {{"id", "e1"}, {"name", "A"}, {"dept", "HR"}});
    auto outcome = doc.Upsert(Collection::kEmployees, {{"id", "e1"}, {"name", "B"}, {"phone", "123"}});

    EXPECT_EQ(outcome.kind, ChangeKind::kUpdated);
    ASSERT_EQ(doc.Count(Collection::kEmployees), 1u);

    const Record* stored = doc.FindByIdentity(Collection::kEmployees, "e1");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ((*stored)["name"], "B");
    EXPECT_EQ((*stored)["dept"], "HR");
    EXPECT_EQ((*stored)["phone"], "123");
    EXPECT_EQ(outcome.stored, *stored);
}

TEST(DocumentTest, Upsert_AttendanceMatchesCompositeKey) {
    Document doc;
    doc.Upsert(Collection::kAttendance, {{"id", "a1"}, {"employeeId", "E1"}, {"date", "2024-01-01"}, {"status", "present"}});
    auto outcome = doc.Upsert(Collection::kAttendance, {{"id", "a2"}, {"employeeId", "E1"}, {"date", "2024-01-01"}, {"status", "late"}});

    EXPECT_EQ(outcome.kind, ChangeKind::kUpdated);
    EXPECT_EQ(doc.Count(Collection::kAttendance), 1u);
    EXPECT_EQ(doc.GetCollection(Collection::kAttendance)[0]["status"], "late");
}

TEST(DocumentTest, Upsert_AttendanceDifferentDateAppends) {
    Document doc;
    doc.Upsert(Collection::kAttendance, {{"id", "a1"}, {"employeeId", "E1"}, {"date", "2024-01-01"}});
    doc.Upsert(Collection::kAttendance, {{"id", "a1"}, {"employeeId", "E1"}, {"date", "2024-01-02"}});
    EXPECT_EQ(doc.Count(Collection::kAttendance), 2u);
}

TEST(DocumentTest, FindByIdentity_EmptyIdNeverMatches) {
    Document doc;
    doc.Upsert(Collection::kLeaves, {{"id", "l1"}});
    EXPECT_EQ(doc.FindByIdentity(Collection::kLeaves, ""), nullptr);
    EXPECT_NE(doc.FindByIdentity(Collection::kLeaves, "l1"), nullptr);
    EXPECT_EQ(doc.FindByIdentity(Collection::kEmployees, "l1"), nullptr);
}

TEST(DocumentTest, FindByCompositeKey_OnlyForAttendance) {
    Document doc;
    doc.Upsert(Collection::kAttendance, {{"id", "a1"}, {"employeeId", "E1"}, {"date", "2024-01-01"}});

    json key = {{"employeeId", "E1"}, {"date", "2024-01-01"}};
    EXPECT_NE(doc.FindByCompositeKey(Collection::kAttendance, key), nullptr);
    EXPECT_EQ(doc.FindByCompositeKey(Collection::kEmployees, key), nullptr);
    EXPECT_EQ(doc.FindByCompositeKey(Collection::kAttendance, {{"employeeId", "E1"}}), nullptr);
}

TEST(DocumentTest, RemoveByIdentity_RemovesAndIsIdempotent) {
    Document doc;
    doc.Upsert(Collection::kEmployees, {{"id", "e1"}});
    doc.Upsert(Collection::kEmployees, {{"id", "e2"}});

    EXPECT_TRUE(doc.RemoveByIdentity(Collection::kEmployees, "e1"));
    EXPECT_EQ(doc.Count(Collection::kEmployees), 1u);
    EXPECT_EQ(doc.GetCollection(Collection::kEmployees)[0]["id"], "e2");

    Document before = doc;
    EXPECT_FALSE(doc.RemoveByIdentity(Collection::kEmployees, "e1"));
    EXPECT_TRUE(doc == before);
}

TEST(DocumentTest, Equality_DetectsDifference) {
    Document a;
    Document b;
    EXPECT_TRUE(a == b);
    b.Upsert(Collection::kUsers, {{"id", "u1"}});
    EXPECT_TRUE(a != b);
}
