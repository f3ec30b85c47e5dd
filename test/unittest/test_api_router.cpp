/**
 * @file test_api_router.cpp
 * @brief Unit tests for ApiRouter status codes and response bodies
 * @date 2025-12-02
 */

#include <gtest/gtest.h>
#include "TestHrms.hpp"

using namespace lap::core;
using namespace lap::hrms;
using namespace hrms_test;
using json = nlohmann::json;

class ApiRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = std::make_shared<ControlledState>();
        publisher = std::make_shared<RecordingPublisher>();
        service.reset(new RecordService(UniqueHandle<IDocumentBackend>(new ControlledBackend(state)),
                                        publisher, FastCredentials(),
                                        std::make_shared<UuidIdentityGenerator>(), HrmsConfig()));
        ASSERT_TRUE(service->Open().HasValue());
        router.reset(new ApiRouter(*service));
    }

    ApiResponse route(const String& method, const String& target, const String& body = "") {
        return router->Route(method, target, body);
    }

    SharedHandle<ControlledState> state;
    std::shared_ptr<RecordingPublisher> publisher;
    std::unique_ptr<RecordService> service;
    std::unique_ptr<ApiRouter> router;
};

TEST_F(ApiRouterTest, ErrorResponseMapping) {
    EXPECT_EQ(ApiRouter::ErrorResponse(MakeErrorCode(HrmsErrc::kValidationFailed, 0)).status, 400u);
    EXPECT_EQ(ApiRouter::ErrorResponse(MakeErrorCode(HrmsErrc::kInvalidArgument, 0)).status, 400u);
    EXPECT_EQ(ApiRouter::ErrorResponse(MakeErrorCode(HrmsErrc::kDuplicateUser, 0)).status, 409u);
    EXPECT_EQ(ApiRouter::ErrorResponse(MakeErrorCode(HrmsErrc::kInvalidCredentials, 0)).status, 401u);
    EXPECT_EQ(ApiRouter::ErrorResponse(MakeErrorCode(HrmsErrc::kNotFound, 0)).status, 404u);

    ApiResponse storage = ApiRouter::ErrorResponse(MakeErrorCode(HrmsErrc::kStorageError, 0));
    EXPECT_EQ(storage.status, 500u);
    EXPECT_EQ(storage.body, json({{"error", "Server error"}}));
}

TEST_F(ApiRouterTest, PreflightHasNoBody) {
    ApiResponse response = route("OPTIONS", "/api/employees");
    EXPECT_EQ(response.status, 204u);
    EXPECT_TRUE(response.body.is_null());
}

TEST_F(ApiRouterTest, UnknownRoutesAre404) {
    EXPECT_EQ(route("GET", "/").status, 404u);
    EXPECT_EQ(route("GET", "/api/").status, 404u);
    EXPECT_EQ(route("GET", "/api/payroll").status, 404u);
    EXPECT_EQ(route("GET", "/api/users").status, 404u);
    EXPECT_EQ(route("GET", "/api/login").status, 404u);
    EXPECT_EQ(route("PATCH", "/api/employees").status, 404u);
    EXPECT_EQ(route("DELETE", "/api/leaves/l1").status, 404u);
    EXPECT_EQ(route("PUT", "/api/employees/e1", R"({"status":"x"})").status, 404u);
}

TEST_F(ApiRouterTest, PostThenGetCollection) {
    ApiResponse posted = route("POST", "/api/employees", R"({"id":"e1","name":"Alice"})");
    EXPECT_EQ(posted.status, 200u);
    EXPECT_EQ(posted.body, json({{"ok", true}, {"id", "e1"}}));

    ApiResponse listed = route("GET", "/api/employees?page=1");
    EXPECT_EQ(listed.status, 200u);
    ASSERT_TRUE(listed.body.is_array());
    ASSERT_EQ(listed.body.size(), 1u);
    EXPECT_EQ(listed.body[0]["name"], "Alice");
}

TEST_F(ApiRouterTest, PostGeneratesId) {
    ApiResponse posted = route("POST", "/api/notifications", R"({"text":"hello"})");
    EXPECT_EQ(posted.status, 200u);
    ASSERT_TRUE(posted.body["id"].is_string());
    EXPECT_FALSE(posted.body["id"].get<String>().empty());
}

TEST_F(ApiRouterTest, BadBodiesAre400) {
    EXPECT_EQ(route("POST", "/api/employees", "{not json").status, 400u);
    EXPECT_EQ(route("POST", "/api/employees", "[1,2]").status, 400u);
    EXPECT_EQ(route("POST", "/api/employees", R"({"id":5})").status, 400u);

    ApiResponse attendance = route("POST", "/api/attendance", R"({"employeeId":"E1"})");
    EXPECT_EQ(attendance.status, 400u);
    EXPECT_EQ(attendance.body, json({{"error", "Invalid request"}}));
}

TEST_F(ApiRouterTest, DeleteEmployee) {
    ASSERT_EQ(route("POST", "/api/employees", R"({"id":"e 1"})").status, 200u);

    ApiResponse removed = route("DELETE", "/api/employees/e%201");
    EXPECT_EQ(removed.status, 200u);
    EXPECT_EQ(removed.body, json({{"ok", true}}));
    EXPECT_TRUE(route("GET", "/api/employees").body.empty());

    // absent id still succeeds
    EXPECT_EQ(route("DELETE", "/api/employees/ghost").status, 200u);
    EXPECT_EQ(route("DELETE", "/api/employees/bad%2").status, 404u);
}

TEST_F(ApiRouterTest, PutLeaveStatus) {
    ASSERT_EQ(route("POST", "/api/leaves", R"({"id":"l1","status":"pending"})").status, 200u);

    EXPECT_EQ(route("PUT", "/api/leaves/l1", R"({"reason":"x"})").status, 400u);
    EXPECT_EQ(route("PUT", "/api/leaves/nope", R"({"status":"approved"})").status, 404u);

    ApiResponse updated = route("PUT", "/api/leaves/l1", R"({"status":"approved"})");
    EXPECT_EQ(updated.status, 200u);
    EXPECT_EQ(route("GET", "/api/leaves").body[0]["status"], "approved");
}

TEST_F(ApiRouterTest, CreateSuperAndLogin) {
    ApiResponse missing = route("POST", "/api/create-super", R"({"username":"root"})");
    EXPECT_EQ(missing.status, 400u);
    EXPECT_EQ(missing.body, json({{"error", "Missing username/password"}}));

    EXPECT_EQ(route("POST", "/api/create-super", R"({"username":"root","password":"pw"})").status, 200u);
    EXPECT_EQ(route("POST", "/api/create-super", R"({"username":"root","password":"pw2"})").status, 409u);

    ApiResponse login = route("POST", "/api/login", R"({"username":"root","password":"pw"})");
    EXPECT_EQ(login.status, 200u);
    EXPECT_EQ(login.body["username"], "root");
    EXPECT_EQ(login.body["role"], "superadmin");
    EXPECT_FALSE(login.body.contains("password"));
}

TEST_F(ApiRouterTest, LoginFailuresShareOneResponse) {
    ASSERT_EQ(route("POST", "/api/create-super", R"({"username":"root","password":"pw"})").status, 200u);

    ApiResponse wrongSecret = route("POST", "/api/login", R"({"username":"root","password":"bad"})");
    ApiResponse unknownUser = route("POST", "/api/login", R"({"username":"ghost","password":"pw"})");
    ApiResponse wrongType = route("POST", "/api/login", R"({"username":1,"password":"pw"})");

    EXPECT_EQ(wrongSecret.status, 401u);
    EXPECT_EQ(wrongSecret.status, unknownUser.status);
    EXPECT_EQ(wrongSecret.body, unknownUser.body);
    EXPECT_EQ(wrongType.body, unknownUser.body);
}

TEST_F(ApiRouterTest, StorageFailureIs500WithoutDetail) {
    state->failPersist = true;
    ApiResponse response = route("POST", "/api/employees", R"({"id":"e1"})");
    EXPECT_EQ(response.status, 500u);
    EXPECT_EQ(response.body, json({{"error", "Server error"}}));
    EXPECT_TRUE(publisher->Events().empty());
}
