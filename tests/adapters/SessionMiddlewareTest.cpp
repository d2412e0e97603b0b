/**
 * @file SessionMiddlewareTest.cpp
 * @brief Тесты SessionMiddleware вместе с demo handler'ами
 *
 * Тестируемые endpoint-ы:
 * - GET    /api/v1/session → SessionInfoHandler
 * - PUT    /api/v1/session → SessionWriteHandler
 * - DELETE /api/v1/session → SessionClearHandler
 * - GET    /health          → HealthHandler
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "adapters/primary/SessionMiddleware.hpp"
#include "adapters/primary/SessionInfoHandler.hpp"
#include "adapters/primary/SessionWriteHandler.hpp"
#include "adapters/primary/SessionClearHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "application/SessionOrchestrator.hpp"
#include "mocks/FixedClock.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

#include <map>

using namespace slsession::adapters::primary;
using slsession::application::SessionOrchestrator;
using slsession::tests::mocks::FixedClock;
using json = nlohmann::json;

namespace {

constexpr int64_t NOW = 1700000000;

// "slsession=<token>; Expires=..." → "<token>"
std::string cookieValueOf(const std::string& setCookie) {
    auto start = setCookie.find('=') + 1;
    auto end = setCookie.find(';');
    return setCookie.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

class StubSessionSettings : public slsession::settings::ISessionSettings {
public:
    slsession::domain::KeyMaterial getKeyMaterial() const override {
        return slsession::domain::KeyMaterial::symmetric("middleware-key");
    }
    slsession::domain::SetCookie getDefaultCookie() const override {
        return slsession::domain::SetCookie::create("slsession");
    }
    int getExpirationSeconds() const override { return 1200; }
    int getRefreshPercent() const override { return 10; }
    bool isDebugLogging() const override { return false; }
};

} // namespace

// ============================================================================
// TEST FIXTURE
// ============================================================================

class SessionMiddlewareTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FixedClock>(NOW);
        orchestrator_ = SessionOrchestrator::fromSymmetricKeyDefaults("middleware-key", 1200, clock_);

        info_ = std::make_shared<SessionMiddleware>(orchestrator_, std::make_shared<SessionInfoHandler>());
        write_ = std::make_shared<SessionMiddleware>(orchestrator_, std::make_shared<SessionWriteHandler>());
        clear_ = std::make_shared<SessionMiddleware>(orchestrator_, std::make_shared<SessionClearHandler>());
    }

    /**
     * @brief Создать HTTP запрос, опционально с session cookie
     */
    SimpleRequest createRequest(
        const std::string& method,
        const std::string& body = "",
        const std::string& token = ""
    ) {
        std::map<std::string, std::string> headers;
        headers["Content-Type"] = "application/json";

        if (!token.empty()) {
            headers["Cookie"] = "theme=dark; slsession=" + token + "; lang=ru";
        }

        return SimpleRequest(method, "/api/v1/session", body, "127.0.0.1", 8080, headers);
    }

    json parseResponse(const SimpleResponse& res) {
        return json::parse(res.getBody());
    }

    /**
     * @brief PUT с телом и вернуть выданный токен
     */
    std::string writeAndGetToken(const json& body, const std::string& token = "") {
        auto req = createRequest("PUT", body.dump(), token);
        SimpleResponse res;
        write_->handle(req, res);

        auto setCookie = res.getHeader("Set-Cookie");
        if (res.getStatus() != 200 || !setCookie) {
            return "";
        }
        return cookieValueOf(*setCookie);
    }

    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<SessionOrchestrator> orchestrator_;
    std::shared_ptr<SessionMiddleware> info_;
    std::shared_ptr<SessionMiddleware> write_;
    std::shared_ptr<SessionMiddleware> clear_;
};

// ============================================================================
// GET /api/v1/session
// ============================================================================

TEST_F(SessionMiddlewareTest, Read_NoCookie_EmptySessionAndNoSetCookie) {
    auto req = createRequest("GET");
    SimpleResponse res;

    info_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = parseResponse(res);
    EXPECT_TRUE(body["empty"].get<bool>());
    EXPECT_EQ(body["session"], json::object());
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

TEST_F(SessionMiddlewareTest, Read_GarbageCookie_TreatedAsNewVisitor) {
    auto req = createRequest("GET", "", "garbage.token.value");
    SimpleResponse res;

    info_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(parseResponse(res)["empty"].get<bool>());
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

TEST_F(SessionMiddlewareTest, Read_ValidCookie_UnchangedSessionLeavesHeadersAlone) {
    auto token = writeAndGetToken({{"user", "alice"}});
    ASSERT_FALSE(token.empty());

    clock_->advance(10);
    auto req = createRequest("GET", "", token);
    SimpleResponse res;
    info_->handle(req, res);

    auto body = parseResponse(res);
    EXPECT_FALSE(body["empty"].get<bool>());
    EXPECT_EQ(body["session"]["user"], "alice");
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

TEST_F(SessionMiddlewareTest, Read_NearExpiration_RefreshesCookie) {
    auto token = writeAndGetToken({{"user", "alice"}});
    ASSERT_FALSE(token.empty());

    // ttl 1200, refresh 10% → перевыпуск после 1080 секунд
    clock_->advance(1100);
    auto req = createRequest("GET", "", token);
    SimpleResponse res;
    info_->handle(req, res);

    auto setCookie = res.getHeader("Set-Cookie");
    ASSERT_TRUE(setCookie.has_value());
    EXPECT_NE(cookieValueOf(*setCookie), token);
    EXPECT_EQ(parseResponse(res)["session"]["user"], "alice");
}

// ============================================================================
// PUT /api/v1/session
// ============================================================================

TEST_F(SessionMiddlewareTest, Write_SetsSecureHttpOnlyCookie) {
    auto req = createRequest("PUT", json{{"cart", {1, 2, 3}}}.dump());
    SimpleResponse res;

    write_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto setCookie = res.getHeader("Set-Cookie");
    ASSERT_TRUE(setCookie.has_value());
    EXPECT_EQ(setCookie->rfind("slsession=", 0), 0u);
    EXPECT_NE(setCookie->find("; Path=/"), std::string::npos);
    EXPECT_NE(setCookie->find("; Secure"), std::string::npos);
    EXPECT_NE(setCookie->find("; HttpOnly"), std::string::npos);
    EXPECT_NE(setCookie->find("; Expires="), std::string::npos);
}

TEST_F(SessionMiddlewareTest, Write_ThenRead_FullCycle) {
    auto token = writeAndGetToken({{"cart", {1, 2, 3}}, {"user", "bob"}});
    ASSERT_FALSE(token.empty());

    // Удаляем ключ через null
    clock_->advance(5);
    auto updated = writeAndGetToken({{"user", nullptr}}, token);
    ASSERT_FALSE(updated.empty());

    clock_->advance(5);
    auto req = createRequest("GET", "", updated);
    SimpleResponse res;
    info_->handle(req, res);

    auto body = parseResponse(res);
    EXPECT_EQ(body["session"], json({{"cart", {1, 2, 3}}}));
}

TEST_F(SessionMiddlewareTest, Write_InvalidJson_Returns400WithoutCookie) {
    auto req = createRequest("PUT", "not valid json{");
    SimpleResponse res;

    write_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_TRUE(parseResponse(res).contains("error"));
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

TEST_F(SessionMiddlewareTest, Write_NonObjectBody_Returns400) {
    auto req = createRequest("PUT", "[1, 2, 3]");
    SimpleResponse res;

    write_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

// ============================================================================
// DELETE /api/v1/session
// ============================================================================

TEST_F(SessionMiddlewareTest, Clear_SendsExpirationCookie) {
    auto token = writeAndGetToken({{"user", "alice"}});
    ASSERT_FALSE(token.empty());

    auto req = createRequest("DELETE", "", token);
    SimpleResponse res;
    clear_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(parseResponse(res)["cleared"].get<bool>());

    auto setCookie = res.getHeader("Set-Cookie");
    ASSERT_TRUE(setCookie.has_value());
    EXPECT_EQ(setCookie->rfind("slsession=;", 0), 0u);
    EXPECT_NE(setCookie->find("; Expires="), std::string::npos);
}

// ============================================================================
// Без inner handler'а
// ============================================================================

TEST_F(SessionMiddlewareTest, NoInnerHandler_ValidCookieNotTouched) {
    auto token = writeAndGetToken({{"user", "alice"}});
    ASSERT_FALSE(token.empty());

    SessionMiddleware bare(orchestrator_);
    auto req = createRequest("GET", "", token);
    SimpleResponse res;

    bare.handle(req, res);

    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
    EXPECT_TRUE(res.getBody().empty());
}

TEST_F(SessionMiddlewareTest, OtherCookiesOnly_TreatedAsNoSession) {
    std::map<std::string, std::string> headers;
    headers["Cookie"] = "theme=dark; lang=ru";
    SimpleRequest req("GET", "/api/v1/session", "", "127.0.0.1", 8080, headers);
    SimpleResponse res;

    info_->handle(req, res);

    EXPECT_TRUE(parseResponse(res)["empty"].get<bool>());
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

// ============================================================================
// GET /health
// ============================================================================

TEST(HealthHandlerTest, ReportsSessionConfigurationWithoutKeys) {
    HealthHandler handler(std::make_shared<StubSessionSettings>());
    std::map<std::string, std::string> headers;
    SimpleRequest req("GET", "/health", "", "127.0.0.1", 8080, headers);
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto body = json::parse(res.getBody());
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["session"]["algorithm"], "HS256");
    EXPECT_EQ(body["session"]["cookie"], "slsession");
    EXPECT_EQ(body["session"]["expiration_seconds"], 1200);
    EXPECT_EQ(res.getBody().find("middleware-key"), std::string::npos);
}
