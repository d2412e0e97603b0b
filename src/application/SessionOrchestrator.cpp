#include "application/SessionOrchestrator.hpp"
#include "adapters/secondary/JwtTokenCodec.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "domain/exceptions/ConfigurationException.hpp"

#include <iostream>

namespace slsession::application {

using ports::input::RequestSession;

namespace {

domain::SetCookie secureDefaultCookie() {
    return domain::SetCookie::create(SessionOrchestrator::DEFAULT_COOKIE)
        .withPath("/")
        .withSecure(true)
        .withHttpOnly(true);
}

std::shared_ptr<ports::output::IClock> clockOrSystem(std::shared_ptr<ports::output::IClock> clock) {
    if (clock) {
        return clock;
    }
    return std::make_shared<adapters::secondary::SystemClock>();
}

} // namespace

SessionOrchestrator::SessionOrchestrator(
    std::shared_ptr<ports::output::ITokenCodec> codec,
    std::shared_ptr<ports::output::IClock> clock,
    const domain::SetCookie& defaultCookie,
    int expirationSeconds,
    int refreshPercent,
    bool debugLogging)
    : codec_(std::move(codec))
    , clock_(std::move(clock))
    , cookiePolicy_(defaultCookie)
    , expirationSeconds_(expirationSeconds)
    , refreshPercent_(refreshPercent)
    , debugLogging_(debugLogging)
{
    if (!codec_) {
        throw domain::ConfigurationException("SessionOrchestrator requires a token codec");
    }
    if (!clock_) {
        throw domain::ConfigurationException("SessionOrchestrator requires a clock");
    }
    if (cookiePolicy_.getCookieName().empty()) {
        throw domain::ConfigurationException("Session cookie name must not be empty");
    }
    if (expirationSeconds_ <= 0) {
        throw domain::ConfigurationException(
            "Session expiration must be positive, got " + std::to_string(expirationSeconds_));
    }
    if (refreshPercent_ < 0 || refreshPercent_ > 100) {
        throw domain::ConfigurationException(
            "Refresh percent must be in [0, 100], got " + std::to_string(refreshPercent_));
    }

    std::cout << "[SessionOrchestrator] Created (cookie=" << cookiePolicy_.getCookieName()
              << ", ttl=" << expirationSeconds_ << "s, refresh=" << refreshPercent_ << "%)" << std::endl;
}

std::shared_ptr<SessionOrchestrator> SessionOrchestrator::fromSymmetricKeyDefaults(
    const std::string& symmetricKey,
    int expirationSeconds,
    std::shared_ptr<ports::output::IClock> clock)
{
    clock = clockOrSystem(std::move(clock));
    auto codec = std::make_shared<adapters::secondary::JwtTokenCodec>(
        domain::KeyMaterial::symmetric(symmetricKey), clock);

    return std::make_shared<SessionOrchestrator>(
        codec, clock, secureDefaultCookie(), expirationSeconds);
}

std::shared_ptr<SessionOrchestrator> SessionOrchestrator::fromAsymmetricKeyDefaults(
    const std::string& privateRsaKey,
    const std::string& publicRsaKey,
    int expirationSeconds,
    std::shared_ptr<ports::output::IClock> clock)
{
    clock = clockOrSystem(std::move(clock));
    auto codec = std::make_shared<adapters::secondary::JwtTokenCodec>(
        domain::KeyMaterial::asymmetric(privateRsaKey, publicRsaKey), clock);

    return std::make_shared<SessionOrchestrator>(
        codec, clock, secureDefaultCookie(), expirationSeconds);
}

std::shared_ptr<SessionOrchestrator> SessionOrchestrator::fromSettings(
    const settings::ISessionSettings& settings,
    std::shared_ptr<ports::output::IClock> clock)
{
    clock = clockOrSystem(std::move(clock));
    auto codec = std::make_shared<adapters::secondary::JwtTokenCodec>(settings.getKeyMaterial(), clock);

    return std::make_shared<SessionOrchestrator>(
        codec,
        clock,
        settings.getDefaultCookie(),
        settings.getExpirationSeconds(),
        settings.getRefreshPercent(),
        settings.isDebugLogging());
}

const std::string& SessionOrchestrator::getCookieName() const
{
    return cookiePolicy_.getCookieName();
}

RequestSession SessionOrchestrator::openSession(const std::optional<std::string>& cookieValue) const
{
    if (!cookieValue) {
        return RequestSession{domain::SessionData::newEmptySession(), false};
    }

    auto result = codec_->validate(*cookieValue);
    if (!result.valid()) {
        if (debugLogging_) {
            std::cerr << "[SessionOrchestrator] Token rejected: "
                      << ports::output::toString(result.rejection) << std::endl;
        }
        return RequestSession{domain::SessionData::newEmptySession(), false};
    }

    const auto& claims = *result.claims;
    return RequestSession{
        domain::SessionData::fromClaimData(claims.sessionData),
        isRefreshDue(claims, clock_->now())
    };
}

std::optional<domain::SetCookie> SessionOrchestrator::closeSession(const RequestSession& requestSession) const
{
    const auto& session = requestSession.session;
    int64_t now = clock_->now();

    if (session.isEmpty() && session.hasChanged()) {
        return cookiePolicy_.expire(now);
    }

    if (!session.hasChanged() && !requestSession.refreshRequired) {
        return std::nullopt;
    }

    std::string token = codec_->createToken(session, now, expirationSeconds_);
    return cookiePolicy_.issue(token, now + expirationSeconds_);
}

std::optional<domain::SetCookie> SessionOrchestrator::handle(
    const std::optional<std::string>& cookieValue,
    const ports::input::SessionCallback& next) const
{
    auto requestSession = openSession(cookieValue);

    if (next) {
        next(requestSession.session);
    }

    return closeSession(requestSession);
}

bool SessionOrchestrator::isRefreshDue(const domain::SessionTokenClaims& claims, int64_t now) const
{
    int64_t elapsed = now - claims.issuedAt;
    int64_t window = claims.lifetimeSeconds();

    return elapsed * 100 >= window * (100 - refreshPercent_);
}

} // namespace slsession::application
