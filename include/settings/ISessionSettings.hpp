#pragma once

#include "domain/KeyMaterial.hpp"
#include "domain/SetCookie.hpp"

namespace slsession::settings {

class ISessionSettings {
public:
    virtual ~ISessionSettings() = default;

    virtual domain::KeyMaterial getKeyMaterial() const = 0;
    virtual domain::SetCookie getDefaultCookie() const = 0;
    virtual int getExpirationSeconds() const = 0;
    virtual int getRefreshPercent() const = 0;
    virtual bool isDebugLogging() const = 0;
};

} // namespace slsession::settings
