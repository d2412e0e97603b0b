#pragma once

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>

namespace slsession::domain {

/**
 * @brief Описание исходящей cookie (значение заголовка Set-Cookie)
 *
 * Immutable: все with*() возвращают изменённую копию, исходный объект не трогают.
 * Поэтому один шаблон можно безопасно использовать из многих запросов одновременно.
 */
class SetCookie {
public:
    explicit SetCookie(std::string name)
        : name_(std::move(name)) {}

    static SetCookie create(const std::string& name) {
        return SetCookie(name);
    }

    SetCookie withValue(const std::string& value) const {
        SetCookie copy(*this);
        copy.value_ = value;
        return copy;
    }

    SetCookie withDomain(const std::string& domain) const {
        SetCookie copy(*this);
        copy.domain_ = domain;
        return copy;
    }

    SetCookie withPath(const std::string& path) const {
        SetCookie copy(*this);
        copy.path_ = path;
        return copy;
    }

    SetCookie withSecure(bool secure) const {
        SetCookie copy(*this);
        copy.secure_ = secure;
        return copy;
    }

    SetCookie withHttpOnly(bool httpOnly) const {
        SetCookie copy(*this);
        copy.httpOnly_ = httpOnly;
        return copy;
    }

    SetCookie withMaxAge(std::optional<int64_t> maxAge) const {
        SetCookie copy(*this);
        copy.maxAge_ = maxAge;
        return copy;
    }

    /**
     * @param expires Unix timestamp (секунды)
     */
    SetCookie withExpires(std::optional<int64_t> expires) const {
        SetCookie copy(*this);
        copy.expires_ = expires;
        return copy;
    }

    const std::string& getName() const { return name_; }
    const std::string& getValue() const { return value_; }
    const std::string& getDomain() const { return domain_; }
    const std::string& getPath() const { return path_; }
    bool getSecure() const { return secure_; }
    bool getHttpOnly() const { return httpOnly_; }
    std::optional<int64_t> getMaxAge() const { return maxAge_; }
    std::optional<int64_t> getExpires() const { return expires_; }

    /**
     * @brief Сформировать значение заголовка Set-Cookie
     *
     * Пример: "slsession=eyJ...; Domain=example.com; Path=/;
     *          Expires=Sun, 06 Nov 1994 08:49:37 GMT; Max-Age=1200; Secure; HttpOnly"
     */
    std::string toHeaderValue() const {
        std::ostringstream ss;
        ss << name_ << "=" << value_;
        if (!domain_.empty()) {
            ss << "; Domain=" << domain_;
        }
        if (!path_.empty()) {
            ss << "; Path=" << path_;
        }
        if (expires_) {
            ss << "; Expires=" << formatHttpDate(*expires_);
        }
        if (maxAge_) {
            ss << "; Max-Age=" << *maxAge_;
        }
        if (secure_) {
            ss << "; Secure";
        }
        if (httpOnly_) {
            ss << "; HttpOnly";
        }
        return ss.str();
    }

private:
    std::string name_;
    std::string value_;
    std::string domain_;
    std::string path_;
    bool secure_ = false;
    bool httpOnly_ = false;
    std::optional<int64_t> maxAge_;
    std::optional<int64_t> expires_;

    // IMF-fixdate (RFC 7231), всегда GMT
    static std::string formatHttpDate(int64_t timestamp) {
        std::time_t t = static_cast<std::time_t>(timestamp);
        std::tm tm{};
        gmtime_r(&t, &tm);

        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
        return ss.str();
    }
};

} // namespace slsession::domain
