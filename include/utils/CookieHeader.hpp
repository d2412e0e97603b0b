#pragma once

#include <map>
#include <optional>
#include <string>

namespace slsession::utils {

/**
 * @brief Разбор заголовка запроса Cookie
 *
 * "a=1; slsession=eyJ...; b=2" → {a: "1", slsession: "eyJ...", b: "2"}
 *
 * Значения не декодируются (токен base64url и так cookie-safe),
 * только снимаются кавычки вокруг значения. При повторе имени побеждает первое.
 */
class CookieHeader {
public:
    static std::map<std::string, std::string> parse(const std::string& header) {
        std::map<std::string, std::string> cookies;

        size_t start = 0;
        while (start <= header.size()) {
            auto end = header.find(';', start);
            if (end == std::string::npos) {
                end = header.size();
            }

            std::string pair = trim(header.substr(start, end - start));
            auto eq = pair.find('=');
            if (eq != std::string::npos) {
                std::string name = trim(pair.substr(0, eq));
                std::string value = unquote(trim(pair.substr(eq + 1)));
                if (!name.empty()) {
                    cookies.emplace(name, value);
                }
            }

            start = end + 1;
        }
        return cookies;
    }

    static std::optional<std::string> find(const std::string& header, const std::string& name) {
        auto cookies = parse(header);
        auto it = cookies.find(name);
        if (it == cookies.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    static std::string trim(const std::string& s) {
        auto first = s.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return "";
        }
        auto last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }

    static std::string unquote(const std::string& s) {
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }
};

} // namespace slsession::utils
