#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace slsession::domain {

/**
 * @brief Данные сессии одного запроса
 *
 * Key/value хранилище, которое передаётся downstream handler'у.
 * Значения: произвольный JSON.
 *
 * Отслеживание изменений грубое: любой мутирующий вызов (set, remove, clear)
 * взводит флаг changed, сравнение значений не выполняется.
 * Флаг никогда не сбрасывается обратно в false.
 */
class SessionData {
public:
    /**
     * @brief Создать сессию из claim'а session-data проверенного токена
     *
     * @param data JSON объект; любое другое значение даёт пустую сессию
     */
    static SessionData fromClaimData(const nlohmann::json& data) {
        SessionData session;
        if (data.is_object()) {
            for (auto it = data.begin(); it != data.end(); ++it) {
                session.values_[it.key()] = it.value();
            }
        }
        return session;
    }

    /**
     * @brief Создать пустую сессию (нет токена или токен отклонён)
     */
    static SessionData newEmptySession() {
        return SessionData();
    }

    /**
     * @brief Получить значение
     *
     * @param key Ключ
     * @param defaultValue Что вернуть, если ключа нет
     */
    nlohmann::json get(const std::string& key,
                       const nlohmann::json& defaultValue = nullptr) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return defaultValue;
        }
        return it->second;
    }

    bool has(const std::string& key) const {
        return values_.count(key) > 0;
    }

    void set(const std::string& key, const nlohmann::json& value) {
        values_[key] = value;
        changed_ = true;
    }

    void remove(const std::string& key) {
        values_.erase(key);
        changed_ = true;
    }

    /**
     * @brief Очистить сессию
     *
     * Помечает сессию изменённой даже если она уже была пустой:
     * пустая изменённая сессия означает "удалить cookie у клиента".
     */
    void clear() {
        values_.clear();
        changed_ = true;
    }

    bool isEmpty() const { return values_.empty(); }
    bool hasChanged() const { return changed_; }

    /**
     * @brief Сериализовать содержимое в JSON объект (для session-data claim)
     */
    nlohmann::json toJson() const {
        nlohmann::json result = nlohmann::json::object();
        for (const auto& [key, value] : values_) {
            result[key] = value;
        }
        return result;
    }

private:
    SessionData() = default;

    std::map<std::string, nlohmann::json> values_;
    bool changed_ = false;
};

} // namespace slsession::domain
