#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/SessionData.hpp"

namespace slsession::adapters::primary {

/**
 * @brief HTTP обработчик, работающий с сессией
 *
 * Вызывается из SessionMiddleware. Сессия принадлежит текущему запросу:
 * ссылку нельзя сохранять после возврата из handle().
 */
class ISessionHandler {
public:
    virtual ~ISessionHandler() = default;

    virtual void handle(IRequest& req, IResponse& res, domain::SessionData& session) = 0;
};

} // namespace slsession::adapters::primary
