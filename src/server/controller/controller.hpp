#ifndef FIRETV_SERVER_CONTROLLER_CONTROLLER_HPP
#define FIRETV_SERVER_CONTROLLER_CONTROLLER_HPP

#include "../app.hpp"

namespace firetv::server::controller {

/**
 * @brief Base class for all HTTP controllers
 *
 * All controllers must inherit from this class and implement
 * the registerRoutes() method to define their HTTP endpoints.
 */
class Controller {
public:
    virtual ~Controller() = default;

    /**
     * @brief Register HTTP routes with the Crow application
     * @param app The Crow application instance
     */
    virtual void registerRoutes(ServerApp& app) = 0;
};

}  // namespace firetv::server::controller

#endif  // FIRETV_SERVER_CONTROLLER_CONTROLLER_HPP
