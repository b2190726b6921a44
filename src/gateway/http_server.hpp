#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include <string>
#include <memory>
#include <functional>
#include "crow.h"

class AdminClient;

class HttpServer {
public:
    HttpServer(std::shared_ptr<AdminClient> admin);
    void start(const std::string& host, int port);
    // Setup routes on the provided app (for testing)
    void setupRoutes(crow::SimpleApp& app);

    // Run a handler, mapping admin errors onto HTTP status codes
    static crow::response respond(const std::function<crow::response()>& handler);

private:
    std::shared_ptr<AdminClient> admin_;
};

#endif // HTTP_SERVER_HPP
