#pragma once

#include <memory>

namespace httplib {
class Server;
class Request;
class Response;
} // namespace httplib

namespace LS::Web {

struct HttpRequestContext;

// /api/sessions lifecycle, monitoring control, manual log entries and
// /api/clear-logs.
class SessionController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<SessionController>;

    void register_routes(httplib::Server& server);

private:
    explicit SessionController(HttpRequestContext& ctx);

    void handle_create(httplib::Request const& req, httplib::Response& res);
    void handle_list(httplib::Request const& req, httplib::Response& res);
    void handle_delete(httplib::Request const& req, httplib::Response& res);
    void handle_start_monitoring(httplib::Request const& req, httplib::Response& res);
    void handle_stop_monitoring(httplib::Request const& req, httplib::Response& res);
    void handle_add_log(httplib::Request const& req, httplib::Response& res);
    void handle_clear_logs(httplib::Request const& req, httplib::Response& res);

    HttpRequestContext& ctx_;
};

} // namespace LS::Web
