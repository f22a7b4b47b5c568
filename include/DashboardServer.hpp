#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include "Dashboard.hpp"

class LiveView;
class ControlClient;

struct DashboardReply
{
    unsigned status = 200;
    std::string contentType = "text/html";
    std::string body;
    std::string location;
};

// Local status page and control surface, served on the session's io_context.
class DashboardServer
{
public:
    using ViewProvider = std::function<DashboardView()>;

    DashboardServer(boost::asio::io_context& ioc, unsigned short port, LiveView& liveView,
                    ViewProvider provider, ControlClient* control);

    bool start();
    void stop();

    // Routes answered without the telemetry service; nullopt otherwise.
    std::optional<DashboardReply> handleLocal(std::string const& target);
    boost::asio::awaitable<DashboardReply> handle(std::string target);

    static std::map<std::string, std::string> parseQuery(std::string const& query);
    static std::string urlDecode(std::string const& text);
    static std::vector<std::string> splitList(std::string const& text, char separator);

private:
    boost::asio::awaitable<void> acceptLoop();
    boost::asio::awaitable<void> handleClient(boost::asio::ip::tcp::socket socket);
    boost::asio::awaitable<DashboardReply> handleControl(std::string path, std::map<std::string, std::string> params);

    static DashboardReply redirectHome();
    static DashboardReply jsonReply(unsigned status, std::string body);

    boost::asio::io_context& ioContext;
    boost::asio::ip::tcp::acceptor acceptor;
    unsigned short listenPort;
    LiveView& view;
    ViewProvider snapshot;
    ControlClient* controlClient;
};
