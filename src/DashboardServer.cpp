#include <cctype>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "ControlBus.hpp"
#include "ControlClient.hpp"
#include "DashboardServer.hpp"
#include "LiveView.hpp"

namespace http = boost::beast::http;

DashboardServer::DashboardServer(boost::asio::io_context& ioc, unsigned short port, LiveView& liveView,
                                 ViewProvider provider, ControlClient* control)
    : ioContext(ioc)
    , acceptor(ioc)
    , listenPort(port)
    , view(liveView)
    , snapshot(std::move(provider))
    , controlClient(control)
{
}

bool DashboardServer::start()
{
    try
    {
        boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), listenPort};
        acceptor.open(endpoint.protocol());
        acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Dashboard] Server Error: " << e.what() << std::endl;
        return false;
    }

    std::cout << "   -> Dashboard active at http://localhost:" << acceptor.local_endpoint().port() << "\n";
    boost::asio::co_spawn(ioContext, acceptLoop(), boost::asio::detached);
    return true;
}

void DashboardServer::stop()
{
    boost::system::error_code ignore;
    acceptor.close(ignore);
}

std::string DashboardServer::urlDecode(std::string const& text)
{
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '+')
        {
            out.push_back(' ');
        }
        else if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1]))
                 && std::isxdigit(static_cast<unsigned char>(text[i + 2])))
        {
            out.push_back(static_cast<char>(std::strtol(text.substr(i + 1, 2).c_str(), nullptr, 16)));
            i += 2;
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> DashboardServer::parseQuery(std::string const& query)
{
    std::map<std::string, std::string> params;
    for (auto const& part : splitList(query, '&'))
    {
        auto eq = part.find('=');
        if (eq == std::string::npos)
            params[urlDecode(part)] = "";
        else
            params[urlDecode(part.substr(0, eq))] = urlDecode(part.substr(eq + 1));
    }
    return params;
}

std::vector<std::string> DashboardServer::splitList(std::string const& text, char separator)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size())
    {
        auto end = text.find(separator, start);
        if (end == std::string::npos)
            end = text.size();
        if (end > start)
            parts.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

DashboardReply DashboardServer::redirectHome()
{
    DashboardReply reply;
    reply.status = 303;
    reply.location = "/";
    return reply;
}

DashboardReply DashboardServer::jsonReply(unsigned status, std::string body)
{
    DashboardReply reply;
    reply.status = status;
    reply.contentType = "application/json";
    reply.body = std::move(body);
    return reply;
}

std::optional<DashboardReply> DashboardServer::handleLocal(std::string const& target)
{
    auto q = target.find('?');
    std::string path = target.substr(0, q);
    auto params = parseQuery(q == std::string::npos ? "" : target.substr(q + 1));

    if (path == "/")
    {
        DashboardReply reply;
        reply.body = Dashboard::generate(snapshot());
        return reply;
    }
    if (path == "/scene.json")
    {
        return jsonReply(200, Dashboard::sceneJson(snapshot()));
    }
    if (path == "/dismiss")
    {
        if (!params["pair"].empty())
            view.alerts().dismiss(params["pair"]);
        return redirectHome();
    }
    if (path == "/toast/dismiss")
    {
        view.alerts().dismissToast();
        return redirectHome();
    }
    if (path == "/playback")
    {
        std::string value = params["playing"];
        view.controls().publish(SetPlayback{value == "1" || value == "true"});
        return redirectHome();
    }
    if (path == "/locate")
    {
        if (!params["train"].empty())
            view.controls().publish(LocateVehicle{params["train"]});
        return redirectHome();
    }
    if (path == "/highlight")
    {
        view.controls().publish(HighlightRoute{splitList(params["route"], ',')});
        return redirectHome();
    }
    if (path.rfind("/control/", 0) == 0)
    {
        return std::nullopt;
    }

    DashboardReply reply;
    reply.status = 404;
    reply.contentType = "text/plain";
    reply.body = "Not found";
    return reply;
}

boost::asio::awaitable<DashboardReply> DashboardServer::handleControl(std::string path, std::map<std::string, std::string> params)
{
    using nlohmann::json;

    if (!controlClient)
        co_return jsonReply(503, json{{"success", false}, {"error", "controls unavailable in replay"}}.dump());

    auto resultJson = [](ControlResult const& r)
    {
        json j = {{"success", r.success}};
        if (!r.error.empty())
            j["error"] = r.error;
        return j;
    };

    if (path == "/control/reset")
        co_return jsonReply(200, resultJson(co_await controlClient->reset()).dump());

    if (path == "/control/reseed")
    {
        ReseedResult reseed = co_await controlClient->reseed();
        json j = resultJson(reseed.result);
        j["num_trains"] = reseed.trainCount;
        co_return jsonReply(200, j.dump());
    }

    if (path == "/control/delay")
    {
        std::string train = params["train"];
        std::string minutesText = params["minutes"];
        char* end = nullptr;
        long minutes = std::strtol(minutesText.c_str(), &end, 10);
        if (train.empty() || minutesText.empty() || *end != '\0' || minutes < 0 || minutes > Parser::kMaxDelayMinutes)
            co_return jsonReply(400, json{{"success", false}, {"error", "train and minutes in [0, 10080] required"}}.dump());

        co_return jsonReply(200, resultJson(co_await controlClient->injectDelay(train, static_cast<int>(minutes))).dump());
    }

    if (path == "/control/simulate")
    {
        if (params["train"].empty())
            co_return jsonReply(400, json{{"success", false}, {"error", "train required"}}.dump());

        SimulationResult sim = co_await controlClient->simulateByTrainNumber(params["train"]);
        json j = resultJson(sim.result);
        j["train_id"] = sim.trainId;
        j["route"] = sim.route;
        j["direction"] = sim.direction;
        co_return jsonReply(200, j.dump());
    }

    if (path == "/control/search")
    {
        auto hits = co_await controlClient->search(params["q"]);
        json trains = json::array();
        for (auto const& h : hits)
        {
            trains.push_back({
                {"Train_No", h.trainNo},
                {"Train_Name", h.name},
                {"Source_Station_Name", h.source},
                {"Destination_Station_Name", h.destination}
            });
        }
        co_return jsonReply(200, json{{"trains", trains}}.dump());
    }

    co_return jsonReply(404, json{{"success", false}, {"error", "unknown control"}}.dump());
}

boost::asio::awaitable<DashboardReply> DashboardServer::handle(std::string target)
{
    if (auto reply = handleLocal(target))
        co_return *reply;

    auto q = target.find('?');
    std::string path = target.substr(0, q);
    auto params = parseQuery(q == std::string::npos ? "" : target.substr(q + 1));

    std::string failure;
    try
    {
        co_return co_await handleControl(path, params);
    }
    catch (std::exception const& e)
    {
        failure = e.what();
    }

    std::cerr << "[Dashboard] " << path << " failed: " << failure << std::endl;
    nlohmann::json body = {{"success", false}, {"error", failure}};
    co_return jsonReply(502, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

boost::asio::awaitable<void> DashboardServer::handleClient(boost::asio::ip::tcp::socket socket)
{
    try
    {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> request;
        co_await http::async_read(socket, buffer, request, boost::asio::use_awaitable);

        DashboardReply reply = co_await handle(std::string(request.target()));

        http::response<http::string_body> response{static_cast<http::status>(reply.status), request.version()};
        response.set(http::field::server, "railsync");
        response.set(http::field::content_type, reply.contentType);
        response.set(http::field::cache_control, "no-store");
        if (!reply.location.empty())
            response.set(http::field::location, reply.location);
        response.keep_alive(false);
        response.body() = std::move(reply.body);
        response.prepare_payload();

        co_await http::async_write(socket, response, boost::asio::use_awaitable);

        boost::system::error_code ignore;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof ||
            code == http::error::end_of_stream)
        {
            co_return;
        }

        std::cerr << "[Dashboard] HTTP handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Dashboard] HTTP handler error: " << e.what() << "\n";
    }
}

boost::asio::awaitable<void> DashboardServer::acceptLoop()
{
    for (;;)
    {
        boost::asio::ip::tcp::socket socket(co_await boost::asio::this_coro::executor);

        boost::system::error_code ec;
        co_await acceptor.async_accept(socket, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            if (!acceptor.is_open())
                co_return;
            std::cerr << "[Dashboard] Accept failed: " << ec.message() << std::endl;
            continue;
        }

        boost::asio::co_spawn(socket.get_executor(), handleClient(std::move(socket)), boost::asio::detached);
    }
}
