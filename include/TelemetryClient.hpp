#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

class ConfigurationManager;

// Request/response access to the telemetry service over HTTP or HTTPS.
class TelemetryClient
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    ConfigurationManager const& config;

    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver);
    boost::beast::http::request<boost::beast::http::string_body> buildRequest(boost::beast::http::verb method, std::string const& target, std::string body) const;

    template <class Stream>
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> exchange(Stream& stream, boost::beast::http::request<boost::beast::http::string_body> const& request);

    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);

public:
    static constexpr std::chrono::seconds kRequestTimeout{10};

    TelemetryClient(boost::asio::io_context& ioc, ConfigurationManager const& configuration);

    boost::asio::awaitable<std::string> fetch(std::string target);
    boost::asio::awaitable<std::string> post(std::string target, std::string body = {});
    boost::asio::awaitable<std::string> send(boost::beast::http::verb method, std::string target, std::string body);

    boost::asio::ssl::context& tlsContext() noexcept { return sslContext; }
    std::string hostHeader() const;

    static std::string encodeComponent(std::string const& value);
};
