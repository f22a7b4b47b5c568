#include <cctype>
#include <iostream>
#include <stdexcept>
#include "ConfigurationManager.hpp"
#include "TelemetryClient.hpp"

TelemetryClient::TelemetryClient(boost::asio::io_context& ioc, ConfigurationManager const& configuration)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , config(configuration)
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }

std::string TelemetryClient::hostHeader() const
{
    return config.getHost() + ":" + config.getPort();
}

void TelemetryClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), config.getHost().c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()), "Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(config.getHost()));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> TelemetryClient::resolve(boost::asio::ip::tcp::resolver& resolver)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(config.getHost(), config.getPort(), boost::asio::use_awaitable);
    co_return results;
}

boost::beast::http::request<boost::beast::http::string_body> TelemetryClient::buildRequest(boost::beast::http::verb method, std::string const& target, std::string body) const
{
    boost::beast::http::request<boost::beast::http::string_body> request(method, target, 11);
    request.set(boost::beast::http::field::host, hostHeader());
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::cache_control, "no-store");

    if (!config.getAPIKey().empty())
        request.set("X-API-Key", config.getAPIKey());

    if (!body.empty())
    {
        request.set(boost::beast::http::field::content_type, "application/json");
        request.body() = std::move(body);
    }
    request.prepare_payload();

    return request;
}

template <class Stream>
boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> TelemetryClient::exchange(Stream& stream, boost::beast::http::request<boost::beast::http::string_body> const& request)
{
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);

    boost::beast::http::response<boost::beast::http::string_body> response;
    boost::beast::flat_buffer buffer;
    co_await boost::beast::http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
}

boost::asio::awaitable<void> TelemetryClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::system::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

boost::asio::awaitable<std::string> TelemetryClient::send(boost::beast::http::verb method, std::string target, std::string body)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(executor);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver);

    boost::beast::http::request<boost::beast::http::string_body> request = buildRequest(method, target, std::move(body));
    boost::beast::http::response<boost::beast::http::string_body> response;

    if (config.useTls())
    {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);
        configureTlsStream(stream);

        boost::beast::get_lowest_layer(stream).expires_after(kRequestTimeout);
        co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
        co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

        response = co_await exchange(stream, request);
        co_await shutdownStream(stream);
    }
    else
    {
        boost::beast::tcp_stream stream(executor);
        stream.expires_after(kRequestTimeout);
        co_await stream.async_connect(results, boost::asio::use_awaitable);

        response = co_await exchange(stream, request);

        boost::system::error_code ignore;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }

    if (response.result_int() < 200 || response.result_int() >= 300)
    {
        throw std::runtime_error("HTTP " + std::to_string(response.result_int()) + " for " + target);
    }

    co_return response.body();
}

boost::asio::awaitable<std::string> TelemetryClient::fetch(std::string target)
{
    co_return co_await send(boost::beast::http::verb::get, std::move(target), {});
}

boost::asio::awaitable<std::string> TelemetryClient::post(std::string target, std::string body)
{
    co_return co_await send(boost::beast::http::verb::post, std::move(target), std::move(body));
}

std::string TelemetryClient::encodeComponent(std::string const& value)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());

    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}
