#include <utility>
#include <chrono>
#include <stdexcept>
#include <boost/asio/redirect_error.hpp>
#include "GbfsClient.hpp"

GbfsClient::GbfsClient(boost::asio::io_context& ioc, std::string hostName, std::string portName)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , host(std::move(hostName))
        , port(std::move(portName))
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }


void GbfsClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()),"Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> GbfsClient::resolve(boost::asio::ip::tcp::resolver& resolver)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(host, port, boost::asio::use_awaitable);
    co_return results;
}

boost::asio::awaitable<void> GbfsClient::connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(TIMEOUT_SECONDS));
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);

    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
    co_return;
}

boost::beast::http::request<boost::beast::http::string_body> GbfsClient::buildGetRequest(std::string const& target) const
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, target, 11);
    request.set(boost::beast::http::field::host, host);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/json");

    return request;
}

boost::asio::awaitable<void> GbfsClient::sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request)
{
    boost::beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(TIMEOUT_SECONDS));
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
}

boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> GbfsClient::readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(BODY_LIMIT);

    boost::beast::flat_buffer buffer;
    boost::beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(TIMEOUT_SECONDS));
    co_await boost::beast::http::async_read(stream, buffer, parser, boost::asio::use_awaitable);
    co_return parser.release();
}

boost::asio::awaitable<std::string> GbfsClient::fetch(std::string target)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(ioContext);
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);

    configureTlsStream(stream);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver);
    co_await connect(results, stream);
    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest(target);
    co_await sendRequest(stream, request);
    boost::beast::http::response<boost::beast::http::string_body> response = co_await readResponse(stream);
    co_await shutdownStream(stream);

    if (boost::beast::http::to_status_class(response.result()) != boost::beast::http::status_class::successful)
    {
        throw std::runtime_error("GET " + target + " returned HTTP " + std::to_string(response.result_int()));
    }
    co_return std::move(response.body());
}

boost::asio::awaitable<void> GbfsClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    // servers often drop the connection without close_notify
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(TIMEOUT_SECONDS));
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}
