#pragma once
#include <string>
#include <utility>
#include <cstdint>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

class GbfsClient
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::string host;
    std::string port;

    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(std::string const& target) const;
    boost::asio::awaitable<void> sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request);
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);

public:
    // Whole-city feeds are well above Beast's 8 MB default body limit.
    static constexpr std::uint64_t BODY_LIMIT = 64 * 1024 * 1024;
    static constexpr int TIMEOUT_SECONDS = 30;

    GbfsClient(boost::asio::io_context& ioc, std::string host, std::string port);

    // Throws on network failure or a non-2xx status.
    boost::asio::awaitable<std::string> fetch(std::string target);
};
