#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

struct Url
{
    std::string scheme;  // "http" or "https"
    std::string host;
    std::string port;
    std::string target;  // path and query, at least "/"

    // Throws std::invalid_argument for anything but absolute http(s) URLs.
    static Url parse(std::string const& url);

    // Resolves a Location header against this URL.
    Url resolve(std::string const& location) const;

    bool isDefaultPort() const;
    std::string str() const;
};

struct FeedResponse
{
    unsigned status = 0;
    std::string body;
    std::string contentDisposition;
    std::optional<std::uint64_t> contentLength;
};

class FeedClient
{
private:
    using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
    using TlsStream    = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    boost::asio::ssl::context sslContext;
    std::string apiKeyHeader;
    std::string apiKey;
    std::uint64_t bodyLimit;

    void configureTlsStream(TlsStream& stream, std::string const& host);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver, Url const& url);
    HttpRequest buildGetRequest(Url const& url) const;
    boost::asio::awaitable<void> shutdownStream(TlsStream& stream);
    boost::asio::awaitable<HttpResponse> fetchOnce(Url const& url);

public:
    static constexpr int MAX_REDIRECTS = 10;
    static constexpr std::uint64_t DEFAULT_BODY_LIMIT = 512ull * 1024 * 1024;

    explicit FeedClient(std::string keyHeader = "", std::string key = "",
                        std::uint64_t maxBodyBytes = DEFAULT_BODY_LIMIT);

    // GET with redirects followed. Throws on transport errors and on any
    // final status outside 2xx.
    boost::asio::awaitable<FeedResponse> fetch(std::string url);
};
