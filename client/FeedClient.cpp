#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include "FeedClient.hpp"

namespace http = boost::beast::http;

namespace
{
    constexpr auto IO_TIMEOUT = std::chrono::seconds(60);

    bool isRedirect(http::status status)
    {
        switch (status)
        {
            case http::status::moved_permanently:
            case http::status::found:
            case http::status::see_other:
            case http::status::temporary_redirect:
            case http::status::permanent_redirect:
                return true;
            default:
                return false;
        }
    }

    template <class Stream>
    boost::asio::awaitable<http::response<http::string_body>> readResponse(Stream& stream, std::uint64_t bodyLimit)
    {
        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(bodyLimit);
        co_await http::async_read(stream, buffer, parser, boost::asio::use_awaitable);
        co_return parser.release();
    }
}

Url Url::parse(std::string const& url)
{
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos)
        throw std::invalid_argument("URL has no scheme: " + url);

    Url out;
    out.scheme = url.substr(0, schemeEnd);
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.scheme != "http" && out.scheme != "https")
        throw std::invalid_argument("Unsupported URL scheme: " + out.scheme);

    auto authorityStart = schemeEnd + 3;
    auto authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, authorityEnd == std::string::npos
                                                       ? std::string::npos
                                                       : authorityEnd - authorityStart);

    if (authority.find('@') != std::string::npos)
        throw std::invalid_argument("URLs with credentials are not supported: " + url);

    auto closingBracket = authority.rfind(']');
    auto colon = authority.rfind(':');
    if (colon != std::string::npos && (closingBracket == std::string::npos || colon > closingBracket))
    {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    }
    else
    {
        out.host = authority;
    }
    if (out.host.size() > 1 && out.host.front() == '[' && out.host.back() == ']')
        out.host = out.host.substr(1, out.host.size() - 2);

    if (out.host.empty())
        throw std::invalid_argument("URL has no host: " + url);
    if (out.port.empty())
        out.port = out.scheme == "https" ? "443" : "80";

    if (authorityEnd == std::string::npos)
    {
        out.target = "/";
    }
    else
    {
        out.target = url.substr(authorityEnd);
        auto fragment = out.target.find('#');
        if (fragment != std::string::npos)
            out.target.erase(fragment);
        if (out.target.empty() || out.target.front() != '/')
            out.target.insert(out.target.begin(), '/');
    }
    return out;
}

Url Url::resolve(std::string const& location) const
{
    if (location.find("://") != std::string::npos)
        return parse(location);
    if (location.rfind("//", 0) == 0)
        return parse(scheme + ":" + location);

    Url out = *this;
    if (!location.empty() && location.front() == '/')
    {
        out.target = location;
    }
    else
    {
        std::string path = target.substr(0, target.find('?'));
        out.target = path.substr(0, path.rfind('/') + 1) + location;
    }
    return out;
}

bool Url::isDefaultPort() const
{
    return (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
}

std::string Url::str() const
{
    std::string host_ = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + host_ + (isDefaultPort() ? "" : ":" + port) + target;
}

FeedClient::FeedClient(std::string keyHeader, std::string key, std::uint64_t maxBodyBytes)
    : sslContext(boost::asio::ssl::context::tls_client)
    , apiKeyHeader(std::move(keyHeader))
    , apiKey(std::move(key))
    , bodyLimit(maxBodyBytes)
{
    sslContext.set_options(
        boost::asio::ssl::context::default_workarounds
        | boost::asio::ssl::context::no_sslv2
        | boost::asio::ssl::context::no_sslv3
        | boost::asio::ssl::context::single_dh_use
    );

    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
}

void FeedClient::configureTlsStream(TlsStream& stream, std::string const& host)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()),"Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> FeedClient::resolve(boost::asio::ip::tcp::resolver& resolver, Url const& url)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(url.host, url.port, boost::asio::use_awaitable);
    co_return results;
}

FeedClient::HttpRequest FeedClient::buildGetRequest(Url const& url) const
{
    HttpRequest request(http::verb::get, url.target, 11);
    request.set(http::field::host, url.isDefaultPort() ? url.host : url.host + ":" + url.port);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!apiKey.empty() && !apiKeyHeader.empty())
        request.set(apiKeyHeader, apiKey);

    return request;
}

boost::asio::awaitable<void> FeedClient::shutdownStream(TlsStream& stream)
{
    // Servers routinely drop the connection without close_notify.
    boost::system::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

boost::asio::awaitable<FeedClient::HttpResponse> FeedClient::fetchOnce(Url const& url)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(executor);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver, url);
    HttpRequest request = buildGetRequest(url);

    if (url.scheme == "https")
    {
        TlsStream stream(executor, sslContext);
        configureTlsStream(stream, url.host);

        boost::beast::get_lowest_layer(stream).expires_after(IO_TIMEOUT);
        co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
        co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
        co_await http::async_write(stream, request, boost::asio::use_awaitable);

        boost::beast::get_lowest_layer(stream).expires_never();
        HttpResponse response = co_await readResponse(stream, bodyLimit);
        co_await shutdownStream(stream);
        co_return response;
    }

    boost::beast::tcp_stream stream(executor);
    stream.expires_after(IO_TIMEOUT);
    co_await stream.async_connect(results, boost::asio::use_awaitable);
    co_await http::async_write(stream, request, boost::asio::use_awaitable);

    stream.expires_never();
    HttpResponse response = co_await readResponse(stream, bodyLimit);

    boost::system::error_code ignore;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    co_return response;
}

boost::asio::awaitable<FeedResponse> FeedClient::fetch(std::string url)
{
    Url current = Url::parse(url);

    for (int redirects = 0;; ++redirects)
    {
        HttpResponse response = co_await fetchOnce(current);

        auto location = response.find(http::field::location);
        if (isRedirect(response.result()) && location != response.end())
        {
            if (redirects >= MAX_REDIRECTS)
                throw std::runtime_error("Too many redirects fetching " + url);

            current = current.resolve(std::string(location->value().data(), location->value().size()));
            std::cout << "[Feed] Redirected to " << current.str() << std::endl;
            continue;
        }

        if (response.result_int() < 200 || response.result_int() >= 300)
        {
            throw std::runtime_error("GET " + current.str() + " returned HTTP "
                                     + std::to_string(response.result_int()));
        }

        FeedResponse out;
        out.status = response.result_int();
        auto disposition = response[http::field::content_disposition];
        out.contentDisposition.assign(disposition.data(), disposition.size());

        auto length = response.find(http::field::content_length);
        if (length != response.end())
        {
            try
            {
                out.contentLength = std::stoull(std::string(length->value().data(), length->value().size()));
            }
            catch (std::exception const&)
            {
                throw std::runtime_error("Malformed Content-Length from " + current.str());
            }
        }

        out.body = std::move(response.body());
        co_return out;
    }
}
