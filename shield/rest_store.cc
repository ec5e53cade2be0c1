#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "rest_store.hh"
#include "shield_error.hh"

namespace {
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace pt = boost::property_tree;
using tcp = boost::asio::ip::tcp;

using SteadyTime = std::chrono::steady_clock::time_point;

// The outcome of one asynchronous step. Handlers hold it by shared pointer,
// since a step abandoned on a timeout may complete during a later call.
struct Step
{
    beast::error_code ec;
    bool done = false;
    tcp::resolver::results_type results;
};

/**
 * Runs the io_context until a step completes or the deadline passes.
 *
 * @param cancel Aborts the outstanding operations of the step. On a timeout
 *  the aborted handlers are drained before returning, so none of them touches
 *  the caller's buffers afterwards.
 * @throw ShieldError(Timeout) past the deadline, or
 *  ShieldError(StoreUnavailable) if the step failed.
 */
void
Await(
    net::io_context &ioc,
    const std::shared_ptr<Step> &step,
    SteadyTime deadline,
    const char *name,
    const std::function<void()> &cancel)
{
    while (not step->done) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            cancel();
            ioc.restart();
            ioc.poll();
            throw ShieldError(ShieldErr::Timeout, name);
        }
        if (ioc.stopped())
            ioc.restart();
        ioc.run_one_for(deadline - now);
    }
    if (step->ec)
        throw ShieldError(ShieldErr::StoreUnavailable,
                          std::string(name) + ": " + step->ec.message());
}

template<typename Stream>
std::string
SendRequest(
    net::io_context &ioc,
    Stream &stream,
    http::request<http::string_body> &req,
    SteadyTime deadline)
{
    auto close = [&stream] { beast::get_lowest_layer(stream).close(); };

    auto written = std::make_shared<Step>();
    http::async_write(stream, req,
        [written](beast::error_code ec, std::size_t) {
            written->ec = ec;
            written->done = true;
        });
    Await(ioc, written, deadline, "write", close);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    auto read = std::make_shared<Step>();
    http::async_read(stream, buffer, res,
        [read](beast::error_code ec, std::size_t) {
            read->ec = ec;
            read->done = true;
        });
    Await(ioc, read, deadline, "read", close);

    if (res.result() != http::status::ok)
        throw ShieldError(ShieldErr::StoreUnavailable,
                          "HTTP " + std::to_string(res.result_int()));
    return res.body();
}

} // namespace

bool
ParseRestUrl(const std::string &url, RestEndpoint &endpoint)
{
    RestEndpoint parsed;
    std::string rest;
    if (url.compare(0, 8, "https://") == 0) {
        rest = url.substr(8);
    }
    else if (url.compare(0, 7, "http://") == 0) {
        parsed.tls = false;
        parsed.port = "80";
        rest = url.substr(7);
    }
    else
        return false;

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        parsed.basePath = rest.substr(slash);
        rest = rest.substr(0, slash);
        while (not parsed.basePath.empty() and parsed.basePath.back() == '/')
            parsed.basePath.pop_back();
    }
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        parsed.port = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        if (parsed.port.empty()
            or parsed.port.find_first_not_of("0123456789") != std::string::npos)
            return false;
    }
    if (rest.empty())
        return false;
    parsed.host = rest;
    endpoint = parsed;
    return true;
}

std::string
EncodePipeline(const std::vector<StoreCommand> &commands)
{
    pt::ptree root;
    for (const auto &command : commands) {
        pt::ptree row;
        for (const auto &arg : command) {
            pt::ptree cell;
            cell.put_value(arg);
            row.push_back(std::make_pair(std::string(), cell));
        }
        root.push_back(std::make_pair(std::string(), row));
    }
    std::ostringstream oss;
    pt::write_json(oss, root, false);
    auto body = oss.str();
    while (not body.empty() and body.back() == '\n')
        body.pop_back();
    return body;
}

std::vector<StoreReply>
DecodePipelineReplies(const std::string &body)
{
    pt::ptree root;
    try {
        std::istringstream iss(body);
        pt::read_json(iss, root);
    }
    catch (pt::json_parser_error &err) {
        throw ShieldError(ShieldErr::StoreUnavailable,
                          std::string("bad reply: ") + err.what());
    }

    std::vector<StoreReply> replies;
    for (const auto &item : root) {
        const auto &obj = item.second;
        auto error = obj.get_optional<std::string>("error");
        if (error)
            throw ShieldError(ShieldErr::StoreUnavailable, *error);
        auto result = obj.get_child_optional("result");
        if (not result)
            throw ShieldError(ShieldErr::StoreUnavailable,
                              "reply without result");
        if (not result->empty()) {
            std::vector<std::string> elements;
            // Nested arrays, like the key list of a SCAN reply, are
            // flattened into the outer one.
            for (const auto &elem : *result) {
                if (elem.second.empty())
                    elements.push_back(elem.second.data());
                for (const auto &inner : elem.second)
                    elements.push_back(inner.second.data());
            }
            replies.push_back(StoreReply::Array(std::move(elements)));
        }
        else if (result->data() == "null")
            replies.push_back(StoreReply::Nil());
        else
            replies.push_back(StoreReply::Of(result->data()));
    }
    return replies;
}

/**
 * Initializes the backend.
 *
 * @param endpoint The REST endpoint.
 * @param token The bearer token.
 * @param timeout The bound on a whole request, from resolve to last byte.
 */
RestStore::RestStore(
    const RestEndpoint &endpoint,
    const std::string &token,
    std::chrono::milliseconds timeout)
    : endpoint(endpoint),
      token(token),
      timeout(timeout),
      sslContext(ssl::context::tls_client),
      lastCallOk(true)
{
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);
}

/**
 * Posts the batch to the pipeline endpoint and decodes the replies.
 *
 * @throw ShieldError on network failures, timeouts, non-200 statuses, or
 *  command errors.
 */
std::vector<StoreReply>
RestStore::Execute(const std::vector<StoreCommand> &commands)
{
    LockGuard lck(mtx);
    try {
        auto replies = Exchange(commands);
        lastCallOk = true;
        return replies;
    }
    catch (std::exception &) {
        lastCallOk = false;
        throw;
    }
}

// Must be called with the lock held.
std::vector<StoreReply>
RestStore::Exchange(const std::vector<StoreCommand> &commands)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;

    http::request<http::string_body> req{
        http::verb::post, endpoint.basePath + "/pipeline", 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::authorization, "Bearer " + token);
    req.set(http::field::content_type, "application/json");
    req.body() = EncodePipeline(commands);
    req.prepare_payload();

    tcp::resolver resolver(ioc);
    auto resolved = std::make_shared<Step>();
    resolver.async_resolve(endpoint.host, endpoint.port,
        [resolved](beast::error_code ec, tcp::resolver::results_type results) {
            resolved->ec = ec;
            resolved->results = results;
            resolved->done = true;
        });
    Await(ioc, resolved, deadline, "resolve", [&resolver] { resolver.cancel(); });

    std::string body;
    auto connected = std::make_shared<Step>();
    auto onConnect = [connected](beast::error_code ec, tcp::endpoint) {
        connected->ec = ec;
        connected->done = true;
    };
    if (endpoint.tls) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, sslContext);
        if (not SSL_set_tlsext_host_name(stream.native_handle(),
                                         endpoint.host.c_str()))
            throw ShieldError(ShieldErr::StoreUnavailable, "cannot set SNI");
        auto close = [&stream] { beast::get_lowest_layer(stream).close(); };
        beast::get_lowest_layer(stream).async_connect(
            resolved->results, onConnect);
        Await(ioc, connected, deadline, "connect", close);

        auto handshake = std::make_shared<Step>();
        stream.async_handshake(ssl::stream_base::client,
            [handshake](beast::error_code ec) {
                handshake->ec = ec;
                handshake->done = true;
            });
        Await(ioc, handshake, deadline, "handshake", close);
        body = SendRequest(ioc, stream, req, deadline);
        beast::error_code ignored;
        beast::get_lowest_layer(stream).socket().shutdown(
            tcp::socket::shutdown_both, ignored);
    }
    else {
        beast::tcp_stream stream(ioc);
        stream.async_connect(resolved->results, onConnect);
        Await(ioc, connected, deadline, "connect", [&stream] { stream.close(); });
        body = SendRequest(ioc, stream, req, deadline);
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    return DecodePipelineReplies(body);
}
