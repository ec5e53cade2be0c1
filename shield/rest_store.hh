#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>

#include "remote_store.hh"

// An http(s) endpoint parsed from a URL.
struct RestEndpoint
{
    bool tls = true;
    std::string host;
    std::string port = "443";
    std::string basePath;  // Without a trailing slash.
};

// Parses http(s)://host[:port][/path]. Returns false if malformed.
bool
ParseRestUrl(const std::string &url, RestEndpoint &endpoint);

// Encodes a batch as a JSON array of string arrays.
std::string
EncodePipeline(const std::vector<StoreCommand> &commands);

/**
 * Decodes a pipeline response, a JSON array with one {"result": ...} or
 * {"error": "..."} object per command.
 *
 * @throw ShieldError(StoreUnavailable) if the body is malformed, or a command
 *  failed.
 */
std::vector<StoreReply>
DecodePipelineReplies(const std::string &body);

/**
 * Stateless request/response backend speaking the Upstash REST protocol.
 *
 * Every batch is one self-contained HTTP POST to <url>/pipeline, authorized
 * with a bearer token, so there is no connection state to track. Attempts are
 * never gated; Healthy reflects the outcome of the most recent call.
 */
class RestStore : public RemoteStore
{
    using LockGuard = std::lock_guard<std::mutex>;

    RestEndpoint endpoint;
    std::string token;
    std::chrono::milliseconds timeout;
    boost::asio::ssl::context sslContext;
    std::atomic_bool lastCallOk;

    std::mutex mtx;  // Serializes calls on ioc.
    boost::asio::io_context ioc;

    std::vector<StoreReply> Exchange(const std::vector<StoreCommand> &commands);

protected:
    std::vector<StoreReply> Execute(
        const std::vector<StoreCommand> &commands) override;

public:
    RestStore(
        const RestEndpoint &endpoint,
        const std::string &token,
        std::chrono::milliseconds timeout);
    RestStore(const RestStore &store) = delete;
    RestStore& operator=(const RestStore &store) = delete;

    bool Available() const override { return true; }
    bool Healthy() const override { return lastCallOk; }
    std::string Name() const override { return "Rest"; }

    bool LastCallSucceeded() const noexcept { return lastCallOk; }
};
