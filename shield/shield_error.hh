#pragma once

#include <exception>
#include <string>

// Shield error reasons.
enum class ShieldErr
{
    StoreUnavailable,
    UpstreamFetchFailed,
    Timeout,
    ListenFailed
};

/**
 * Shield exception, which contains a ShieldErr code and a detail message.
 *
 * StoreUnavailable and Timeout are raised inside the remote store backends
 * and never leave the RemoteStore boundary. UpstreamFetchFailed is the only
 * reason a caller of CacheOrchestrator::WithCache ever sees. ListenFailed is
 * raised by ShieldServer::Run when it cannot take its address.
 */
class ShieldError : public std::exception
{
    ShieldErr err;
    std::string msg;

    static const char*
    ReasonName(ShieldErr err) noexcept
    {
        switch (err) {
        case ShieldErr::StoreUnavailable:
            return "StoreUnavailable";
        case ShieldErr::UpstreamFetchFailed:
            return "UpstreamFetchFailed";
        case ShieldErr::Timeout:
            return "Timeout";
        case ShieldErr::ListenFailed:
            return "ListenFailed";
        default:
            return "Unknown";
        }
    }

public:
    ShieldError(ShieldErr err, const std::string &detail = "")
        : exception(),
          err(err),
          msg(std::string("ShieldError(") + ReasonName(err) + ")"
              + (detail.empty() ? "" : ": " + detail))
    {}

    const char* what() const noexcept override
    {
        return msg.c_str();
    }

    ShieldErr reason() const noexcept
    {
        return err;
    }
};
