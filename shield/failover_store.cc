#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "failover_store.hh"
#include "shield_error.hh"

FailoverStore::FailoverStore(
    std::vector<std::shared_ptr<RemoteStore>> backends)
    : backends(std::move(backends))
{}

void
FailoverStore::Add(std::shared_ptr<RemoteStore> backend)
{
    backends.push_back(std::move(backend));
}

bool
FailoverStore::Available() const
{
    for (const auto &backend : backends) {
        if (backend->Available())
            return true;
    }
    return false;
}

bool
FailoverStore::Healthy() const
{
    for (const auto &backend : backends) {
        if (backend->Healthy())
            return true;
    }
    return false;
}

/**
 * The name of the first available backend, or of the whole chain when none
 * is available.
 */
std::string
FailoverStore::Name() const
{
    for (const auto &backend : backends) {
        if (backend->Available())
            return backend->Name();
    }
    if (backends.empty())
        return "None";
    std::string name;
    for (const auto &backend : backends)
        name += (name.empty() ? "" : "+") + backend->Name();
    return name;
}

/**
 * Tries each backend in order. Every backend logs its own failure.
 *
 * @throw ShieldError(StoreUnavailable) if no backend could serve the batch.
 */
std::vector<StoreReply>
FailoverStore::Execute(const std::vector<StoreCommand> &commands)
{
    for (const auto &backend : backends) {
        auto replies = backend->Pipeline(commands);
        if (replies)
            return std::move(*replies);
    }
    throw ShieldError(ShieldErr::StoreUnavailable, "no backend available");
}
