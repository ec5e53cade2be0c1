#pragma once

#include <memory>
#include <string>
#include <vector>

#include "remote_store.hh"

/**
 * An ordered list of interchangeable backends behind one interface.
 *
 * Each batch goes to the first available backend; if it fails, the next one
 * is tried, until one succeeds or the list is exhausted. An empty list makes
 * a store that is never available, which puts every consumer in local-only
 * mode.
 */
class FailoverStore : public RemoteStore
{
    std::vector<std::shared_ptr<RemoteStore>> backends;

protected:
    std::vector<StoreReply> Execute(
        const std::vector<StoreCommand> &commands) override;

public:
    FailoverStore() = default;
    explicit FailoverStore(std::vector<std::shared_ptr<RemoteStore>> backends);

    void Add(std::shared_ptr<RemoteStore> backend);
    bool Empty() const noexcept { return backends.empty(); }

    bool Available() const override;
    bool Healthy() const override;
    std::string Name() const override;
};
