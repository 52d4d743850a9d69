#include "quorum_strategy.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace chatlog {

QuorumStrategy::QuorumStrategy(const ClusterView& cluster, MessageStore& store,
                               std::shared_ptr<Transport> transport, PeerLiveness& liveness,
                               QuorumOptions options)
    : cluster_(cluster),
      store_(store),
      transport_(std::move(transport)),
      liveness_(liveness),
      options_(options) {}

QuorumStrategy::~QuorumStrategy() {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    for (auto& flight : inflight_) {
        for (auto& t : flight.threads) t.join();
    }
}

WriteResult QuorumStrategy::write(const Message& message) {
    reap_finished();

    const std::size_t total = cluster_.size();
    const std::size_t quorum = cluster_.quorum_size();

    WriteResult result;
    result.message = message;
    result.required = quorum;
    result.cluster_size = total;

    if (store_.contains(message.id)) {
        spdlog::error("Quorum write refused: id {} is already in use", message.id);
        result.outcome = WriteOutcome::Invalid;
        result.detail = "message id " + message.id + " is already in use";
        return result;
    }

    // Proposing: fan the message out to every peer at once. Each thread
    // owns copies of everything it touches except the liveness table,
    // which outlives this strategy.
    InFlight flight;
    flight.ballot = std::make_shared<Ballot>();
    auto ballot = flight.ballot;
    auto shared = std::make_shared<const Message>(message);
    auto transport = transport_;
    PeerLiveness* liveness = &liveness_;

    const auto peers = cluster_.peers();
    flight.threads.reserve(peers.size());
    for (const auto& peer : peers) {
        {
            std::lock_guard<std::mutex> g(ballot->mutex);
            ++ballot->outstanding;
        }
        try {
            flight.threads.emplace_back([ballot, transport, shared, peer, liveness] {
                CallStatus status = transport->replicate(peer, *shared);
                liveness->record(peer.id, status == CallStatus::Ok, to_string(status));
                if (status == CallStatus::Ok) {
                    spdlog::debug("Peer ACK from {} for {}", peer.id, shared->id);
                } else {
                    spdlog::warn("Peer NACK/FAIL from {} for {}: {}", peer.id, shared->id,
                                 to_string(status));
                }
                {
                    std::lock_guard<std::mutex> g(ballot->mutex);
                    --ballot->outstanding;
                    if (status == CallStatus::Ok) ++ballot->acks;
                }
                ballot->changed.notify_all();
            });
        } catch (const std::system_error& e) {
            spdlog::error("could not start replicate call to {}: {}", peer.id, e.what());
            std::lock_guard<std::mutex> g(ballot->mutex);
            --ballot->outstanding;
        }
    }

    // Collecting: stop as soon as the outcome is certain either way.
    bool committed = false;
    {
        std::unique_lock<std::mutex> lock(ballot->mutex);
        const auto deadline = std::chrono::steady_clock::now() + options_.call_timeout +
                              options_.decision_grace;
        ballot->changed.wait_until(lock, deadline, [&] {
            return ballot->acks >= quorum || ballot->acks + ballot->outstanding < quorum;
        });
        result.acks = ballot->acks;
        committed = ballot->acks >= quorum;
    }

    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_.push_back(std::move(flight));
    }

    if (committed && !store_.append(message)) {
        // Another writer stored the same id while the ballot was open.
        spdlog::error("Quorum write {} committed on peers but the id is already held locally",
                      message.id);
        result.outcome = WriteOutcome::Invalid;
        result.detail = "message id " + message.id + " is already in use";
    } else if (committed) {
        result.outcome = WriteOutcome::Committed;
        spdlog::info("Quorum achieved for {}: votes={}, majority_needed={}, (N={})", message.id,
                     result.acks, quorum, total);
    } else {
        result.outcome = WriteOutcome::QuorumNotReached;
        result.detail = "Only " + std::to_string(result.acks) + "/" + std::to_string(total) +
                        " nodes acknowledged the write, required " + std::to_string(quorum) +
                        " for quorum.";
        spdlog::warn("Quorum FAILED for {}: votes={}, majority_needed={}, (N={})", message.id,
                     result.acks, quorum, total);
    }
    return result;
}

void QuorumStrategy::reap_finished() {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    for (auto it = inflight_.begin(); it != inflight_.end();) {
        bool done;
        {
            std::lock_guard<std::mutex> g(it->ballot->mutex);
            done = it->ballot->outstanding == 0;
        }
        if (!done) {
            ++it;
            continue;
        }
        for (auto& t : it->threads) t.join();
        it = inflight_.erase(it);
    }
}

std::size_t QuorumStrategy::calls_in_flight() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    std::size_t n = 0;
    for (const auto& flight : inflight_) {
        std::lock_guard<std::mutex> g(flight.ballot->mutex);
        n += flight.ballot->outstanding;
    }
    return n;
}

}  // namespace chatlog
