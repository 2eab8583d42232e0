#pragma once

/**
 * @file remote_turn_predictor.h
 * @brief Turn decisions from a remote turn-prediction endpoint
 *
 * Requests run off the tick thread. Each answer (or failure) comes back as
 * one TurnPrediction event; the engine keeps deciding locally meanwhile.
 */

#include "collaborators.h"
#include "core/config.h"
#include "fusion_engine.h"
#include <memory>

namespace turnkeeper {

/**
 * @brief Asynchronous turn prediction
 */
class IRemotePredictor {
public:
    virtual ~IRemotePredictor() = default;

    /**
     * @brief Start one request and return immediately
     *
     * Posts exactly one TurnPrediction carrying `id` to `sink`, unless the
     * predictor is destroyed first. `sink` must outlive the predictor.
     */
    virtual void launch(RequestId id, const DecisionInput& input, IEventSink& sink) = 0;
};

class RemoteTurnPredictor : public IRemotePredictor {
public:
    explicit RemoteTurnPredictor(const config::RemotePredictorConfig& config);

    /**
     * @brief Joins outstanding requests; their results are dropped
     */
    ~RemoteTurnPredictor() override;

    void launch(RequestId id, const DecisionInput& input, IEventSink& sink) override;

    /**
     * @brief One blocking HTTP round trip
     * @return NetworkError, CollaboratorTimeout or ParseError on failure
     */
    Result<TurnDecision> request(const DecisionInput& input);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace turnkeeper
