#pragma once
#include <banditry_bits/constant.hpp>
#include <banditry_bits/data/historical_info.hpp>
#include <banditry_bits/endpoint/hyperparameter_info.hpp>
#include <banditry_bits/endpoint/linkers.hpp>
#include <banditry_bits/util/types.hpp>
#include <string>

namespace banditry {
namespace endpoint {

template <class ValueType>
struct BanditEpsilonRequest {
    using value_t = ValueType;

    std::string subtype = epsilon_subtype_first;
    data::HistoricalInfo<value_t> historical_info;
    hyperparameter_info_type<value_t> hyperparameter_info;
};

template <class ValueType>
struct BanditResponse {
    using value_t = ValueType;

    std::string endpoint;
    allocation_type<value_t> arms;
    std::string winner;
};

/*
 * Handles a bandit_epsilon request.
 * Validates the historical info, constructs the bandit of the requested
 * subtype through linker, and returns its allocation together with
 * an arm chosen from it using the RNG gen.
 *
 * Throws:
 *      unknown_subtype_error           subtype is not in linker.
 *      invalid_historical_info_error   a count is negative or not finite.
 *      invalid_hyperparameter_error    hyperparameter_info fails the schema.
 *      empty_history_error             no arms were sampled.
 */
template <class ValueType, class GenType>
BanditResponse<ValueType> bandit_epsilon(
    const BanditEpsilonRequest<ValueType>& request, GenType&& gen,
    const EpsilonLinker<ValueType>& linker =
        EpsilonLinker<ValueType>::instance()) {
    const auto& method = linker.at(request.subtype);

    request.historical_info.validate();

    auto bandit =
        method.make_bandit(request.historical_info, request.hyperparameter_info);

    BanditResponse<ValueType> response;
    response.endpoint = bandit_epsilon_endpoint;
    response.arms = bandit->allocate_arms();
    response.winner = bandit->choose_arm(response.arms, gen);
    return response;
}

}  // namespace endpoint
}  // namespace banditry
