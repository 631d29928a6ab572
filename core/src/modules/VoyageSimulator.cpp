#include "modules/VoyageSimulator.h"
#include "kernel/SimulationConfig.h"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <utility>

VoyageSimulator::VoyageSimulator(SimulationState& state, RouteDistanceTable distances, FavorableWinds winds)
    : state_(state), distances_(std::move(distances)), winds_(std::move(winds)) {}

double VoyageSimulator::computeSuccessProbability(const std::string& origin,
                                                  const std::string& destination) const {
    const auto& islands = state_.islands();
    const Island& from = islands.get(origin);
    islands.get(destination);  // existence check
    if (origin == destination) {
        throw std::invalid_argument("Voyage origin and destination must differ (got '" + origin + "')");
    }

    const double navFactor = from.nav;
    const double distFactor = distances_.distance(origin, destination);
    const double monsoonFactor = winds_.factor(state_.monsoon().state(), origin, destination);
    const double networkBonus = state_.hasRouteBetween(origin, destination)
        ? TuningConstants::kNetworkBonus : 0.0;

    const double p = navFactor * TuningConstants::kNavWeight +
                     distFactor * TuningConstants::kDistanceWeight +
                     monsoonFactor * TuningConstants::kMonsoonWeight +
                     networkBonus;
    return std::clamp(p, TuningConstants::kMinSuccess, TuningConstants::kMaxSuccess);
}

Voyage VoyageSimulator::attemptVoyage(const std::string& origin, const std::string& destination) {
    Voyage voyage;
    voyage.from = origin;
    voyage.to = destination;
    voyage.probability = computeSuccessProbability(origin, destination);

    auto& rng = state_.rng();
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    if (!(uni(rng) < voyage.probability)) {
        return voyage;
    }

    auto& registry = state_.registry_;
    const std::size_t a = registry.indexOf(origin);
    const std::size_t b = registry.indexOf(destination);
    const Island& from = registry.at(a);
    const Island& to = registry.at(b);

    std::uniform_int_distribution<std::uint32_t> tradeDist(TuningConstants::kMinTradeAmount,
                                                           TuningConstants::kMaxTradeAmount);
    const std::uint32_t trade = std::min(from.trade, tradeDist(rng));
    std::bernoulli_distribution culturalDist(0.5 * (from.culture + to.culture));
    const bool cultural = culturalDist(rng);

    // Commit everything together
    state_.routes_.emplace(origin, destination);
    registry.link(a, b);
    state_.trade_total_ += trade;
    if (cultural) {
        ++state_.culture_total_;
    }

    voyage.success = true;
    voyage.trade = trade;
    voyage.cultural = cultural;
    return voyage;
}
