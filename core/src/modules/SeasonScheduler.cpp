#include "modules/SeasonScheduler.h"
#include "kernel/SimulationConfig.h"
#include "utils/Validation.h"

#include <iostream>
#include <random>

SeasonScheduler::SeasonScheduler(SimulationState& state, VoyageSimulator& simulator, bool verbose)
    : state_(state), simulator_(simulator), verbose_(verbose) {
    const auto& islands = state_.islands().islands();
    for (std::size_t i = 0; i < islands.size(); ++i) {
        if (isTradeOriented(islands[i].type)) {
            traders_.push_back(i);
        }
    }
}

std::size_t SeasonScheduler::pickOrigin() {
    auto& rng = state_.rng();
    const std::size_t n = state_.islands().size();

    std::uniform_int_distribution<std::size_t> anyIsland(0, n - 1);
    std::size_t origin = anyIsland(rng);

    // Trade-biased origin selection
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    if (uni(rng) < TuningConstants::kTraderOriginBias && !traders_.empty()) {
        std::uniform_int_distribution<std::size_t> anyTrader(0, traders_.size() - 1);
        origin = traders_[anyTrader(rng)];
    }
    return origin;
}

std::size_t SeasonScheduler::pickDestination(std::size_t origin) {
    // Uniform over the other n-1 islands: draw a slot and skip past the origin
    const std::size_t n = state_.islands().size();
    std::uniform_int_distribution<std::size_t> slot(0, n - 2);
    std::size_t dest = slot(state_.rng());
    if (dest >= origin) {
        ++dest;
    }
    return dest;
}

SeasonResult SeasonScheduler::runSeason() {
    const auto& islands = state_.islands();
    if (islands.size() < 2) {
        throw validation::InvalidStateError(
            "runSeason requires at least two islands (have " + std::to_string(islands.size()) + ")");
    }

    SeasonResult result;
    result.season = static_cast<std::uint32_t>(state_.seasons().size() + 1);
    result.sailedUnder = state_.monsoon().state();
    result.total = TuningConstants::kVoyagesPerSeason;

    for (int i = 0; i < TuningConstants::kVoyagesPerSeason; ++i) {
        const std::size_t origin = pickOrigin();
        const std::size_t dest = pickDestination(origin);

        Voyage voyage = simulator_.attemptVoyage(islands.at(origin).id, islands.at(dest).id);
        if (voyage.success) {
            ++result.successful;
            result.trade += voyage.trade;
            if (voyage.cultural) {
                ++result.cultural;
            }
        }
        state_.voyage_log_.record(result.season, voyage);
    }

    state_.monsoon_.advance();

    result.monsoon = state_.monsoon().state();
    result.rate = static_cast<double>(result.successful) / result.total;
    result.routes = state_.routes().size();
    state_.seasons_.push_back(result);

    if (verbose_) {
        std::cerr << "[Season] " << result.season
                  << " sailed=" << monsoonName(result.sailedUnder)
                  << " next=" << monsoonName(result.monsoon)
                  << " success=" << result.successful << "/" << result.total
                  << " trade=" << result.trade
                  << " cultural=" << result.cultural
                  << " routes=" << result.routes << "\n";
    }

    return result;
}
