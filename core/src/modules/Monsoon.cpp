#include "modules/Monsoon.h"
#include "kernel/SimulationConfig.h"

const char* monsoonName(MonsoonState state) {
    switch (state) {
        case MonsoonState::Northeast: return "northeast";
        case MonsoonState::Southwest: return "southwest";
        case MonsoonState::Calm:      return "calm";
    }
    return "unknown";
}

void MonsoonModel::advance() {
    ++cycle_;
    switch (cycle_ % TuningConstants::kMonsoonPeriod) {
        case 0:
            state_ = MonsoonState::Northeast;
            break;
        case 3:
            state_ = MonsoonState::Southwest;
            break;
        case 2:
        case 5:
            state_ = MonsoonState::Calm;
            break;
        default:
            // 1 and 4: hold the previous label
            break;
    }
}

void MonsoonModel::reset() {
    state_ = MonsoonState::Northeast;
    cycle_ = 0;
}

FavorableWinds::FavorableWinds(std::set<Key> northeast, std::set<Key> southwest)
    : northeast_(std::move(northeast)), southwest_(std::move(southwest)) {}

FavorableWinds FavorableWinds::nusantara() {
    return FavorableWinds(
        {
            {"jakarta", "surabaya"}, {"surabaya", "makassar"}, {"malacca", "jakarta"},
            {"palembang", "jakarta"}, {"brunei", "manila"}, {"manila", "cebu"}
        },
        {
            {"surabaya", "jakarta"}, {"makassar", "surabaya"}, {"jakarta", "malacca"},
            {"jakarta", "palembang"}, {"cebu", "manila"}, {"manila", "brunei"}
        });
}

const std::set<FavorableWinds::Key>* FavorableWinds::routesFor(MonsoonState state) const {
    switch (state) {
        case MonsoonState::Northeast: return &northeast_;
        case MonsoonState::Southwest: return &southwest_;
        case MonsoonState::Calm:      return nullptr;
    }
    return nullptr;
}

double FavorableWinds::factor(MonsoonState state, const std::string& from, const std::string& to) const {
    if (state == MonsoonState::Calm) {
        return TuningConstants::kCalmFactor;
    }

    const auto* routes = routesFor(state);
    if (routes == nullptr) {
        return TuningConstants::kNeutralWindFactor;
    }
    if (routes->count(Key(from, to))) {
        return TuningConstants::kFavorableFactor;
    }
    // Against the wind
    if (routes->count(Key(to, from))) {
        return TuningConstants::kAgainstWindFactor;
    }
    return TuningConstants::kNeutralWindFactor;
}
