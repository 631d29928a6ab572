#ifndef MONSOON_H
#define MONSOON_H

#include <cstdint>
#include <set>
#include <string>
#include <utility>

enum class MonsoonState : std::uint8_t {
    Northeast = 0,
    Southwest = 1,
    Calm = 2
};

const char* monsoonName(MonsoonState state);

/**
 * Cyclical wind-season state machine.
 *
 * advance() increments the cycle counter and then maps cycle % 6:
 *   0 -> northeast, 3 -> southwest, 2 and 5 -> calm,
 *   1 and 4 -> label held from the previous step.
 *
 * Starting from (northeast, 0) this yields the repeating sequence
 *   cycle:  1   2    3   4   5    6
 *   label:  NE  calm SW  SW  calm NE
 * The machine has no terminal state.
 */
class MonsoonModel {
public:
    void advance();
    void reset();

    MonsoonState state() const { return state_; }
    std::uint64_t cycle() const { return cycle_; }

private:
    MonsoonState state_ = MonsoonState::Northeast;
    std::uint64_t cycle_ = 0;
};

// Ordered origin->destination pairs that sail with the wind in each monsoon.
// The reverse of a listed pair sails against it.
class FavorableWinds {
public:
    using Key = std::pair<std::string, std::string>;

    FavorableWinds() = default;
    FavorableWinds(std::set<Key> northeast, std::set<Key> southwest);

    static FavorableWinds nusantara();

    // Wind factor for a voyage under the given monsoon
    double factor(MonsoonState state, const std::string& from, const std::string& to) const;

private:
    const std::set<Key>* routesFor(MonsoonState state) const;

    std::set<Key> northeast_;
    std::set<Key> southwest_;
};

#endif
