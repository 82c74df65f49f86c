// Linear sum whose terms switch on with a boolean selector or scale with an integer count.
// Recurring primitive for skill points and slot availability: unselected terms contribute zero.
#pragma once

#include <cstdint>
#include <vector>

#include <z3++.h>

namespace Forge::Solver {

class ConditionalSum {
public:
    explicit ConditionalSum(z3::context& ctx);

    // Adds `coefficient` when `selector` (Bool) holds.
    void addSelected(const z3::expr& selector, std::int64_t coefficient);
    // Adds `coefficient * count` for an Int-sorted `count`.
    void addScaled(const z3::expr& count, std::int64_t coefficient);

    // Integer expression for the whole sum; the literal 0 when nothing was added.
    z3::expr build() const;

private:
    z3::context* ctx_;
    std::vector<z3::expr> terms_;
    std::int64_t constant_{0};
};

}  // namespace Forge::Solver
