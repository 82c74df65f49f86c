#include "ConditionalSum.h"

namespace Forge::Solver {

ConditionalSum::ConditionalSum(z3::context& ctx) : ctx_(&ctx) {}

void ConditionalSum::addSelected(const z3::expr& selector, std::int64_t coefficient) {
    if (coefficient == 0) return;
    if (selector.is_true()) {
        constant_ += coefficient;
        return;
    }
    terms_.push_back(z3::ite(selector, ctx_->int_val(coefficient), ctx_->int_val(0)));
}

void ConditionalSum::addScaled(const z3::expr& count, std::int64_t coefficient) {
    if (coefficient == 0) return;
    if (coefficient == 1) {
        terms_.push_back(count);
        return;
    }
    terms_.push_back(ctx_->int_val(coefficient) * count);
}

z3::expr ConditionalSum::build() const {
    if (terms_.empty()) return ctx_->int_val(constant_);
    z3::expr_vector parts(*ctx_);
    for (const auto& t : terms_) parts.push_back(t);
    if (constant_ != 0) parts.push_back(ctx_->int_val(constant_));
    return z3::sum(parts);
}

}  // namespace Forge::Solver
