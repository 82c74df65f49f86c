#include "SolverSession.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace Forge::Solver {

namespace {
bool isResourceLimit(const std::string& reason) {
    return reason.find("timeout") != std::string::npos || reason.find("canceled") != std::string::npos ||
           reason.find("resource") != std::string::npos;
}
}  // namespace

SolverSession::SolverSession() : ctx_(), opt_(ctx_), feasibility_(ctx_) {}

z3::expr SolverSession::boolVar(const std::string& name) {
    ++variables_;
    return ctx_.bool_const(name.c_str());
}

z3::expr SolverSession::intVar(const std::string& name, std::int64_t lo, std::int64_t hi) {
    ++variables_;
    z3::expr v = ctx_.int_const(name.c_str());
    require(v >= ctx_.int_val(lo));
    require(v <= ctx_.int_val(hi));
    return v;
}

z3::expr SolverSession::constant(std::int64_t value) {
    return ctx_.int_val(value);
}

void SolverSession::require(const z3::expr& constraint) {
    ++constraints_;
    opt_.add(constraint);
    feasibility_.add(constraint);
}

void SolverSession::maximize(const z3::expr& objective) {
    opt_.maximize(objective);
    objective_ = objective;
}

SessionStatus SolverSession::solve(const SessionLimits& limits, CancellationToken* token) {
    if (solved_) {
        failureReason_ = "session already solved";
        return SessionStatus::Error;
    }
    solved_ = true;
    model_.reset();
    if (token && token->cancelled()) return SessionStatus::Cancelled;

    const double budgetMs = std::max(1.0, std::ceil(limits.timeLimitSeconds * 1000.0));
    const auto start = std::chrono::steady_clock::now();
    const auto elapsed = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };
    const auto timeoutParams = [this](double ms) {
        z3::params p(ctx_);
        p.set("timeout", static_cast<unsigned>(std::clamp(ms, 1.0, 4294967295.0)));
        return p;
    };

    // Any assignment of the hard constraints is a valid answer, so one is secured first and the
    // optimizer spends the rest of the budget improving on it.
    std::optional<z3::model> incumbent;
    z3::check_result result = z3::unknown;
    try {
        CancellationScope scope(token, [this] { ctx_.interrupt(); });

        feasibility_.set(timeoutParams(budgetMs));
        const z3::check_result first = feasibility_.check();
        if (token && token->cancelled()) {
            solveSeconds_ = elapsed();
            return SessionStatus::Cancelled;
        }
        if (first == z3::unsat) {
            solveSeconds_ = elapsed();
            return SessionStatus::Infeasible;
        }
        if (first == z3::sat) incumbent = feasibility_.get_model();

        opt_.set(timeoutParams(budgetMs - elapsed() * 1000.0));
        result = opt_.check();
    } catch (const z3::exception& e) {
        solveSeconds_ = elapsed();
        if (token && token->cancelled()) return SessionStatus::Cancelled;
        failureReason_ = e.msg();
        return SessionStatus::Error;
    }
    solveSeconds_ = elapsed();

    if (token && token->cancelled()) return SessionStatus::Cancelled;

    try {
        switch (result) {
            case z3::sat:
                model_ = opt_.get_model();
                return SessionStatus::Optimal;
            case z3::unsat:
                return SessionStatus::Infeasible;
            case z3::unknown:
            default:
                break;
        }

        failureReason_ = Z3_optimize_get_reason_unknown(ctx_, opt_);
        z3::model best = opt_.get_model();
        if (best.num_consts() > 0 && (!incumbent || objectiveValue(best) >= objectiveValue(*incumbent))) {
            incumbent = best;
        }
        if (incumbent) {
            model_ = incumbent;
            return SessionStatus::Feasible;
        }
        return isResourceLimit(failureReason_) ? SessionStatus::Timeout : SessionStatus::Error;
    } catch (const z3::exception& e) {
        model_.reset();
        failureReason_ = e.msg();
        return SessionStatus::Error;
    }
}

std::int64_t SolverSession::objectiveValue(const z3::model& model) const {
    if (!objective_) return 0;
    return model.eval(*objective_, true).get_numeral_int64();
}

std::int64_t SolverSession::intValue(const z3::expr& e) const {
    if (!model_) return 0;
    return model_->eval(e, true).get_numeral_int64();
}

bool SolverSession::boolValue(const z3::expr& e) const {
    if (!model_) return false;
    return model_->eval(e, true).is_true();
}

}  // namespace Forge::Solver
