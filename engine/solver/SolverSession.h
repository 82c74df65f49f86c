// One optimization run against Z3: owns the context, the model under construction and the result.
// A session is single-use and never shared between threads, except through CancellationToken.
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <z3++.h>

#include "../core/CancellationToken.h"

namespace Forge::Solver {

enum class SessionStatus {
    Optimal,     // search completed, objective proven optimal
    Feasible,    // time limit hit; best assignment found, possibly only the first feasible one
    Infeasible,  // no assignment satisfies the constraints
    Timeout,     // interrupted by the time limit before any assignment was found
    Cancelled,   // interrupted by the cancellation token; no assignment surfaced
    Error        // the solver failed; see failureReason()
};

struct SessionLimits {
    double timeLimitSeconds{30.0};
};

class SolverSession {
public:
    SolverSession();

    SolverSession(const SolverSession&) = delete;
    SolverSession& operator=(const SolverSession&) = delete;

    z3::context& context() { return ctx_; }

    z3::expr boolVar(const std::string& name);
    // Integer variable with inclusive bounds.
    z3::expr intVar(const std::string& name, std::int64_t lo, std::int64_t hi);
    z3::expr constant(std::int64_t value);

    void require(const z3::expr& constraint);
    // Single objective per session.
    void maximize(const z3::expr& objective);

    // Blocking. Only the first call performs a solve; the session is spent afterwards.
    // A plain satisfiability pass runs first so the time limit rarely leaves nothing to report.
    SessionStatus solve(const SessionLimits& limits, CancellationToken* token = nullptr);

    std::int64_t intValue(const z3::expr& e) const;
    bool boolValue(const z3::expr& e) const;

    const std::string& failureReason() const { return failureReason_; }
    std::size_t variableCount() const { return variables_; }
    std::size_t constraintCount() const { return constraints_; }
    double solveSeconds() const { return solveSeconds_; }

private:
    std::int64_t objectiveValue(const z3::model& model) const;

    z3::context ctx_;
    z3::optimize opt_;
    z3::solver feasibility_;  // same hard constraints, no objective
    std::optional<z3::expr> objective_;
    std::optional<z3::model> model_;
    std::string failureReason_;
    std::size_t variables_{0};
    std::size_t constraints_{0};
    double solveSeconds_{0.0};
    bool solved_{false};
};

}  // namespace Forge::Solver
