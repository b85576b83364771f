#include "z3.hpp"
#include "../../util/timeout.hpp"

std::ostream& Z3::print(std::ostream& os) const {
    return os << solver;
}

Z3::Z3(z3::context &ctx, unsigned int timeout): timeout(timeout), ctx(ctx), solver(ctx) {
    updateParams();
}

void Z3::add(const z3::expr &e) {
    solver.add(e);
}

void Z3::push() {
    solver.push();
}

void Z3::pop() {
    solver.pop();
}

Smt::Result Z3::check() {
    // the remaining time may have shrunk since the timeout was set
    updateParams();
    switch (solver.check()) {
    case z3::sat: return Smt::Sat;
    case z3::unsat: return Smt::Unsat;
    case z3::unknown: return Smt::Unknown;
    }
    throw std::logic_error("unknown result");
}

z3::model Z3::model() const {
    if (!models) {
        throw std::logic_error("models are disabled");
    }
    return solver.get_model();
}

std::string Z3::reasonUnknown() const {
    return solver.reason_unknown();
}

void Z3::enableModels() {
    this->models = true;
    updateParams();
}

void Z3::updateParams() {
    z3::params params(ctx);
    params.set(":model", models);
    params.set(":timeout", Timeout::clamp(timeout));
    solver.set(params);
}

Smt::Result Z3::check(const z3::expr &e, unsigned int timeout) {
    Z3 solver(e.ctx(), timeout);
    solver.add(e);
    return solver.check();
}
