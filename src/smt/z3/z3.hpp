#ifndef FPRV_Z3_HPP
#define FPRV_Z3_HPP

#include "../smt.hpp"
#include "z3context.hpp"
#include "../../config.hpp"

#include <z3++.h>
#include <string>
#include <ostream>

class Z3 {

public:
    Z3(z3::context &ctx, unsigned int timeout = Config::Smt::RuleTimeout);

    void add(const z3::expr &e);
    void push();
    void pop();
    Smt::Result check();
    z3::model model() const;
    void enableModels();

    // why the last check returned Unknown
    std::string reasonUnknown() const;

    std::ostream& print(std::ostream& os) const;

    /**
     * Checks the satisfiability of e with a fresh solver.
     */
    static Smt::Result check(const z3::expr &e, unsigned int timeout);

private:
    bool models = false;
    unsigned int timeout;
    z3::context &ctx;
    z3::solver solver;

    void updateParams();

};

#endif // FPRV_Z3_HPP
