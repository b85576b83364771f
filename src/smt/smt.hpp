#ifndef FPRV_SMT_HPP
#define FPRV_SMT_HPP

namespace Smt {

    enum Result {Sat, Unknown, Unsat};

}

#endif // FPRV_SMT_HPP
