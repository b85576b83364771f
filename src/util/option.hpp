#ifndef FPRV_OPTION_HPP
#define FPRV_OPTION_HPP

// Alias for boost::optional, can be changed to std::optional when C++17 is used
#include <boost/optional.hpp>

template <typename T>
using option = boost::optional<T>;

#endif // FPRV_OPTION_HPP
