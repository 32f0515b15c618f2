#pragma once

#include <boost/core/demangle.hpp>

#include <string>
#include <typeinfo>

namespace base {

/// Human readable name of `T`, used in the log records and the error messages.
template <typename T>
inline std::string type_name()
{
    return boost::core::demangle(typeid(T).name());
}

} // namespace base
