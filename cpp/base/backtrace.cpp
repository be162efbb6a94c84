#include "backtrace.hpp"

#include <boost/stacktrace.hpp>

#include <sstream>

namespace base {

std::string backtrace()
{
    std::ostringstream out;
    // Skip this frame.
    out << boost::stacktrace::stacktrace(1, static_cast<std::size_t>(-1));
    return out.str();
}

} // namespace base
