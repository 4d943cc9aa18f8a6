/**
 * @file Error.cpp
 * @brief Implementation of Error::format() and cause traversal.
 * @author MasterLaplace
 */

#include "bpb/core/Error.hpp"

#include <sstream>

namespace bpb::core {

const Error &Error::rootCause() const
{
    const Error *current = this;
    while (current->cause() != nullptr) {
        current = current->cause();
    }
    return *current;
}

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message;
    for (const Error *inner = cause(); inner != nullptr; inner = inner->cause()) {
        os << ": [" << errorCodeName(inner->code()) << "] " << inner->message();
    }
    os << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

} // namespace bpb::core
