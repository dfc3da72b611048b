///|/ Copyright (c) Skinner contributors
///|/
///|/ Skinner is released under the terms of the AGPLv3 or higher
///|/
#ifndef _libskinner_Exception_h_
#define _libskinner_Exception_h_

#include <stdexcept>
#include <string>

namespace Skinner {

#define SKINNER_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { \
    public: \
        DERIVED_EXCEPTION(const std::string &msg) : PARENT_EXCEPTION(msg) {} \
        DERIVED_EXCEPTION(const char *msg) : PARENT_EXCEPTION(msg) {} \
    }

// Base for Skinner exceptions.
SKINNER_DERIVE_EXCEPTION(Exception,             std::runtime_error);
SKINNER_DERIVE_EXCEPTION(RuntimeError,          Exception);
SKINNER_DERIVE_EXCEPTION(FileIOError,           Exception);
SKINNER_DERIVE_EXCEPTION(ConfigurationError,    Exception);
// Malformed numeric argument in the annotated G-code.
SKINNER_DERIVE_EXCEPTION(GCodeParseError,       Exception);
// The skin stage cannot run on the given input.
SKINNER_DERIVE_EXCEPTION(SkinError,             Exception);

} // namespace Skinner

#endif // _libskinner_Exception_h_
