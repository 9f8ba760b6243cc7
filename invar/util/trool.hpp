#pragma once

#include <invar/util/util.hpp>

namespace invar {

// Three-valued truth, ordered by information: MAYBE carries none.
enum class Trool { MAYBE = 0, FALSE = 1, TRUE = 2 };

inline constexpr Trool and_trool(Trool lhs, Trool rhs) {
    return (lhs == Trool::FALSE or rhs == Trool::FALSE)
               ? Trool::FALSE
               : (lhs == Trool::TRUE and rhs == Trool::TRUE) ? Trool::TRUE
                                                             : Trool::MAYBE;
}

inline constexpr Trool or_trool(Trool lhs, Trool rhs) {
    return (lhs == Trool::TRUE or rhs == Trool::TRUE)
               ? Trool::TRUE
               : (lhs == Trool::FALSE and rhs == Trool::FALSE) ? Trool::FALSE
                                                               : Trool::MAYBE;
}

inline constexpr Trool not_trool(Trool arg) {
    return (arg == Trool::TRUE)
               ? Trool::FALSE
               : (arg == Trool::FALSE) ? Trool::TRUE : Trool::MAYBE;
}

static_assert(and_trool(Trool::MAYBE, Trool::FALSE) == Trool::FALSE, "error");
static_assert(and_trool(Trool::TRUE, Trool::MAYBE) == Trool::MAYBE, "error");
static_assert(and_trool(Trool::TRUE, Trool::TRUE) == Trool::TRUE, "error");
static_assert(or_trool(Trool::MAYBE, Trool::TRUE) == Trool::TRUE, "error");
static_assert(or_trool(Trool::FALSE, Trool::MAYBE) == Trool::MAYBE, "error");
static_assert(or_trool(Trool::FALSE, Trool::FALSE) == Trool::FALSE, "error");
static_assert(not_trool(Trool::MAYBE) == Trool::MAYBE, "error");

template <class T>
inline constexpr T case_trool(Trool trool, T if_maybe, T if_false,
                              T if_true) {
    return (trool == Trool::MAYBE) ? if_maybe
                                   : (trool == Trool::FALSE) ? if_false
                                                             : if_true;
}

inline const char* trool_name(Trool trool) {
    return case_trool(trool, "MAYBE", "FALSE", "TRUE");
}

}  // namespace invar
