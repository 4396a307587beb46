/**
* @file contract.cpp
 * @brief stderr + abort implementation of the contract-violation hook.
 */
#include "aqt/compat/contract.hpp"
#include <cstdio>
#include <cstdlib>

namespace aqt {

void contract_violation(const char* what) noexcept {
    std::fprintf(stderr, "aqt: contract violation: %s\n", what ? what : "(unknown)");
    std::fflush(stderr);
    std::abort();
}

} // namespace aqt
