#pragma once
/**
 * @file contract.hpp
 * @brief Fail-fast path for broken invariants (topology errors, packet misuse).
 *
 * These conditions are unreachable in correct code, so they are never
 * reported as recoverable errors. The message goes to stderr, then abort().
 */

namespace aqt {

/// Print "aqt: contract violation: <what>" and abort the process.
[[noreturn]] void contract_violation(const char* what) noexcept;

/// Always-on precondition check (unlike assert, survives NDEBUG builds).
inline void expects(bool ok, const char* what) noexcept {
    if (!ok) contract_violation(what);
}

} // namespace aqt
