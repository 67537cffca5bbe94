/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: log.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-wide log. Every line goes to stdout and into a bounded ring
 * buffer that administrators can read back over the API.
 * ============================================================================
 */

#ifndef SPL_LOG_HPP
#define SPL_LOG_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace spl {

// Levels in use: DEBUG, INFO, WARN, ERROR, CRITICAL, FATAL.
void spl_log(const std::string& level, const std::string& message);

// Oldest first.
std::vector<std::string> recent_logs();

// Shrinking the capacity drops the oldest entries immediately.
void set_log_capacity(std::size_t capacity);

} // namespace spl

#endif // SPL_LOG_HPP
