// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Persisting container output at teardown

#ifndef FAULTLINE_TOPOLOGY_LOG_CAPTURE_HPP
#define FAULTLINE_TOPOLOGY_LOG_CAPTURE_HPP

#include "faultline/core/error_codes.hpp"
#include "faultline/core/result.hpp"

#include <string>

namespace faultline {
namespace topology {

/**
 * @brief Path of the log file for a container: <directory>/container-<name>.log,
 *        with a .gz suffix when compressed.
 */
std::string containerLogPath(const std::string& directory, const std::string& name, bool compress);

/**
 * @brief Write container output to containerLogPath(), gzip-compressed
 *        when compress is set. An existing file is replaced.
 *
 * @return The written path
 */
core::Result<std::string, core::Error> writeContainerLog(const std::string& directory,
                                                         const std::string& name,
                                                         const std::string& content,
                                                         bool compress);

} // namespace topology
} // namespace faultline

#endif // FAULTLINE_TOPOLOGY_LOG_CAPTURE_HPP
