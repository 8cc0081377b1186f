// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Test reporter interface

#ifndef FAULTLINE_HARNESS_TEST_REPORTER_HPP
#define FAULTLINE_HARNESS_TEST_REPORTER_HPP

#include <stdexcept>
#include <string>

namespace faultline {
namespace harness {

/**
 * @brief Thrown by ITestReporter::fatal to unwind the current test body.
 */
class FatalFailure : public std::runtime_error {
public:
    explicit FatalFailure(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief How harness helpers report back to the test framework.
 *
 * Implementations adapt a framework's failure reporting (e.g. GoogleTest's
 * ADD_FAILURE) so helpers never abort the process.
 */
class ITestReporter {
public:
    virtual ~ITestReporter() = default;

    /**
     * @brief Record a failure; the test continues.
     */
    virtual void error(const std::string& message) = 0;

    virtual void log(const std::string& message) = 0;

    /**
     * @brief Record a failure and throw FatalFailure.
     */
    [[noreturn]] void fatal(const std::string& message) {
        error(message);
        throw FatalFailure(message);
    }
};

} // namespace harness
} // namespace faultline

#endif // FAULTLINE_HARNESS_TEST_REPORTER_HPP
