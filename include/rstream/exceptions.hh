/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for rstream
 * @author Igor
 * @date 02/09/2025
 *
 * Exhaustion of a chunk source is never reported through these types;
 * it shows up as a short read. Exceptions thrown by a chunk source itself
 * are propagated untouched and need not derive from rstream_error.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace rstream {

    /**
     * @class rstream_error
     * @brief Base exception class for all rstream errors
     */
    class rstream_error : public std::runtime_error {
    public:
        explicit rstream_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class argument_error
     * @brief Invalid argument passed to a stream or source
     *
     * Thrown before any chunk is pulled, so a failed call leaves the
     * stream exactly as it was.
     */
    class argument_error : public rstream_error {
    public:
        explicit argument_error(const std::string& msg)
            : rstream_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for reads that cannot be satisfied
     */
    class io_error : public rstream_error {
    public:
        explicit io_error(const std::string& msg)
            : rstream_error(msg) {}
    };

    /**
     * @class source_error
     * @brief Failure inside one of the stock chunk sources
     */
    class source_error : public rstream_error {
    public:
        explicit source_error(const std::string& msg)
            : rstream_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_ARG(...) \
        throw ::rstream::argument_error(::rstream::build_error_msg(__VA_ARGS__))

    #define THROW_IO(...) \
        throw ::rstream::io_error(::rstream::build_error_msg(__VA_ARGS__))

    #define THROW_SOURCE(...) \
        throw ::rstream::source_error(::rstream::build_error_msg(__VA_ARGS__))

    #define THROW_ARG_IF(condition, ...) \
        do { if (condition) THROW_ARG(__VA_ARGS__); } while(0)

    #define THROW_ARG_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_ARG(__VA_ARGS__); } while(0)

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_SOURCE_IF(condition, ...) \
        do { if (condition) THROW_SOURCE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace rstream
