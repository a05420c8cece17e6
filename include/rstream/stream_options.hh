/**
 * @file stream_options.hh
 * @brief Configuration options for buffered streams
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <cstddef>

namespace rstream {

    /**
     * @struct stream_options
     * @brief Configuration options for a buffered_stream
     */
    struct stream_options {
        /**
         * @brief Bytes to reserve in the buffer up front
         *
         * Useful when the total length is known in advance (e.g. from a
         * Content-Length header). Zero reserves nothing.
         */
        std::size_t initial_capacity = 0;

        /**
         * @typedef event_handler
         * @brief Callback function type for stream events
         * @param offset Buffer length the event refers to
         * @param category Event category ("pull", "exhausted")
         * @param message Human-readable description
         */
        using event_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional event handler callback
         *
         * Called after every pull ("pull", offset is the buffer length
         * before the chunk was appended) and once when the source reports
         * end of data ("exhausted", offset is the final length).
         * If not set, events are silently dropped.
         */
        event_handler on_event;
    };

} // namespace rstream
