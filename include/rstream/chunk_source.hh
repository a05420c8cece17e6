/**
 * @file chunk_source.hh
 * @brief Abstract pull interface for forward-only producers of byte chunks
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <vector>
#include <memory>
#include <functional>
#include <cstddef>
#include <rstream/export_rstream.h>

namespace rstream {

    /// One block of bytes handed over by a chunk source
    using chunk = std::vector<std::byte>;

    /**
     * @typedef pull_result
     * @brief Outcome of a single pull
     *
     * An engaged value carries the next chunk (which may be empty);
     * std::nullopt means the source is exhausted.
     */
    using pull_result = std::optional<chunk>;

    /**
     * @class chunk_source
     * @brief Single-pass producer of byte chunks
     *
     * Implementations yield their chunks in order and then report
     * exhaustion. Once exhausted, every further call to next() must keep
     * returning std::nullopt. There is no rewind. Failures (a broken
     * connection, a bad stream) are reported by throwing from next().
     *
     * A chunk source does not own what it wraps unless documented
     * otherwise: closing a socket or a file is up to whoever opened it.
     */
    class RSTREAM_EXPORT chunk_source {
    public:
        /**
         * @typedef generator
         * @brief Callable producing chunks for from_callable()
         */
        using generator = std::function<pull_result()>;

        /**
         * @brief Virtual destructor
         */
        virtual ~chunk_source() = default;

        /**
         * @brief Pull the next chunk
         * @return The chunk, or std::nullopt once the source is exhausted
         */
        virtual pull_result next() = 0;

        /**
         * @brief Source yielding a fixed list of chunks
         * @param chunks Chunks to yield, in order
         * @return Unique pointer to the source
         */
        static std::unique_ptr<chunk_source> from_chunks(std::vector<chunk> chunks);

        /**
         * @brief Source reading an input stream in fixed-size pieces
         * @param stream Input stream to read from (not owned, must outlive the source)
         * @param chunk_size Maximum number of bytes per chunk
         * @return Unique pointer to the source
         * @throws argument_error if chunk_size is zero
         *
         * Each pull reads up to chunk_size bytes. End of stream is
         * exhaustion; a stream that goes bad raises source_error.
         */
        static std::unique_ptr<chunk_source> from_stream(std::istream& stream, std::size_t chunk_size = 8192);

        /**
         * @brief Source backed by a callable
         * @param fn Callable returning the next chunk or std::nullopt
         * @return Unique pointer to the source
         * @throws argument_error if fn is empty
         *
         * The first std::nullopt returned by fn is latched; fn is never
         * invoked again afterwards.
         */
        static std::unique_ptr<chunk_source> from_callable(generator fn);
    };

} // namespace rstream
