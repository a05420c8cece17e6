/**
 * @file buffered_stream.hh
 * @brief Lazy random-access view over a forward-only chunk source
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <memory>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <rstream/export_rstream.h>
#include <rstream/chunk_source.hh>
#include <rstream/stream_options.hh>

namespace rstream {

    /**
     * @class buffered_stream
     * @brief Seekable, readable stream built lazily from a chunk source
     *
     * Every chunk pulled from the source is appended to an in-memory
     * buffer that only ever grows. Reads and seeks are served from that
     * buffer; the source is pulled only when a request reaches past what
     * has been buffered so far. Once the source reports exhaustion it is
     * never queried again.
     *
     * The stream is not thread-safe. Calls on one instance must be
     * serialized by the caller.
     */
    class RSTREAM_EXPORT buffered_stream {
    public:
        enum whence_t {
            set,
            cur,
            end
        };

    public:
        /**
         * @brief Construct over a chunk source
         * @param source Source to pull chunks from (ownership is taken)
         * @param options Stream options
         * @throws argument_error if source is null
         *
         * Nothing is pulled at construction time.
         */
        explicit buffered_stream(std::unique_ptr<chunk_source> source,
                                 const stream_options& options = stream_options());
        ~buffered_stream();

        buffered_stream(const buffered_stream&) = delete;
        buffered_stream& operator = (const buffered_stream&) = delete;

        // A moved-from stream is empty and exhausted
        buffered_stream(buffered_stream&& other);
        buffered_stream& operator = (buffered_stream&& other);

        /**
         * @brief Read up to size bytes from the current position
         * @param dst Destination buffer
         * @param size Number of bytes to read
         * @return Number of bytes actually copied, fewer than size only at end of stream
         */
        std::size_t read(void* dst, std::size_t size);

        /**
         * @brief Read up to n bytes from the current position
         * @param n Number of bytes to read
         * @return The bytes read; shorter than n (possibly empty) at end of stream
         */
        std::vector<std::byte> read_bytes(std::size_t n);

        /**
         * @brief Read everything from the current position to the end
         * @return All remaining bytes
         *
         * Drains the chunk source completely before returning.
         */
        std::vector<std::byte> read_all();

        /**
         * @brief Read exactly n bytes
         * @param n Number of bytes to read
         * @return The bytes read
         * @throws io_error if the stream ends first; the bytes that were
         *         available are consumed
         */
        std::vector<std::byte> read_exact(std::size_t n);

        /**
         * @brief Move the current position
         * @param offset Offset relative to whence
         * @param whence Reference point
         * @return The new absolute position
         * @throws argument_error on an unknown whence or a negative result
         *
         * Seeking relative to set or cur never pulls, even when the new
         * position lies beyond the buffered data. Seeking relative to end
         * drains the chunk source first.
         */
        std::uint64_t seek(std::int64_t offset, whence_t whence = set);

        [[nodiscard]] std::uint64_t tell() const { return m_position; }

        /**
         * @brief Total length of the stream
         *
         * Drains the chunk source. The current position is not changed.
         */
        std::uint64_t size();

        [[nodiscard]] std::uint64_t buffered_size() const { return m_buffer.size(); }
        [[nodiscard]] bool exhausted() const { return m_exhausted; }
        [[nodiscard]] std::uint64_t pull_count() const { return m_pulls; }

    private:
        // Pull until the buffer holds at least goal bytes or the source ends
        void load_until(std::uint64_t goal);
        void load_all();
        bool pull_once();

        // Copy [m_position, goal) clamped to the buffer and advance
        std::size_t copy_out(void* dst, std::uint64_t goal);

    private:
        std::unique_ptr<chunk_source> m_source;
        stream_options m_options;
        std::vector<std::byte> m_buffer;
        std::uint64_t m_position;
        std::uint64_t m_pulls;
        bool m_exhausted;
    };

} // namespace rstream
