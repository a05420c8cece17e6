//
// Created by igor on 02/09/2025.
//

#include <rstream/buffered_stream.hh>
#include <rstream/exceptions.hh>
#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

namespace rstream {

    namespace {
        std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) {
            if (a > std::numeric_limits<std::uint64_t>::max() - b) {
                return std::numeric_limits<std::uint64_t>::max();
            }
            return a + b;
        }
    }

    buffered_stream::buffered_stream(std::unique_ptr<chunk_source> source, const stream_options& options)
        : m_source(std::move(source))
        , m_options(options)
        , m_position(0)
        , m_pulls(0)
        , m_exhausted(false) {
        THROW_ARG_UNLESS(m_source, "Null chunk source passed to buffered_stream");

        if (m_options.initial_capacity > 0) {
            m_buffer.reserve(m_options.initial_capacity);
        }
    }

    buffered_stream::~buffered_stream() = default;

    buffered_stream::buffered_stream(buffered_stream&& other)
        : m_source(std::move(other.m_source))
        , m_options(std::move(other.m_options))
        , m_buffer(std::move(other.m_buffer))
        , m_position(other.m_position)
        , m_pulls(other.m_pulls)
        , m_exhausted(other.m_exhausted) {
        other.m_buffer.clear();
        other.m_position = 0;
        other.m_pulls = 0;
        other.m_exhausted = true;
    }

    buffered_stream& buffered_stream::operator = (buffered_stream&& other) {
        if (this != &other) {
            m_source = std::move(other.m_source);
            m_options = std::move(other.m_options);
            m_buffer = std::move(other.m_buffer);
            m_position = other.m_position;
            m_pulls = other.m_pulls;
            m_exhausted = other.m_exhausted;

            other.m_buffer.clear();
            other.m_position = 0;
            other.m_pulls = 0;
            other.m_exhausted = true;
        }
        return *this;
    }

    std::size_t buffered_stream::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        THROW_ARG_UNLESS(dst, "Null buffer in buffered_stream::read");

        std::uint64_t goal = saturating_add(m_position, size);
        load_until(goal);
        return copy_out(dst, goal);
    }

    std::vector<std::byte> buffered_stream::read_bytes(std::size_t n) {
        std::vector<std::byte> result;
        if (n == 0) {
            return result;
        }

        std::uint64_t goal = saturating_add(m_position, n);
        load_until(goal);

        if (m_position < m_buffer.size()) {
            result.resize(static_cast<std::size_t>(std::min<std::uint64_t>(goal, m_buffer.size()) - m_position));
            copy_out(result.data(), goal);
        }
        return result;
    }

    std::vector<std::byte> buffered_stream::read_all() {
        load_all();

        std::vector<std::byte> result;
        if (m_position < m_buffer.size()) {
            result.assign(m_buffer.begin() + static_cast<std::ptrdiff_t>(m_position), m_buffer.end());
            m_position = m_buffer.size();
        }
        return result;
    }

    std::vector<std::byte> buffered_stream::read_exact(std::size_t n) {
        std::vector<std::byte> result = read_bytes(n);
        THROW_IO_IF(result.size() != n, "Unexpected end of stream: requested ", n, " got ", result.size());
        return result;
    }

    std::uint64_t buffered_stream::seek(std::int64_t offset, whence_t whence) {
        THROW_ARG_IF(whence != set && whence != cur && whence != end,
                     "Invalid whence value: ", static_cast<int>(whence));

        std::uint64_t base = 0;
        switch (whence) {
            case set:
                break;
            case cur:
                base = m_position;
                break;
            case end:
                load_all();
                base = m_buffer.size();
                break;
        }

        std::uint64_t new_pos;
        if (offset < 0) {
            // -(offset + 1) + 1 avoids overflow for INT64_MIN
            std::uint64_t back = static_cast<std::uint64_t>(-(offset + 1)) + 1;
            THROW_ARG_IF(back > base, "Negative seek position: ", offset, " from ", base);
            new_pos = base - back;
        } else {
            std::uint64_t fwd = static_cast<std::uint64_t>(offset);
            THROW_ARG_IF(base > std::numeric_limits<std::uint64_t>::max() - fwd,
                         "Seek position overflow: ", offset, " from ", base);
            new_pos = base + fwd;
        }

        m_position = new_pos;
        return m_position;
    }

    std::uint64_t buffered_stream::size() {
        load_all();
        return m_buffer.size();
    }

    void buffered_stream::load_until(std::uint64_t goal) {
        while (m_buffer.size() < goal) {
            if (!pull_once()) {
                break;
            }
        }
    }

    void buffered_stream::load_all() {
        while (pull_once()) {
        }
    }

    bool buffered_stream::pull_once() {
        if (m_exhausted) {
            return false;
        }

        ++m_pulls;
        pull_result next = m_source->next();

        if (!next) {
            m_exhausted = true;
            if (m_options.on_event) {
                m_options.on_event(m_buffer.size(), "exhausted",
                                   "source exhausted after " + std::to_string(m_buffer.size()) + " bytes");
            }
            return false;
        }

        std::uint64_t offset = m_buffer.size();
        m_buffer.insert(m_buffer.end(), next->begin(), next->end());

        if (m_options.on_event) {
            m_options.on_event(offset, "pull",
                               "appended chunk of " + std::to_string(next->size()) + " bytes");
        }
        return true;
    }

    std::size_t buffered_stream::copy_out(void* dst, std::uint64_t goal) {
        if (m_position >= m_buffer.size()) {
            return 0;
        }

        std::uint64_t stop = std::min<std::uint64_t>(goal, m_buffer.size());
        std::size_t count = static_cast<std::size_t>(stop - m_position);
        if (count > 0) {
            std::memcpy(dst, m_buffer.data() + m_position, count);
            m_position += count;
        }
        return count;
    }

} // namespace rstream
