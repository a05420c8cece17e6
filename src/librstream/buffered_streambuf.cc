//
// Created by igor on 03/09/2025.
//

#include <rstream/buffered_streambuf.hh>
#include <rstream/exceptions.hh>
#include <algorithm>
#include <cstring>

namespace rstream {

    buffered_streambuf::buffered_streambuf(buffered_stream& stream)
        : m_stream(stream)
        , m_buffer(0) {
        setg(nullptr, nullptr, nullptr);
    }

    buffered_streambuf::int_type buffered_streambuf::underflow() {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }

        if (m_stream.read(&m_buffer, 1) == 0) {
            return traits_type::eof();
        }

        setg(&m_buffer, &m_buffer, &m_buffer + 1);
        return traits_type::to_int_type(m_buffer);
    }

    std::streamsize buffered_streambuf::xsgetn(char_type* s, std::streamsize count) {
        if (count <= 0) {
            return 0;
        }

        // Drain the one-character get area first
        std::streamsize done = std::min<std::streamsize>(egptr() - gptr(), count);
        if (done > 0) {
            std::memcpy(s, gptr(), static_cast<std::size_t>(done));
            gbump(static_cast<int>(done));
        }

        if (done < count) {
            done += static_cast<std::streamsize>(
                m_stream.read(s + done, static_cast<std::size_t>(count - done)));
        }

        // Keep the last byte handed out as the putback position
        if (done > 0) {
            m_buffer = s[done - 1];
            setg(&m_buffer, &m_buffer + 1, &m_buffer + 1);
        }
        return done;
    }

    buffered_streambuf::int_type buffered_streambuf::pbackfail(int_type c) {
        std::uint64_t pending = static_cast<std::uint64_t>(egptr() - gptr());
        std::uint64_t logical = m_stream.tell() - pending;
        if (logical == 0 || logical > m_stream.buffered_size()) {
            return traits_type::eof();
        }

        // Step back one byte past anything still in the get area and reload it
        m_stream.seek(-static_cast<std::int64_t>(pending + 1), buffered_stream::cur);
        if (m_stream.read(&m_buffer, 1) == 0) {
            return traits_type::eof();
        }

        if (!traits_type::eq_int_type(c, traits_type::eof()) &&
            !traits_type::eq(traits_type::to_char_type(c), m_buffer)) {
            // Read-only: a different character cannot be put back
            setg(&m_buffer, &m_buffer + 1, &m_buffer + 1);
            return traits_type::eof();
        }

        setg(&m_buffer, &m_buffer, &m_buffer + 1);
        return traits_type::to_int_type(m_buffer);
    }

    std::streamsize buffered_streambuf::showmanyc() {
        if (m_stream.tell() < m_stream.buffered_size()) {
            return static_cast<std::streamsize>(m_stream.buffered_size() - m_stream.tell());
        }
        return m_stream.exhausted() ? -1 : 0;
    }

    buffered_streambuf::pos_type buffered_streambuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                                             std::ios_base::openmode which) {
        if (!(which & std::ios_base::in)) {
            return pos_type(off_type(-1));
        }

        buffered_stream::whence_t whence;
        switch (dir) {
            case std::ios_base::beg:
                whence = buffered_stream::set;
                break;
            case std::ios_base::cur:
                whence = buffered_stream::cur;
                // The underlying position is ahead by whatever is still in the get area
                off -= static_cast<off_type>(egptr() - gptr());
                break;
            case std::ios_base::end:
                whence = buffered_stream::end;
                break;
            default:
                return pos_type(off_type(-1));
        }

        std::uint64_t pos;
        try {
            pos = m_stream.seek(static_cast<std::int64_t>(off), whence);
        } catch (const argument_error&) {
            return pos_type(off_type(-1));
        }

        setg(nullptr, nullptr, nullptr);
        return pos_type(static_cast<off_type>(pos));
    }

    buffered_streambuf::pos_type buffered_streambuf::seekpos(pos_type pos, std::ios_base::openmode which) {
        return seekoff(off_type(pos), std::ios_base::beg, which);
    }

    buffered_istream::buffered_istream(buffered_stream& stream)
        : std::istream(nullptr)
        , m_buf(stream) {
        rdbuf(&m_buf);
    }

} // namespace rstream
