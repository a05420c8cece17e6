/**
 * @file buffered_streambuf.hh
 * @brief std::streambuf / std::istream adapters over a buffered_stream
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <streambuf>
#include <istream>
#include <rstream/export_rstream.h>
#include <rstream/buffered_stream.hh>

namespace rstream {

    /**
     * @class buffered_streambuf
     * @brief Read-only stream buffer backed by a buffered_stream
     *
     * Lets a buffered_stream be consumed through the iostream library.
     * Chunks are pulled lazily as the stream is read. A seek that
     * buffered_stream rejects is reported the standard way, as
     * pos_type(off_type(-1)). Exceptions raised by the chunk source are
     * not caught here.
     *
     * The buffered_stream must outlive the stream buffer.
     */
    class RSTREAM_EXPORT buffered_streambuf : public std::streambuf {
    public:
        explicit buffered_streambuf(buffered_stream& stream);

        buffered_streambuf(const buffered_streambuf&) = delete;
        buffered_streambuf& operator = (const buffered_streambuf&) = delete;

    protected:
        int_type underflow() override;
        std::streamsize xsgetn(char_type* s, std::streamsize count) override;
        std::streamsize showmanyc() override;
        int_type pbackfail(int_type c) override;

        pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                         std::ios_base::openmode which) override;
        pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

    private:
        buffered_stream& m_stream;
        char m_buffer;
    };

    /**
     * @class buffered_istream
     * @brief std::istream reading from a buffered_stream
     */
    class RSTREAM_EXPORT buffered_istream : public std::istream {
    public:
        explicit buffered_istream(buffered_stream& stream);

    private:
        buffered_streambuf m_buf;
    };

} // namespace rstream
