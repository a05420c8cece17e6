//
// Created by igor on 02/09/2025.
//

#include "istream_source.hh"
#include <rstream/exceptions.hh>
#include <istream>

namespace rstream {

    istream_source::istream_source(std::istream& stream, std::size_t chunk_size)
        : m_stream(stream)
        , m_chunk_size(chunk_size)
        , m_done(false) {
        THROW_ARG_IF(chunk_size == 0, "Chunk size must be positive");
    }

    pull_result istream_source::next() {
        if (m_done) {
            return std::nullopt;
        }

        THROW_SOURCE_IF(m_stream.bad(), "Stream in bad state");
        if (m_stream.eof()) {
            m_done = true;
            return std::nullopt;
        }
        THROW_SOURCE_IF(m_stream.fail(), "Stream in failed state");

        chunk data(m_chunk_size);
        m_stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(m_chunk_size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_SOURCE_IF(m_stream.bad(), "Stream read failed after ", bytes_read, " bytes");

        if (bytes_read == 0) {
            m_done = true;
            return std::nullopt;
        }

        data.resize(bytes_read);
        return data;
    }

} // namespace rstream
