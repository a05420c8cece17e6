//
// Created by igor on 02/09/2025.
//

#pragma once

#include <rstream/chunk_source.hh>
#include <iosfwd>

namespace rstream {

    class istream_source : public chunk_source {
    public:
        istream_source(std::istream& stream, std::size_t chunk_size);

        pull_result next() override;

    private:
        std::istream& m_stream;    // Not owned
        std::size_t m_chunk_size;
        bool m_done;
    };

} // namespace rstream
