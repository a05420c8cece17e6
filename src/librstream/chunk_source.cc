//
// Created by igor on 02/09/2025.
//

#include <rstream/chunk_source.hh>
#include "sequence_source.hh"
#include "istream_source.hh"
#include "callable_source.hh"

namespace rstream {

    std::unique_ptr<chunk_source> chunk_source::from_chunks(std::vector<chunk> chunks) {
        return std::make_unique<sequence_source>(std::move(chunks));
    }

    std::unique_ptr<chunk_source> chunk_source::from_stream(std::istream& stream, std::size_t chunk_size) {
        return std::make_unique<istream_source>(stream, chunk_size);
    }

    std::unique_ptr<chunk_source> chunk_source::from_callable(generator fn) {
        return std::make_unique<callable_source>(std::move(fn));
    }

} // namespace rstream
