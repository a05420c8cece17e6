//
// Created by igor on 02/09/2025.
//

#include "sequence_source.hh"

namespace rstream {

    sequence_source::sequence_source(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks))
        , m_index(0) {}

    pull_result sequence_source::next() {
        if (m_index >= m_chunks.size()) {
            return std::nullopt;
        }
        // Chunks are handed out once, so the storage can be moved from
        return std::move(m_chunks[m_index++]);
    }

} // namespace rstream
