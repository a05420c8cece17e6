//
// Created by igor on 02/09/2025.
//

#pragma once

#include <rstream/chunk_source.hh>
#include <vector>

namespace rstream {

    class sequence_source : public chunk_source {
    public:
        explicit sequence_source(std::vector<chunk> chunks);

        pull_result next() override;

    private:
        std::vector<chunk> m_chunks;
        std::size_t m_index;  // Next chunk to hand out
    };

} // namespace rstream
