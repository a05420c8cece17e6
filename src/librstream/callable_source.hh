//
// Created by igor on 02/09/2025.
//

#pragma once

#include <rstream/chunk_source.hh>

namespace rstream {

    class callable_source : public chunk_source {
    public:
        explicit callable_source(generator fn);

        pull_result next() override;

    private:
        generator m_fn;
        bool m_done;
    };

} // namespace rstream
