//
// Created by igor on 02/09/2025.
//

#include "callable_source.hh"
#include <rstream/exceptions.hh>

namespace rstream {

    callable_source::callable_source(generator fn)
        : m_fn(std::move(fn))
        , m_done(false) {
        THROW_ARG_UNLESS(m_fn, "Empty generator passed to chunk_source::from_callable");
    }

    pull_result callable_source::next() {
        if (m_done) {
            return std::nullopt;
        }

        pull_result result = m_fn();
        if (!result) {
            m_done = true;
            // Release whatever the callable captured
            m_fn = nullptr;
        }
        return result;
    }

} // namespace rstream
