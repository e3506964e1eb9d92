// Expected.hpp
// -----------------------------------------------------------------------------
// Result type shared by the pipeline. Every stage returns
// expected<Output, StageError> with its error struct from Errors.hpp, so the
// job compiler can fold any failure into a core::JobError.

#pragma once

#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace ogcode {

template <typename T, typename E>
using expected = tl::expected<T, E>;

/// Wraps a stage error for return from a function yielding expected<T, E>.
template <typename E>
[[nodiscard]] constexpr tl::unexpected<std::decay_t<E>> unexpected(E&& error) {
    return tl::unexpected<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace ogcode
