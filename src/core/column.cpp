#include <strata/core/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only; the explicit instantiations below cover every
// element type a batch can hold so user code does not re-instantiate them.

namespace strata {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;

}  // namespace strata
