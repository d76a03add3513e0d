#include <tally/core/column.hpp>

#include <cstdint>

// Column<T> is header-only; the numeric element types of a movements table
// are instantiated once here.

namespace tally {

template class Column<std::int64_t>;
template class Column<double>;

}  // namespace tally
