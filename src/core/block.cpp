#include <blockwise/core/block.hpp>
#include <blockwise/core/block_builder.hpp>
#include <blockwise/core/vector.hpp>

#include <cstdint>
#include <string>

// Vector<T>, Block<T> and BlockBuilder<T> are header-only templates.
// Instantiating every element type here keeps each specialization compiling
// and shortens dependent builds.

namespace blockwise {

template class Vector<bool>;
template class Vector<std::int32_t>;
template class Vector<std::int64_t>;
template class Vector<double>;
template class Vector<std::string>;

template class Block<bool>;
template class Block<std::int32_t>;
template class Block<std::int64_t>;
template class Block<double>;
template class Block<std::string>;

template class BlockBuilder<bool>;
template class BlockBuilder<std::int32_t>;
template class BlockBuilder<std::int64_t>;
template class BlockBuilder<double>;
template class BlockBuilder<std::string>;

}  // namespace blockwise
