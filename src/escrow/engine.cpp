#include <vouch/escrow/engine.hpp>

namespace vouch::escrow {

template class engine<vouch::schema::item_t>;

}  // namespace vouch::escrow
