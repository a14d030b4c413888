#pragma once

#include <vouch/schema/encoding/scale/encoder.hpp>
#include <vouch/storage/rocksdb/storage.hpp>

namespace vouch::escrow {

using encoder_t = vouch::schema::encoding::encoder<
    vouch::schema::encoding::scale_encoder_tag>;
using storage_t =
    vouch::storage::storage<vouch::storage::rocksdb_storage_tag>;
using transaction_scope_t =
    vouch::storage::transaction_scope<vouch::storage::rocksdb_storage_tag>;

}  // namespace vouch::escrow
