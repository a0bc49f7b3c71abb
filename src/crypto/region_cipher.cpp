/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Region cipher implementation
 */

#include "region_cipher.h"
#include <cstring>

namespace xcp360 {

RegionCipher::RegionCipher(const std::vector<u8>& master_key, const KeyRecord& record) {
    u8 session_key[Sha1::HASH_SIZE];
    hmac_sha1(master_key.data(), master_key.size(),
              record.checksum, sizeof(record.checksum), session_key);
    rc4_.set_key(session_key, sizeof(session_key));

    u8 confounder[sizeof(record.confounder)];
    memcpy(confounder, record.confounder, sizeof(confounder));
    rc4_.process(confounder, sizeof(confounder));
}

void RegionCipher::apply(u8* data, usize size) {
    rc4_.process(data, size);
    position_ += size;
}

} // namespace xcp360
