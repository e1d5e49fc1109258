/**
 * Segue Engine - Content Hash
 */

#ifndef SEGUE_CONTENT_HASH_H
#define SEGUE_CONTENT_HASH_H

#include "segue/types.h"
#include <string>
#include <cstddef>

namespace segue {

/**
 * SHA-256 of the first `prefix_bytes` of a file, as lowercase hex.
 * Identical files hash identically regardless of their path, which lets the
 * cache recognize moved or renamed tracks without reading them in full.
 */
Result<std::string> hash_file_prefix(const std::string& path, size_t prefix_bytes = 65536);

} // namespace segue

#endif // SEGUE_CONTENT_HASH_H
