#pragma once

#include <string>

namespace bragi {
namespace detail {

/**
 * @brief Read a whole file as bytes
 * @throws ResourceError if the file cannot be opened or read
 */
std::string read_file(const std::string& path);

/**
 * @brief Write content to a temporary sibling, then rename it over path
 *
 * The destination either keeps its previous content or receives the full new
 * content; a half-written destination is never left behind.
 *
 * @throws ResourceError on any I/O failure
 */
void write_file_atomic(const std::string& path, const std::string& content);

/**
 * @brief Temporary sibling path used while a destination is being produced
 */
std::string partial_path_for(const std::string& path);

/**
 * @brief Move a finished temporary file over its destination
 * @throws ResourceError if the rename fails (the temporary is removed)
 */
void commit_partial(const std::string& partial_path, const std::string& path);

} // namespace detail
} // namespace bragi
