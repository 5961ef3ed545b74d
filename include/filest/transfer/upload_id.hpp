#pragma once

#include <string>

namespace filest::transfer {

/**
 * @brief Fresh random (version 4) UUID in canonical text form
 *
 * Used for chunked session ids, scratch directory names and the names of
 * temporary upload files, so two uploads never share a path.
 */
std::string generate_upload_id();

/**
 * @brief True when @p text is an id in the exact form generate_upload_id() produces
 */
bool is_upload_id(const std::string& text);

} // namespace filest::transfer
