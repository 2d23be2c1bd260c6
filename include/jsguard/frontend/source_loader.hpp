#ifndef JSGUARD_FRONTEND_SOURCE_LOADER_HPP
#define JSGUARD_FRONTEND_SOURCE_LOADER_HPP

#include <string>

namespace jsguard::frontend {

// Reads the whole file verbatim, line terminators included.
bool LoadSourceText(
    const std::string& file_path,
    std::string* out_text,
    std::string* out_error);

}  // namespace jsguard::frontend

#endif  // JSGUARD_FRONTEND_SOURCE_LOADER_HPP
