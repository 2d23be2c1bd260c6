#include "jsguard/frontend/source_loader.hpp"

#include <fstream>
#include <iterator>

namespace jsguard::frontend {

bool LoadSourceText(
    const std::string& file_path,
    std::string* out_text,
    std::string* out_error) {
    if (out_text == nullptr || out_error == nullptr) {
        return false;
    }

    std::ifstream input(file_path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        *out_error = "Could not open file: " + file_path;
        return false;
    }

    out_text->assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());

    if (input.bad()) {
        *out_error = "Error reading file: " + file_path;
        return false;
    }

    return true;
}

}  // namespace jsguard::frontend
