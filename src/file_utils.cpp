#include "file_utils.h"
#include "bragi/errors.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace bragi {
namespace detail {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw ResourceError("Failed to open file: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ResourceError("Failed to read file: " + path);
    }
    return content;
}

std::string partial_path_for(const std::string& path) {
    return path + ".partial";
}

void commit_partial(const std::string& partial_path, const std::string& path) {
    std::error_code ec;
    std::filesystem::rename(partial_path, path, ec);
    if (ec) {
        std::filesystem::remove(partial_path, ec);
        throw ResourceError("Failed to move output into place: " + path);
    }
}

void write_file_atomic(const std::string& path, const std::string& content) {
    std::string partial = partial_path_for(path);

    {
        std::ofstream file(partial, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw ResourceError("Failed to create file: " + path);
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(partial, ec);
            throw ResourceError("Failed to write file: " + path);
        }
    }

    commit_partial(partial, path);
}

} // namespace detail
} // namespace bragi
