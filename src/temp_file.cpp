#include "bragi/temp_file.h"
#include "bragi/errors.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>
#include <stdlib.h>
#include <unistd.h>

namespace bragi {

ScopedTempFile::ScopedTempFile(const std::string& suffix) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }

    std::string pattern = (dir / "bragi-XXXXXX").string() + suffix;
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw ResourceError(std::string("Cannot create temporary file: ") + std::strerror(errno));
    }
    ::close(fd);

    path_ = buffer.data();
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

void ScopedTempFile::write(const std::string& content) const {
    std::ofstream file(path_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw ResourceError("Cannot open temporary file: " + path_);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw ResourceError("Cannot write temporary file: " + path_);
    }
}

} // namespace bragi
