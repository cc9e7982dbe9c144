#pragma once

#include "bragi/export.h"
#include <string>

namespace bragi {

/**
 * @brief Uniquely named file in the system temp directory, removed on destruction
 *
 * The file is created empty by the constructor so the name is reserved.
 */
class BRAGI_API ScopedTempFile {
public:
    /**
     * @param suffix File name suffix, e.g. ".wav"
     * @throws ResourceError if no file can be created
     */
    explicit ScopedTempFile(const std::string& suffix = "");
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& path() const { return path_; }

    /**
     * @brief Replace the file content
     * @throws ResourceError on write failure
     */
    void write(const std::string& content) const;

private:
    std::string path_;
};

} // namespace bragi
