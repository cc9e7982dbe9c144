/**
 * @file test_transient_files.cpp
 * @brief Temporary files used during synthesis are always released
 */

#include <bragi/errors.h>
#include <bragi/synthesis_backend.h>
#include <bragi/temp_file.h>
#include "test_common.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace bragi;

static void test_scoped_file_lifetime() {
    bragi_test::section("scoped temp file lives exactly as long as its scope");

    std::string path;
    {
        ScopedTempFile file(".wav");
        path = file.path();
        CHECK(fs::exists(path));
        CHECK(fs::path(path).extension() == ".wav");
        CHECK(fs::path(path).filename().string().compare(0, 6, "bragi-") == 0);

        ScopedTempFile other(".wav");
        CHECK(other.path() != path);
    }
    CHECK(!path.empty() && !fs::exists(path));
}

static void test_scoped_file_released_on_exception() {
    bragi_test::section("scoped temp file is removed when its scope throws");

    std::string path;
    try {
        ScopedTempFile file(".txt");
        path = file.path();
        file.write("half written");
        CHECK(fs::file_size(path) == 12);
        throw std::runtime_error("synthesis aborted");
    } catch (const std::runtime_error&) {
    }
    CHECK(!path.empty() && !fs::exists(path));
}

static void test_failed_command_leaves_no_files() {
    bragi_test::section("a failing voice command leaves no temporary files");

    fs::path dir = fs::temp_directory_path() / "bragi_test_transient";
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path seen = dir / "paths.txt";

    // Records the substituted paths, then fails like a missing voice would
    std::string selector = "command:printf '%s\\n' {text_file} {output} > '" +
                           seen.string() + "'; false";
    SynthesisBackend backend(parse_voice_selector(selector));

    SynthesisResult result = backend.synthesize("x", "en");
    CHECK(!result.ok);
    CHECK(result.error.find("exited with status") != std::string::npos);

    std::vector<std::string> paths;
    std::ifstream log(seen);
    std::string line;
    while (std::getline(log, line)) {
        if (!line.empty()) {
            paths.push_back(line);
        }
    }

    CHECK(paths.size() == 2);
    for (const auto& path : paths) {
        CHECK(fs::path(path).filename().string().compare(0, 6, "bragi-") == 0);
        CHECK(!fs::exists(path));
    }

    SynthesisBackend missing(parse_voice_selector("command:false"));
    SynthesisResult failed = missing.synthesize("x", "en");
    CHECK(!failed.ok);
    CHECK(!failed.error.empty());

    fs::remove_all(dir);
}

int main() {
    test_scoped_file_lifetime();
    test_scoped_file_released_on_exception();
    test_failed_command_leaves_no_files();
    return bragi_test::finish("test_transient_files");
}
