#pragma once

#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

namespace chansource_test {

namespace fs = std::filesystem;

/// Bytes from a list of integer values (0-255)
inline std::vector<std::byte> bytes_of(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (int v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

/// Bytes of a narrow string, taken verbatim (so u8 literals give UTF-8)
inline std::vector<std::byte> bytes_of(std::string_view text) {
    std::vector<std::byte> out(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(static_cast<unsigned char>(text[i]));
    }
    return out;
}

/// File name unique to the running test and process
inline std::string unique_file_name(std::string_view suffix = "") {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "chansource_";
    if (info != nullptr) {
        name += info->test_suite_name();
        name += "_";
        name += info->name();
    }
    name += "_" + std::to_string(::getpid());
    name += suffix;
    for (char& c : name) {
        if (c == '/' || c == '<' || c == '>' || c == ' ' || c == ',') {
            c = '_';
        }
    }
    return name + ".bin";
}

/// Create a file in the temp directory with the given content
inline fs::path create_test_file(const std::string& filename, const std::vector<std::byte>& content) {
    fs::path test_file = fs::temp_directory_path() / filename;

    std::ofstream file(test_file, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(content.data()),
               static_cast<std::streamsize>(content.size()));
    file.close();

    return test_file;
}

/// Temp files removed when the owner goes out of scope
class TempFiles {
public:
    TempFiles() = default;
    TempFiles(const TempFiles&) = delete;
    TempFiles& operator=(const TempFiles&) = delete;

    ~TempFiles() {
        for (const auto& path : paths_) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }

    fs::path create(const std::vector<std::byte>& content) {
        fs::path path = create_test_file(unique_file_name("_" + std::to_string(paths_.size())), content);
        paths_.push_back(path);
        return path;
    }

    void track(const fs::path& path) {
        paths_.push_back(path);
    }

private:
    std::vector<fs::path> paths_;
};

} // namespace chansource_test
