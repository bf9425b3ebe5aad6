#pragma once

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <string_view>
#include <unistd.h>

namespace kiln::testing {

namespace fs = std::filesystem;

/// Fresh directory under the system temp dir, removed on teardown.
class TempDirTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() /
               (std::string("kiln_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(::getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path write(std::string_view rel, std::string_view content) const {
        auto path = root / rel;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::string read(std::string_view rel) const {
        std::ifstream in(root / rel, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    bool exists(std::string_view rel) const {
        return fs::exists(root / rel);
    }
};

} // namespace kiln::testing
