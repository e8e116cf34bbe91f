#pragma once

#include <runbox/common/class_traits.hpp>
#include <runbox/common/linux.hpp>

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <system_error>

/// A private scratch root per test, so that leftover-workspace checks are not disturbed by other tests
class ScratchDir : runbox::NonCopyable
{
public:
    ScratchDir()
        : path_{make()} {}

    ~ScratchDir() {
        std::error_code err;
        std::filesystem::remove_all(path_, err);
    }

    ScratchDir(ScratchDir&&) = delete;
    ScratchDir& operator=(ScratchDir&&) = delete;

    const std::filesystem::path& get_path() const { return path_; }

    std::size_t count_entries() const {
        return static_cast<std::size_t>(
            std::distance(std::filesystem::directory_iterator{path_}, std::filesystem::directory_iterator{}));
    }

private:
    static std::filesystem::path make() {
        auto res = runbox::linux::mkdtemp((std::filesystem::temp_directory_path() / "runbox-test-XXXXXX").string());

        if (!res) {
            throw std::runtime_error("could not create a test scratch directory: " + res.error().message());
        }

        return *res;
    }

    std::filesystem::path path_;
};
