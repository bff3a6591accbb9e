#pragma once

#include <filesystem>
#include <string_view>
#include <utility>

namespace anvil {

    // Uniquely named file that exists exactly as long as its owner.
    class scratch_file {
      public:
        // Creates `<dir>/<prefix>XXXXXX<suffix>` holding `content`. Throws std::system_error.
        static scratch_file create(
                const std::filesystem::path& dir,
                std::string_view prefix,
                std::string_view suffix,
                std::string_view content);

        scratch_file(scratch_file&& other) noexcept;
        scratch_file& operator=(scratch_file&& other) noexcept;
        scratch_file(const scratch_file&) = delete;
        scratch_file& operator=(const scratch_file&) = delete;
        ~scratch_file();

        const std::filesystem::path& path() const { return _path; }

      private:
        explicit scratch_file(std::filesystem::path path) : _path{std::move(path)} {}
        void remove() noexcept;

        std::filesystem::path _path{};
    };

    // Uniquely named directory removed recursively with its owner.
    class scratch_dir {
      public:
        static scratch_dir create(const std::filesystem::path& parent, std::string_view prefix);

        scratch_dir(scratch_dir&& other) noexcept;
        scratch_dir& operator=(scratch_dir&& other) noexcept;
        scratch_dir(const scratch_dir&) = delete;
        scratch_dir& operator=(const scratch_dir&) = delete;
        ~scratch_dir();

        const std::filesystem::path& path() const { return _path; }

      private:
        explicit scratch_dir(std::filesystem::path path) : _path{std::move(path)} {}
        void remove() noexcept;

        std::filesystem::path _path{};
    };

}  // namespace anvil
