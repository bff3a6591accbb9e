#include "anvil/scratch.hpp"

#include "anvil/format.hpp"
#include "anvil/log.hpp"

extern "C" {
#include <stdlib.h>
#include <unistd.h>
}

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace anvil::literals;
namespace fs = std::filesystem;

namespace anvil {

    namespace detail {

        static std::vector<char> make_template(const fs::path& dir, std::string_view prefix, std::string_view suffix) {
            auto pattern = (dir / "{}XXXXXX{}"_format(prefix, suffix)).string();
            std::vector<char> buf(pattern.begin(), pattern.end());
            buf.push_back('\0');
            return buf;
        }

        static void write_all(int fd, std::string_view content, const std::string& path) {
            while (!content.empty()) {
                auto n = ::write(fd, content.data(), content.size());
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw std::system_error(errno, std::generic_category(), "failed to write {}"_format(path));
                }
                content.remove_prefix(static_cast<size_t>(n));
            }
        }

    }  // namespace detail

    scratch_file scratch_file::create(
            const fs::path& dir, std::string_view prefix, std::string_view suffix, std::string_view content) {
        auto buf = detail::make_template(dir, prefix, suffix);

        int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
        if (fd < 0) {
            throw std::system_error(
                    errno, std::generic_category(), "failed to create scratch file in {}"_format(dir.string()));
        }

        std::string path{buf.data()};
        // owned from here on, so a failed write still removes the file
        scratch_file file{fs::path{path}};

        try {
            detail::write_all(fd, content, path);
        } catch (...) {
            ::close(fd);
            throw;
        }
        if (::close(fd) != 0) {
            throw std::system_error(errno, std::generic_category(), "failed to close {}"_format(path));
        }

        debug_log("created scratch file ", path);
        return file;
    }

    scratch_file::scratch_file(scratch_file&& other) noexcept : _path{std::exchange(other._path, {})} {}

    scratch_file& scratch_file::operator=(scratch_file&& other) noexcept {
        if (this != &other) {
            remove();
            _path = std::exchange(other._path, {});
        }
        return *this;
    }

    scratch_file::~scratch_file() {
        remove();
    }

    void scratch_file::remove() noexcept {
        if (_path.empty()) {
            return;
        }
        std::error_code ec{};
        fs::remove(_path, ec);
        if (ec) {
            log::warn("failed to delete scratch file ", _path.string(), ": ", ec.message());
        }
        _path.clear();
    }

    scratch_dir scratch_dir::create(const fs::path& parent, std::string_view prefix) {
        auto buf = detail::make_template(parent, prefix, {});

        if (::mkdtemp(buf.data()) == nullptr) {
            throw std::system_error(
                    errno, std::generic_category(), "failed to create scratch directory in {}"_format(parent.string()));
        }

        return scratch_dir{fs::path{buf.data()}};
    }

    scratch_dir::scratch_dir(scratch_dir&& other) noexcept : _path{std::exchange(other._path, {})} {}

    scratch_dir& scratch_dir::operator=(scratch_dir&& other) noexcept {
        if (this != &other) {
            remove();
            _path = std::exchange(other._path, {});
        }
        return *this;
    }

    scratch_dir::~scratch_dir() {
        remove();
    }

    void scratch_dir::remove() noexcept {
        if (_path.empty()) {
            return;
        }
        std::error_code ec{};
        fs::remove_all(_path, ec);
        if (ec) {
            log::warn("failed to delete scratch directory ", _path.string(), ": ", ec.message());
        }
        _path.clear();
    }

}  // namespace anvil
