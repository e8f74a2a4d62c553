#include "scratch_directory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>
#include <stdlib.h>

namespace sandbox {

    namespace fs = std::filesystem;

    ScratchDirectory::ScratchDirectory(const std::string& root) {
        std::error_code ec;
        fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
        if (ec) {
            throw core::ExecutionException("No temporary directory available: " + ec.message());
        }
        fs::create_directories(base, ec);
        if (ec) {
            throw core::ExecutionException("Cannot create scratch root " + base.string() + ": " + ec.message());
        }

        std::string pattern = (base / "bp-sandbox-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw core::ExecutionException("mkdtemp failed for " + pattern + ": " + std::strerror(errno));
        }
        path_ = buffer.data();
        core::logging::getLogger()->debug("Created scratch directory {}", path_);
    }

    ScratchDirectory::~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            core::logging::getLogger()->warn("Failed to remove scratch directory {}: {}", path_, ec.message());
        } else {
            core::logging::getLogger()->debug("Removed scratch directory {}", path_);
        }
    }

    std::string ScratchDirectory::writeFile(const std::string& file_name, const std::string& content) const {
        if (file_name.empty() || file_name.find('/') != std::string::npos || file_name == "." || file_name == "..") {
            throw core::ExecutionException("Scratch file name must be a plain name: '" + file_name + "'");
        }
        std::string full_path = (fs::path(path_) / file_name).string();
        std::ofstream out(full_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw core::ExecutionException("Cannot open scratch file " + full_path);
        }
        out << content;
        out.close();
        if (!out) {
            throw core::ExecutionException("Failed writing scratch file " + full_path);
        }
        return full_path;
    }

} // namespace sandbox
