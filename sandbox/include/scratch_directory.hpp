#pragma once

#include <string>

namespace sandbox {

    // Private temporary directory (mode 0700) removed with its contents when
    // the object goes out of scope.
    class ScratchDirectory {
    public:
        // Empty root = the system temp directory. Throws ExecutionException.
        explicit ScratchDirectory(const std::string& root = "");
        ~ScratchDirectory();

        ScratchDirectory(const ScratchDirectory&) = delete;
        ScratchDirectory& operator=(const ScratchDirectory&) = delete;

        const std::string& path() const { return path_; }

        // Writes `content` to a plain file name inside the directory and returns its full path
        std::string writeFile(const std::string& file_name, const std::string& content) const;

    private:
        std::string path_;
    };

} // namespace sandbox
