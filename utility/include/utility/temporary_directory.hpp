#pragma once

#include <filesystem>
#include <string>

namespace Utility
{
    /**
     * @brief Creates a fresh directory below the system temp directory and removes it with all contents on
     * destruction.
     */
    class TemporaryDirectory
    {
      public:
        explicit TemporaryDirectory(std::string const& baseName = "tree_ftp_tmpdir");
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path m_basePath;
        std::filesystem::path m_path;
    };
}
