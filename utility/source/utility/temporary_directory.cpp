#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::string const& baseName)
        : m_basePath{std::filesystem::temp_directory_path() / baseName}
        , m_path{}
    {
        if (!std::filesystem::exists(m_basePath))
            std::filesystem::create_directories(m_basePath);

        std::string dirNameAsString{(m_basePath / "dirXXXXXX").string()};
        const bool valid = mkdtemp(dirNameAsString.data()) && std::filesystem::is_directory(dirNameAsString);
        if (!valid)
            throw std::runtime_error(std::string{"Could not setup temporary directory in: "} + m_basePath.string());

        m_path = dirNameAsString;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
        // fails while other instances still live in the base, which is fine
        std::filesystem::remove(m_basePath, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
