#include <persistence/tree_export.hpp>
#include <log/log.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>

namespace Persistence
{
    namespace
    {
        constexpr int exportIndent = 4;
    }

    std::expected<void, ExportWriteError>
    writeTreeToJson(SharedData::TreeNode const& tree, std::filesystem::path const& path)
    {
        std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
        {
            return std::unexpected(ExportWriteError{
                .path = path.string(),
                .message = std::strerror(errno),
            });
        }

        try
        {
            // Names come from the server as raw bytes, invalid UTF-8 is replaced instead of failing the dump.
            writer << nlohmann::ordered_json(tree).dump(
                exportIndent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }
        catch (nlohmann::json::exception const& e)
        {
            return std::unexpected(ExportWriteError{
                .path = path.string(),
                .message = e.what(),
            });
        }
        writer.flush();
        if (!writer.good())
        {
            return std::unexpected(ExportWriteError{
                .path = path.string(),
                .message = "Writing the tree failed",
            });
        }

        Log::info("Directory tree with {} nodes exported to {}", tree.size(), path.string());
        return {};
    }
}
