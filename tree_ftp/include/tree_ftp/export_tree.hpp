#pragma once

#include <ftp/ftp_error.hpp>
#include <traversal/traversal_engine.hpp>

#include <expected>
#include <string>

namespace TreeFtp
{
    /**
     * @brief Builds the tree below "/" and writes it to exportPath as JSON.
     *
     * A failed listing fetch is returned. A file that cannot be written is only logged.
     */
    std::expected<void, Ftp::Error> exportTree(Traversal::TraversalEngine& engine, std::string const& exportPath);
}
