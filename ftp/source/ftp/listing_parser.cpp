#include <ftp/listing_parser.hpp>

#include <utility/algorithm/trim.hpp>

namespace Ftp
{
    bool isDirectory(std::string_view line)
    {
        return !line.empty() && line.front() == 'd';
    }

    std::string extractName(std::string_view line)
    {
        const auto trimmed = Utility::Algorithm::trim(line);

        std::size_t start = trimmed.size();
        while (start > 0 && !Utility::Algorithm::isSpace(trimmed[start - 1]))
            --start;

        return std::string{trimmed.substr(start)};
    }

    SharedData::DirectoryEntry parseListingLine(std::string_view line)
    {
        return SharedData::DirectoryEntry{
            .name = extractName(line),
            .type = isDirectory(line) ? SharedData::FileType::Directory : SharedData::FileType::Regular,
        };
    }

    std::vector<std::string> splitLines(std::string_view listing)
    {
        std::vector<std::string> lines{};

        std::size_t begin = 0;
        while (begin <= listing.size())
        {
            auto end = listing.find('\n', begin);
            if (end == std::string_view::npos)
                end = listing.size();

            auto line = listing.substr(begin, end - begin);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            lines.emplace_back(line);

            begin = end + 1;
        }

        while (!lines.empty() && lines.back().empty())
            lines.pop_back();

        return lines;
    }
}
