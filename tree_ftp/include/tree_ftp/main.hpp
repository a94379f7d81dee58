#pragma once

#include <ftp/ftp_error.hpp>
#include <persistence/client_options.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

class Main
{
  public:
    Main(int const argc, char const* const* argv);
    ~Main() = default;

    Main(Main const&) = delete;
    Main& operator=(Main const&) = delete;
    Main(Main&&) = delete;
    Main& operator=(Main&&) = delete;

    /**
     * @brief Runs the whole program.
     *
     * @return int The process exit code.
     */
    int run();

  private:
    void setupLogging(Persistence::ClientOptions const& options) const;
    std::expected<void, Ftp::Error> scan(Persistence::ClientOptions const& options);

  private:
    std::string programName_;
    std::vector<std::string_view> arguments_;
};
