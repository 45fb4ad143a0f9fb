#pragma once
#include <filesystem>
#include <iosfwd>
#include <string>
#include "../../create/include/expected.hpp"
#include "../../create/include/types.hpp"
#include "../../logger/logger.hpp"


namespace maketorrent::cli {


    struct CliOptions
    {
        create::CreateOptions create;
        std::filesystem::path output;       // resolved to <name>.torrent when not given
        bool force{false};
        bool json{false};
        bool showHelp{false};
        bool showVersion{false};
        logger::LogLevel logLevel{logger::LogLevel::warn};
    };


    // Never throws for bad input: every problem is reported through the failure message.
    Expected<CliOptions> parseArgs(int argc, const char* const* argv);

    std::string usage();

    // Asks until the answer is y/yes/n/no (any case). End of input counts as "no".
    bool askForConfirmation(std::istream& in, std::ostream& out, const std::string& question);


} // namespace maketorrent::cli
