#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "../maketorrent/cli/include/options.hpp"
#include "../maketorrent/create/include/torrent_creator.hpp"
#include "../maketorrent/create/include/torrent_writer.hpp"

using namespace maketorrent;


int main(int argc, char* argv[]) {
    auto log = std::make_shared<logger::Logger>(std::make_shared<logger::StreamSink>(std::cerr));
    log->setLevel(logger::LogLevel::warn);

    auto parsed = cli::parseArgs(argc, argv);
    if (!parsed.has_value()) {
        log->error(parsed.error->message, "maketorrent");
        std::cerr << "Try 'maketorrent --help' for more information.\n";
        return 1;
    }
    const auto& opts = parsed.get();

    if (opts.showVersion) {
        std::cout << "maketorrent " << create::kVersion << "\n";
        return 0;
    }
    if (opts.showHelp) {
        std::cout << cli::usage();
        return 0;
    }

    log->setLevel(opts.logLevel);

    try {
        std::error_code ec;
        if (std::filesystem::exists(opts.output, ec) && !opts.force) {
            // prompt on stderr so --json output stays clean
            if (!cli::askForConfirmation(std::cin, std::cerr, "output file " + opts.output.string() + " already exists. Overwrite?")) {
                return 1;
            }
        }

        create::TorrentCreator creator(opts.create, log);
        creator.setProgressCallback([log](uint64_t done, uint64_t total) {
            if (!log->enabled(logger::LogLevel::info)) return;
            logger::LogRecord rec;
            rec.level = logger::LogLevel::info;
            rec.logger = "maketorrent";
            rec.msg = "hashed " + std::to_string(done) + " of " + std::to_string(total) + " pieces";
            log->log(std::move(rec));
        });

        const auto mi = creator.create();
        create::writeTorrentFile(opts.output, mi.encode());

        logger::LogRecord rec;
        rec.level = logger::LogLevel::info;
        rec.logger = "maketorrent";
        rec.msg = "wrote torrent " + mi.infoHashHex();
        rec.path = opts.output.string();
        log->log(std::move(rec));

        if (opts.json) {
            std::cout << mi.toJson().dump(2) << std::endl;
        }
    } catch (const std::exception& e) {
        log->error(e.what(), "maketorrent");
        return 1;
    }

    return 0;
}
