#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <string_view>
#include <vector>
#include "../include/options.hpp"
#include "../../create/include/torrent_creator.hpp"


namespace maketorrent::cli {

    namespace {

        enum class Opt { announce, comment, pieceLength, name, output, isPrivate, threads,
                         force, json, verbose, debug, help, version };

        struct OptSpec
        {
            char shortName;
            const char* longName;
            Opt id;
            bool takesValue;
        };

        constexpr OptSpec kOptions[] = {
            {'a', "announce",     Opt::announce,    true},
            {'c', "comment",      Opt::comment,     true},
            {'l', "piece-length", Opt::pieceLength, true},
            {'n', "name",         Opt::name,        true},
            {'o', "output",       Opt::output,      true},
            {'p', "private",      Opt::isPrivate,   false},
            {'t', "threads",      Opt::threads,     true},
            {'f', "force",        Opt::force,       false},
            {'j', "json",         Opt::json,        false},
            {'v', "verbose",      Opt::verbose,     false},
            {'d', "debug",        Opt::debug,       false},
            {'h', "help",         Opt::help,        false},
            {'V', "version",      Opt::version,     false},
        };

        const OptSpec* findShort(char c) {
            for (const auto& o : kOptions) if (o.shortName == c) return &o;
            return nullptr;
        }

        const OptSpec* findLong(std::string_view name) {
            for (const auto& o : kOptions) if (name == o.longName) return &o;
            return nullptr;
        }

        bool parseUnsigned(std::string_view s, unsigned& out) {
            if (s.empty()) return false;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc{} && ptr == s.data() + s.size();
        }

        // "-a a,b -a c" -> {a, b, c}; empty items are dropped
        void splitUrls(std::string_view value, std::vector<std::string>& out) {
            std::size_t start = 0;
            while (start <= value.size()) {
                auto comma = value.find(',', start);
                if (comma == std::string_view::npos) comma = value.size();
                auto item = value.substr(start, comma - start);
                if (!item.empty()) out.emplace_back(item);
                start = comma + 1;
            }
        }

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string trim(const std::string& s) {
            auto b = s.find_first_not_of(" \t\r\n");
            if (b == std::string::npos) return {};
            auto e = s.find_last_not_of(" \t\r\n");
            return s.substr(b, e - b + 1);
        }

        // Stores one option into opts; returns an error message for a bad value.
        std::optional<std::string> applyOption(const OptSpec& spec, std::string_view value,
                                               CliOptions& opts, unsigned& exponent) {
            switch (spec.id) {
                case Opt::announce:    splitUrls(value, opts.create.announce); break;
                case Opt::comment:     opts.create.comment = std::string(value); break;
                case Opt::name:        opts.create.name = std::string(value); break;
                case Opt::output:      opts.output = std::string(value); break;
                case Opt::isPrivate:   opts.create.isPrivate = true; break;
                case Opt::force:       opts.force = true; break;
                case Opt::json:        opts.json = true; break;
                case Opt::help:        opts.showHelp = true; break;
                case Opt::version:     opts.showVersion = true; break;
                case Opt::verbose:
                    if (opts.logLevel > logger::LogLevel::info) opts.logLevel = logger::LogLevel::info;
                    break;
                case Opt::debug:
                    opts.logLevel = logger::LogLevel::debug;
                    break;
                case Opt::pieceLength:
                    if (!parseUnsigned(value, exponent)) {
                        return "invalid piece length '" + std::string(value) + "'";
                    }
                    break;
                case Opt::threads:
                    if (!parseUnsigned(value, opts.create.workers) || opts.create.workers == 0) {
                        return "invalid thread count '" + std::string(value) + "'";
                    }
                    break;
            }
            return std::nullopt;
        }

    } // anonymous namespace


    Expected<CliOptions> parseArgs(int argc, const char* const* argv) {
        using Result = Expected<CliOptions>;

        CliOptions opts;
        std::vector<std::string> positional;
        unsigned exponent = 18;
        bool onlyPositional = false;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (onlyPositional || arg.size() < 2 || arg[0] != '-') {
                positional.emplace_back(arg);
                continue;
            }
            if (arg == "--") {
                onlyPositional = true;
                continue;
            }

            if (arg.substr(0, 2) == "--") {
                auto body = arg.substr(2);
                std::optional<std::string_view> inlineValue;
                auto eq = body.find('=');
                if (eq != std::string_view::npos) {
                    inlineValue = body.substr(eq + 1);
                    body = body.substr(0, eq);
                }
                const OptSpec* spec = findLong(body);
                if (!spec) return Result::failure("unknown option '--" + std::string(body) + "'");

                std::string_view value;
                if (spec->takesValue) {
                    if (inlineValue) {
                        value = *inlineValue;
                    } else if (i + 1 < argc) {
                        value = argv[++i];
                    } else {
                        return Result::failure(std::string("option '--") + spec->longName + "' needs a value");
                    }
                } else if (inlineValue) {
                    return Result::failure(std::string("option '--") + spec->longName + "' takes no value");
                }

                if (auto err = applyOption(*spec, value, opts, exponent)) return Result::failure(*err);
                continue;
            }

            // Short options cluster: "-pv", "-l20", "-pa <url>". A value option takes the rest.
            for (std::size_t j = 1; j < arg.size(); ++j) {
                const OptSpec* spec = findShort(arg[j]);
                if (!spec) return Result::failure("unknown option '-" + std::string(1, arg[j]) + "'");

                if (!spec->takesValue) {
                    if (auto err = applyOption(*spec, {}, opts, exponent)) return Result::failure(*err);
                    continue;
                }

                std::string_view value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < argc) {
                    value = argv[++i];
                } else {
                    return Result::failure("option '-" + std::string(1, arg[j]) + "' needs a value");
                }
                if (auto err = applyOption(*spec, value, opts, exponent)) return Result::failure(*err);
                break;
            }
        }

        if (opts.showVersion || opts.showHelp) {
            return Result::success(std::move(opts));
        }
        if (positional.empty()) {
            opts.showHelp = true;
            return Result::success(std::move(opts));
        }
        if (positional.size() > 1) {
            return Result::failure("only one target file or directory can be given");
        }
        opts.create.target = positional.front();

        if (opts.create.announce.empty()) {
            return Result::failure("You need to specify at least one announce URL!");
        }

        const auto& range = opts.create.pieceLengthRange;
        if (exponent < range.minExponent || exponent > range.maxExponent) {
            return Result::failure("The piece length must be between 16 (64 KB) and 25 (32 MB)");
        }
        opts.create.pieceLength = 1u << exponent;

        auto ok = create::checkOptions(opts.create);
        if (!ok.has_value()) {
            return Result::failure(ok.error->message);
        }

        if (opts.output.empty()) {
            const auto name = opts.create.name.empty() ? create::defaultName(opts.create.target) : opts.create.name;
            opts.output = name + ".torrent";
        }

        return Result::success(std::move(opts));
    }


    std::string usage() {
        std::ostringstream os;
        os << "Usage: maketorrent [options] <target directory or filename>\n"
           << "\n"
           << "  -a, --announce <url>[,<url>...]  announce URLs, at least one must be specified\n"
           << "  -c, --comment <text>             add a comment to the torrent file\n"
           << "  -l, --piece-length <n>           set the piece length to 2^n bytes (16..25, default 18 = 256 KB)\n"
           << "  -n, --name <name>                name of the torrent, default is the basename of the target\n"
           << "  -o, --output <file>              path of the torrent file, default is <name>.torrent\n"
           << "  -p, --private                    set the private flag\n"
           << "  -t, --threads <n>                hashing threads, default is the number of CPUs\n"
           << "  -f, --force                      overwrite the output file without asking\n"
           << "  -j, --json                       print a JSON summary of the torrent on stdout\n"
           << "  -v, --verbose                    be verbose\n"
           << "  -d, --debug                      debug output\n"
           << "  -h, --help                       show this help message and exit\n"
           << "  -V, --version                    print version and quit\n";
        return os.str();
    }


    bool askForConfirmation(std::istream& in, std::ostream& out, const std::string& question) {
        std::string line;
        for (;;) {
            out << question << " [y/n]: " << std::flush;
            if (!std::getline(in, line)) {
                out << "\n";
                return false;
            }

            const auto answer = lower(trim(line));
            if (answer == "y" || answer == "yes") return true;
            if (answer == "n" || answer == "no") return false;
        }
    }

} // namespace maketorrent::cli
