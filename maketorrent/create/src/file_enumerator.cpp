#include <algorithm>
#include <set>
#include "../include/file_enumerator.hpp"


namespace maketorrent::create {

    namespace fs = std::filesystem;

    namespace {

        constexpr const char* kLogger = "FileEnumerator";

        InputError fsError(const std::string& what, const fs::path& p, const std::error_code& ec) {
            return InputError(what + " '" + p.string() + "': " + ec.message());
        }

        // One info line per listed file, carrying its relative path and size.
        void logAdded(const logger::LoggerPtr& log, const fs::path& rel, uint64_t len) {
            if (!log) return;
            logger::LogRecord rec;
            rec.level = logger::LogLevel::info;
            rec.logger = kLogger;
            rec.msg = "adding " + rel.generic_string();
            rec.path = rel.generic_string();
            rec.bytes = static_cast<int64_t>(len);
            log->log(std::move(rec));
        }

        uint64_t fileSize(const fs::path& p) {
            std::error_code ec;
            auto size = fs::file_size(p, ec);
            if (ec) throw fsError("cannot stat", p, ec);
            return size;
        }

        class Walker
        {
        public:
            Walker(std::vector<metainfo::FileEntry>& out, const logger::LoggerPtr& log) : out_(out), log_(log) {}

            void walk(const fs::path& dir, const fs::path& rel) {
                std::error_code ec;
                auto canonical = fs::canonical(dir, ec);
                if (ec) throw fsError("cannot resolve", dir, ec);
                if (!active_.insert(canonical).second) {
                    throw InputError("directory cycle through symlink at '" + dir.string() + "'");
                }

                for (const auto& name : listSorted(dir)) {
                    const auto full = dir / name;
                    const auto st = fs::status(full, ec);   // follows symlinks
                    if (ec) throw fsError("cannot stat", full, ec);
                    if (!fs::exists(st)) throw InputError("dangling entry '" + full.string() + "'");

                    if (fs::is_directory(st)) {
                        walk(full, rel / name);
                    } else if (fs::is_regular_file(st)) {
                        const auto len = fileSize(full);
                        out_.push_back(metainfo::FileEntry{rel / name, len, 0});
                        logAdded(log_, rel / name, len);
                    } else {
                        MT_LOG(log_, logger::LogLevel::debug, kLogger) << "skipping non-regular entry " << full.string();
                    }
                }

                active_.erase(canonical);
            }

        private:
            static std::vector<fs::path> listSorted(const fs::path& dir) {
                std::error_code ec;
                fs::directory_iterator it(dir, ec);
                if (ec) throw fsError("cannot list", dir, ec);

                std::vector<fs::path> names;
                for (fs::directory_iterator end; it != end; it.increment(ec)) {
                    names.push_back(it->path().filename());
                }
                if (ec) throw fsError("cannot list", dir, ec);

                std::sort(names.begin(), names.end(),
                          [](const fs::path& a, const fs::path& b) { return a.native() < b.native(); });
                return names;
            }

            std::vector<metainfo::FileEntry>& out_;
            const logger::LoggerPtr& log_;
            std::set<fs::path> active_;     // directories on the current recursion path
        };

    } // anonymous namespace


    FileList enumerateFiles(const fs::path& target, const logger::LoggerPtr& log) {
        std::error_code ec;
        const auto st = fs::status(target, ec);
        if (ec || !fs::exists(st)) {
            throw InputError("target file or directory does not exist: '" + target.string() + "'");
        }

        FileList list;

        if (fs::is_regular_file(st)) {
            list.singleFile = true;
            list.baseDir = target.has_parent_path() ? target.parent_path() : fs::path(".");
            list.files.push_back(metainfo::FileEntry{target.filename(), fileSize(target), 0});
            logAdded(log, list.files.back().path, list.files.back().length);
        } else if (fs::is_directory(st)) {
            list.baseDir = target;
            Walker(list.files, log).walk(target, fs::path{});
        } else {
            throw InputError("target is neither a regular file nor a directory: '" + target.string() + "'");
        }

        for (auto& f : list.files) {
            f.offset = list.totalLength;
            list.totalLength += f.length;
        }

        if (log) {
            logger::LogRecord rec;
            rec.level = logger::LogLevel::info;
            rec.logger = kLogger;
            rec.msg = std::to_string(list.files.size()) + (list.files.size() == 1 ? " file" : " files");
            rec.path = target.string();
            rec.bytes = static_cast<int64_t>(list.totalLength);
            log->log(std::move(rec));
        }
        return list;
    }

} // namespace maketorrent::create
