#include "metainfo.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>


namespace maketorrent::metainfo {

    using bencode::BencodeParser;
    using bencode::BencodeValue;

    static PieceHash sha1_bytes(const void* data, size_t len) {
        PieceHash out;
        SHA1(static_cast<const unsigned char*>(data), len, out.data());
        return out;
    }

    static const BencodeValue& expect_dict(const BencodeValue& v, const char* where) {
        if (!v.isDict()) throw std::runtime_error(std::string(where) + ": expected dict");
        return v;
    }
    static const BencodeValue& expect_list(const BencodeValue& v, const char* where) {
        if (!v.isList()) throw std::runtime_error(std::string(where) + ": expected list");
        return v;
    }
    static const BencodeValue& expect_str(const BencodeValue& v, const char* where) {
        if (!v.isString()) throw std::runtime_error(std::string(where) + ": expected string");
        return v;
    }
    static uint64_t expect_length(const BencodeValue* v, const char* where) {
        if (!v || !v->isInt()) throw std::runtime_error(std::string(where) + " missing or not int");
        if (v->asInt() < 0) throw std::runtime_error(std::string(where) + " negative");
        return static_cast<uint64_t>(v->asInt());
    }

    uint64_t expectedPieceCount(uint64_t totalLength, uint32_t pieceLength) noexcept {
        if (pieceLength == 0) return 0;
        return totalLength / pieceLength + (totalLength % pieceLength != 0 ? 1 : 0);
    }

    bool isPowerOfTwo(uint64_t v) noexcept {
        return v != 0 && (v & (v - 1)) == 0;
    }

    std::string toHex(const PieceHash& h) {
        std::ostringstream oss;
        for (auto b : h) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        }
        return oss.str();
    }

    // -------------------------- Assembly ---------------------------

    Metainfo Metainfo::assemble(InfoDictionary info,
                                std::string announce,
                                std::vector<std::string> announceList,
                                std::string comment,
                                int64_t creationDate,
                                std::string createdBy)
    {
        Metainfo mi;
        mi.info = std::move(info);
        mi.announce = std::move(announce);
        mi.announceList = std::move(announceList);
        mi.comment = std::move(comment);
        mi.creationDate = creationDate;
        mi.createdBy = std::move(createdBy);
        mi.validate();
        return mi;
    }

    void Metainfo::validate() const {
        if (info.name.empty()) throw std::logic_error("metainfo: empty name");
        if (announce.empty()) throw std::logic_error("metainfo: empty announce");
        if (!isPowerOfTwo(info.pieceLength)) throw std::logic_error("metainfo: piece length is not a power of two");
        if (info.singleFile && info.files.size() != 1) throw std::logic_error("metainfo: single-file mode needs exactly one file");

        uint64_t running = 0;
        for (const auto& f : info.files) {
            if (f.offset != running) throw std::logic_error("metainfo: file offsets are not contiguous at " + f.path.generic_string());
            running += f.length;
        }

        const auto expected = expectedPieceCount(running, info.pieceLength);
        if (info.pieces.size() != expected) {
            throw std::logic_error("metainfo: " + std::to_string(info.pieces.size()) + " piece hashes for "
                                   + std::to_string(expected) + " pieces");
        }
    }

    // -------------------------- Piece geometry ---------------------------

    uint64_t Metainfo::pieceSize(std::size_t index) const {
        if (index >= numPieces()) throw std::out_of_range("piece index " + std::to_string(index));
        const uint64_t start = uint64_t(index) * info.pieceLength;
        return std::min<uint64_t>(info.pieceLength, totalLength() - start);
    }

    std::vector<FileSlice> Metainfo::pieceRange(std::size_t index) const {
        uint64_t remaining = pieceSize(index);
        uint64_t pos = uint64_t(index) * info.pieceLength;

        // first file whose range ends after pos
        auto it = std::upper_bound(info.files.begin(), info.files.end(), pos,
            [](uint64_t p, const FileEntry& f) { return p < f.offset + f.length; });

        std::vector<FileSlice> out;
        for (; it != info.files.end() && remaining > 0; ++it) {
            if (it->length == 0) continue;
            const uint64_t inFile = pos - it->offset;
            const uint64_t take = std::min(remaining, it->length - inFile);
            out.push_back(FileSlice{static_cast<std::size_t>(it - info.files.begin()), inFile, take});
            pos += take;
            remaining -= take;
        }
        return out;
    }

    // -------------------------- Encoding ---------------------------

    BencodeValue Metainfo::infoValue() const {
        BencodeValue::Dict d;
        d["name"] = BencodeValue(info.name);
        d["piece length"] = BencodeValue(static_cast<int64_t>(info.pieceLength));

        std::string blob;
        blob.reserve(info.pieces.size() * kPieceHashSize);
        for (const auto& p : info.pieces) blob.append(reinterpret_cast<const char*>(p.data()), p.size());
        d["pieces"] = BencodeValue(std::move(blob));

        if (info.isPrivate) d["private"] = BencodeValue(int64_t{1});

        if (info.singleFile) {
            d["length"] = BencodeValue(static_cast<int64_t>(info.files.front().length));
        } else {
            BencodeValue::List files;
            files.reserve(info.files.size());
            for (const auto& f : info.files) {
                BencodeValue::List path;
                for (const auto& seg : f.path) path.emplace_back(seg.string());

                BencodeValue::Dict fd;
                fd["length"] = BencodeValue(static_cast<int64_t>(f.length));
                fd["path"] = BencodeValue(std::move(path));
                files.emplace_back(std::move(fd));
            }
            d["files"] = BencodeValue(std::move(files));
        }
        return BencodeValue(std::move(d));
    }

    BencodeValue Metainfo::toBencode() const {
        BencodeValue::Dict root;
        root["announce"] = BencodeValue(announce);

        // BEP 12: one tier per URL, primary first
        if (!announceList.empty()) {
            BencodeValue::List tiers;
            tiers.emplace_back(BencodeValue::List{BencodeValue(announce)});
            for (const auto& url : announceList) tiers.emplace_back(BencodeValue::List{BencodeValue(url)});
            root["announce-list"] = BencodeValue(std::move(tiers));
        }

        if (!comment.empty()) root["comment"] = BencodeValue(comment);
        if (!createdBy.empty()) root["created by"] = BencodeValue(createdBy);
        root["creation date"] = BencodeValue(creationDate);
        if (!encoding.empty()) root["encoding"] = BencodeValue(encoding);
        root["info"] = infoValue();

        return BencodeValue(std::move(root));
    }

    std::string Metainfo::encode() const {
        return BencodeParser::encode(toBencode());
    }

    PieceHash Metainfo::infoHash() const {
        if (parsedInfoHash_) return *parsedInfoHash_;
        const auto raw = BencodeParser::encode(infoValue());
        return sha1_bytes(raw.data(), raw.size());
    }

    std::string Metainfo::infoHashHex() const {
        return toHex(infoHash());
    }

    nlohmann::json Metainfo::toJson() const {
        nlohmann::json j;
        j["name"] = info.name;
        j["announce"] = announce;
        j["announce_list"] = announceList;
        if (!comment.empty()) j["comment"] = comment;
        j["private"] = info.isPrivate;
        j["creation_date"] = creationDate;
        j["created_by"] = createdBy;
        j["piece_length"] = info.pieceLength;
        j["total_length"] = totalLength();
        j["piece_count"] = numPieces();
        j["mode"] = info.singleFile ? "single-file" : "multi-file";

        auto files = nlohmann::json::array();
        for (const auto& f : info.files) {
            files.push_back({{"path", f.path.generic_string()}, {"length", f.length}, {"offset", f.offset}});
        }
        j["files"] = std::move(files);
        j["info_hash"] = infoHashHex();
        return j;
    }

    // -------------------------- Decoding ---------------------------

    static std::vector<PieceHash> split_pieces_blob(const std::string& blob) {
        if (blob.size() % kPieceHashSize != 0) throw std::runtime_error("pieces blob not multiple of 20");

        std::vector<PieceHash> out;
        out.reserve(blob.size() / kPieceHashSize);

        for (size_t i = 0; i < blob.size(); i += kPieceHashSize) {
            PieceHash a{};
            std::memcpy(a.data(), blob.data() + i, kPieceHashSize);
            out.push_back(a);
        }
        return out;
    }

    static std::vector<FileEntry> multi_file_entries(const BencodeValue& filesv) {
        const auto& lst = expect_list(filesv, "info.files").asList();
        std::vector<FileEntry> out;
        out.reserve(lst.size());
        uint64_t running = 0;

        for (const auto& fv : lst) {
            const auto& fd = expect_dict(fv, "file entry");
            uint64_t len = expect_length(fd.find("length"), "file.length");

            const auto* pathv = fd.find("path");
            if (!pathv || !pathv->isList() || pathv->asList().empty())
                throw std::runtime_error("file.path missing or empty");

            std::filesystem::path p;
            for (const auto& segv : pathv->asList()) {
                const auto& s = expect_str(segv, "file.path segment").asString();
                if (s.empty() || s == "." || s == ".." || s.find('/') != std::string::npos)
                    throw std::runtime_error("file.path segment invalid: " + s);
                p /= s;
            }

            out.push_back(FileEntry{std::move(p), len, running});
            running += len;
        }
        return out;
    }

    static void collect_trackers(const BencodeValue& root, Metainfo& mi) {
        if (const auto* a = root.find("announce"); a && a->isString()) {
            mi.announce = a->asString();
        }

        std::vector<std::string> urls;
        if (const auto* al = root.find("announce-list"); al && al->isList()) {
            for (const auto& tierVal : al->asList()) {
                if (!tierVal.isList()) continue;
                for (const auto& s : tierVal.asList()) {
                    if (s.isString()) urls.push_back(s.asString());
                }
            }
        }

        if (mi.announce.empty() && !urls.empty()) mi.announce = urls.front();
        if (!urls.empty() && urls.front() == mi.announce) urls.erase(urls.begin());
        mi.announceList = std::move(urls);
    }

    Metainfo Metainfo::fromTorrent(std::string_view data) {
        auto pr = BencodeParser::parseWithInfoSlice(data);
        const auto& root = expect_dict(pr.root, "root");

        if (!pr.infoSlice) throw std::runtime_error("missing 'info' dictionary");
        const auto& infod = expect_dict(*root.find("info"), "info");

        Metainfo mi;

        const auto* namev = infod.find("name");
        if (!namev) throw std::runtime_error("info.name missing");
        mi.info.name = expect_str(*namev, "info.name").asString();

        const auto* plv = infod.find("piece length");
        if (!plv || !plv->isInt()) throw std::runtime_error("info.piece length missing or not int");
        if (plv->asInt() <= 0 || plv->asInt() > INT64_C(0xFFFFFFFF)) throw std::runtime_error("info.piece length out of range");
        mi.info.pieceLength = static_cast<uint32_t>(plv->asInt());

        const auto* pv = infod.find("pieces");
        if (!pv) throw std::runtime_error("info.pieces missing");
        mi.info.pieces = split_pieces_blob(expect_str(*pv, "info.pieces").asString());

        if (const auto* privv = infod.find("private"); privv && privv->isInt()) {
            mi.info.isPrivate = privv->asInt() == 1;
        }

        if (const auto* filesv = infod.find("files")) {
            mi.info.files = multi_file_entries(*filesv);
            mi.info.singleFile = false;
        } else {
            mi.info.files = {FileEntry{mi.info.name, expect_length(infod.find("length"), "info.length"), 0}};
            mi.info.singleFile = true;
        }

        collect_trackers(root, mi);

        if (const auto* c = root.find("comment"); c && c->isString()) mi.comment = c->asString();
        if (const auto* c = root.find("created by"); c && c->isString()) mi.createdBy = c->asString();
        if (const auto* c = root.find("creation date"); c && c->isInt()) mi.creationDate = c->asInt();
        if (const auto* c = root.find("encoding"); c && c->isString()) mi.encoding = c->asString();
        else mi.encoding.clear();

        if (expectedPieceCount(mi.totalLength(), mi.info.pieceLength) != mi.info.pieces.size()) {
            throw std::runtime_error("pieces count does not match total length");
        }

        // Compute infohash from exact raw bytes of "info"
        mi.parsedInfoHash_ = sha1_bytes(pr.infoSlice->data(), pr.infoSlice->size());
        return mi;
    }

} // namespace maketorrent::metainfo
