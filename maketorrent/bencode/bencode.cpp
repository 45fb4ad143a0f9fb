#include "bencode.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace maketorrent::bencode {

    // ---------- BencodeValue ----------

    BencodeValue::BencodeValue() : type_(Type::None) {}

    BencodeValue::BencodeValue(int64_t i) : type_(Type::Int), intValue_(i) {}

    BencodeValue::BencodeValue(const char* s) : type_(Type::String), strValue_(s) {}

    BencodeValue::BencodeValue(const std::string& s) : type_(Type::String), strValue_(s) {}

    BencodeValue::BencodeValue(std::string&& s) : type_(Type::String), strValue_(std::move(s)) {}

    BencodeValue::BencodeValue(const List& l) : type_(Type::List), listValue_(l) {}

    BencodeValue::BencodeValue(List&& l) : type_(Type::List), listValue_(std::move(l)) {}

    BencodeValue::BencodeValue(const Dict& d) : type_(Type::Dict), dictValue_(d) {}

    BencodeValue::BencodeValue(Dict&& d) : type_(Type::Dict), dictValue_(std::move(d)) {}

    bool BencodeValue::isInt()    const noexcept { return type_ == Type::Int; }
    bool BencodeValue::isString() const noexcept { return type_ == Type::String; }
    bool BencodeValue::isList()   const noexcept { return type_ == Type::List; }
    bool BencodeValue::isDict()   const noexcept { return type_ == Type::Dict; }

    int64_t BencodeValue::asInt() const {
        if (!isInt()) throw std::runtime_error("BencodeValue: not an int");
        return intValue_;
    }

    const std::string& BencodeValue::asString() const {
        if (!isString()) throw std::runtime_error("BencodeValue: not a string");
        return strValue_;
    }

    const BencodeValue::List& BencodeValue::asList() const {
        if (!isList()) throw std::runtime_error("BencodeValue: not a list");
        return listValue_;
    }

    const BencodeValue::Dict& BencodeValue::asDict() const {
        if (!isDict()) throw std::runtime_error("BencodeValue: not a dict");
        return dictValue_;
    }

    const BencodeValue* BencodeValue::find(const std::string& key) const {
        const auto& d = asDict();
        auto it = d.find(key);
        return it == d.end() ? nullptr : &it->second;
    }


    // ---------- BencodeParser ----------

    static std::runtime_error parse_error(const char* msg, size_t pos) {
        std::ostringstream oss;
        oss << "bencode parse error at " << pos << ": " << msg;
        return std::runtime_error(oss.str());
    }

    BencodeParser::BencodeParser(std::string_view input) : input_(input), pos_(0) {}

    BencodeValue BencodeParser::parse(std::string_view input) {
        BencodeParser p(input);
        BencodeValue v = p.parseValue(0);

        if (p.pos_ != input.size()) {
            throw parse_error("trailing data after valid bencode", p.pos_);
        }
        return v;
    }

    ParseResult BencodeParser::parseWithInfoSlice(std::string_view input) {
        BencodeParser p(input);
        p.capture_info_span_ = true;
        BencodeValue v = p.parseValue(0);

        if (p.pos_ != input.size()) {
            throw parse_error("trailing data after valid bencode", p.pos_);
        }

        ParseResult r{std::move(v), std::nullopt};
        if (p.info_span_) {
            r.infoSlice = input.substr(p.info_span_->begin, p.info_span_->end - p.info_span_->begin);
        }
        return r;
    }

    char BencodeParser::peek() const {
        if (pos_ >= input_.size()) throw parse_error("unexpected end of input", pos_);
        return input_[pos_];
    }

    char BencodeParser::get() {
        char c = peek();
        ++pos_;
        return c;
    }

    void BencodeParser::expect(char c) {
        char g = get();
        if (g != c) throw parse_error("unexpected character", pos_ - 1);
    }

    BencodeValue BencodeParser::parseValue(int depth) {
        if (depth > kMaxDepth) throw parse_error("nesting too deep", pos_);

        char c = peek();
        if (c == 'i') return parseInt();
        if (c == 'l') return parseList(depth + 1);
        if (c == 'd') return parseDict(depth + 1);
        if (c >= '0' && c <= '9') return parseString();
        throw parse_error("invalid value prefix", pos_);
    }

    BencodeValue BencodeParser::parseInt() {
        expect('i');
        bool neg = false;
        if (peek() == '-') { get(); neg = true; }

        if (!(peek() >= '0' && peek() <= '9')) {
            throw parse_error("integer missing digits", pos_);
        }

        // "i0e" only; no "-0", no leading zeros
        if (peek() == '0') {
            get();
            expect('e');
            if (neg) throw parse_error("negative zero not allowed", pos_ - 2);
            return BencodeValue(int64_t(0));
        }

        uint64_t mag = 0;
        while (peek() >= '0' && peek() <= '9') {
            int d = get() - '0';
            if (mag > (std::numeric_limits<uint64_t>::max() - uint64_t(d)) / 10ULL) {
                throw parse_error("integer overflow", pos_);
            }
            mag = mag * 10ULL + uint64_t(d);
        }
        expect('e');

        constexpr uint64_t ABS_INT64_MIN = uint64_t(1) << 63;
        if (!neg) {
            if (mag > uint64_t(std::numeric_limits<int64_t>::max()))
                throw parse_error("integer overflow", pos_);
            return BencodeValue(static_cast<int64_t>(mag));
        }
        if (mag == ABS_INT64_MIN) return BencodeValue(std::numeric_limits<int64_t>::min());
        if (mag > uint64_t(std::numeric_limits<int64_t>::max())) throw parse_error("integer overflow", pos_);
        return BencodeValue(-static_cast<int64_t>(mag));
    }

    BencodeValue BencodeParser::parseString() {
        if (peek() == '0') {
            get();
            expect(':');
            return BencodeValue(std::string{});
        }

        size_t len = 0;
        while (peek() >= '0' && peek() <= '9') {
            int d = get() - '0';
            if (len > (std::numeric_limits<size_t>::max() - size_t(d)) / 10) {
                throw parse_error("string length overflow", pos_);
            }
            len = len * 10 + size_t(d);
        }
        expect(':');

        if (input_.size() - pos_ < len) {
            throw parse_error("string length exceeds input", pos_);
        }
        std::string out(input_.substr(pos_, len));
        pos_ += len;
        return BencodeValue(std::move(out));
    }

    BencodeValue BencodeParser::parseList(int depth) {
        expect('l');
        BencodeValue::List lst;
        while (peek() != 'e') {
            lst.push_back(parseValue(depth));
        }
        expect('e');
        return BencodeValue(std::move(lst));
    }

    BencodeValue BencodeParser::parseDict(int depth) {
        expect('d');
        BencodeValue::Dict dict;

        while (peek() != 'e') {
            if (!(peek() >= '0' && peek() <= '9')) throw parse_error("dict key is not a string", pos_);
            BencodeValue key = parseString();
            const std::string& k = key.asString();

            if (dict.find(k) != dict.end()) {
                throw parse_error("duplicate dict key", pos_);
            }

            size_t val_begin = pos_;
            BencodeValue val = parseValue(depth);
            size_t val_end = pos_;

            // only the top-level "info" (depth 1) is the one hashed into the info-hash
            if (capture_info_span_ && depth == 1 && k == "info" && !info_span_) {
                info_span_ = Span{val_begin, val_end};
            }

            dict.emplace(k, std::move(val));
        }

        expect('e');
        return BencodeValue(std::move(dict));
    }

    // ---- Encoder ----

    static void encode_impl(const BencodeValue& v, std::string& out);

    static void encode_int(int64_t x, std::string& out) {
        out.push_back('i');
        out += std::to_string(x);
        out.push_back('e');
    }

    static void encode_string(const std::string& s, std::string& out) {
        out += std::to_string(s.size());
        out.push_back(':');
        out.append(s.data(), s.size());
    }

    static void encode_impl(const BencodeValue& v, std::string& out) {
        switch (v.type()) {
            case BencodeValue::Type::None:
                throw std::runtime_error("cannot encode None");
            case BencodeValue::Type::Int:
                encode_int(v.asInt(), out);
                break;
            case BencodeValue::Type::String:
                encode_string(v.asString(), out);
                break;
            case BencodeValue::Type::List:
                out.push_back('l');
                for (const auto& e : v.asList()) encode_impl(e, out);
                out.push_back('e');
                break;
            case BencodeValue::Type::Dict:
                out.push_back('d');
                for (const auto& [k, val] : v.asDict()) {
                    encode_string(k, out);
                    encode_impl(val, out);
                }
                out.push_back('e');
                break;
        }
    }

    std::string BencodeParser::encode(const BencodeValue& val) {
        std::string out;
        out.reserve(256);
        encode_impl(val, out);
        return out;
    }

} // namespace maketorrent::bencode
