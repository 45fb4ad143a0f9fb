#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace maketorrent::bencode {

    class BencodeValue
    {
    public:
        enum class Type { None, Int, String, List, Dict };

        using List = std::vector<BencodeValue>;
        using Dict = std::map<std::string, BencodeValue>;   // sorted keys => canonical output

        BencodeValue();
        BencodeValue(int64_t i);
        BencodeValue(const char* s);
        BencodeValue(const std::string& s);
        BencodeValue(std::string&& s);
        BencodeValue(const List& l);
        BencodeValue(List&& l);
        BencodeValue(const Dict& d);
        BencodeValue(Dict&& d);

        bool isInt() const noexcept;
        bool isString() const noexcept;
        bool isList() const noexcept;
        bool isDict() const noexcept;

        int64_t asInt() const;
        const std::string& asString() const;
        const List& asList() const;
        const Dict& asDict() const;

        // Dict lookup; nullptr when absent (throws if this is not a dict)
        const BencodeValue* find(const std::string& key) const;

        Type type() const noexcept { return type_; }

    private:
        Type type_{Type::None};
        int64_t intValue_{0};
        std::string strValue_;
        List listValue_;
        Dict dictValue_;
    };

    struct ParseResult
    {
        BencodeValue root;
        std::optional<std::string_view> infoSlice;
    };


    class BencodeParser
    {
    public:
        static constexpr int kMaxDepth = 64;

        static BencodeValue parse(std::string_view input);
        static std::string encode(const BencodeValue& val);
        static ParseResult parseWithInfoSlice(std::string_view input);

    private:
        explicit BencodeParser(std::string_view input);

        // Recursive Descent
        BencodeValue parseValue(int depth);
        BencodeValue parseInt();
        BencodeValue parseString();
        BencodeValue parseList(int depth);
        BencodeValue parseDict(int depth);

        char peek() const;
        char get();
        void expect(char c);

        std::string_view input_;
        size_t pos_{0};

        struct Span { size_t begin{}, end{}; };
        bool capture_info_span_{false};
        std::optional<Span> info_span_;
    };

} // namespace maketorrent::bencode
