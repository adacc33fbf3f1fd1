// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef JSON_H_0187348321748321758934215734
#define JSON_H_0187348321748321758934215734

#include <map>
#include <optional>
#include <zen/utf.h>


namespace zen
{
//RFC 8259 subset: numbers are kept as text, duplicate keys keep the first value
struct JsonValue
{
    enum class Type
    {
        null,    //
        boolean, //primitive types
        number,  //
        string,  //
        array,
        object,
    };

    /**/     JsonValue() {}
    explicit JsonValue(Type t)          : type(t) {}
    explicit JsonValue(bool b)          : type(Type::boolean), primVal(b ? "true" : "false") {}
    explicit JsonValue(int num)         : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(int64_t num)     : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(std::string str) : type(Type::string),  primVal(std::move(str)) {}
    explicit JsonValue(const char* str) : type(Type::string),  primVal(str) {}
    explicit JsonValue(const void*) = delete; //catch usage errors e.g. const int* -> JsonValue(bool)

    Type type = Type::null;
    std::string                      primVal; //for primitive types
    std::vector<JsonValue>           arrayVal;
    std::map<std::string, JsonValue> objectVal; //sorted => stable output
};


std::string serializeJson(const JsonValue& jval,
                          const std::string& lineBreak = "\n",
                          const std::string& indent    = "    "); //noexcept


struct JsonParsingError
{
    JsonParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //beginning with 0
    const size_t col; //
};
JsonValue parseJson(const std::string& stream); //throw JsonParsingError


//helper function for JsonValue access:
inline
const JsonValue* getChildFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (jvalue.type != JsonValue::Type::object)
        return nullptr;

    auto it = jvalue.objectVal.find(name);
    if (it == jvalue.objectVal.end())
        return nullptr;

    return &it->second;
}





//---------------------- implementation ----------------------
namespace json_impl
{
inline
std::string jsonEscape(const std::string& str)
{
    std::string output;
    for (const char c : str)
        switch (c)
        {
            //*INDENT-OFF*
            case '\\': output += "\\\\"; break; //
            case  '"': output += "\\\""; break; //escaping mandatory

            case '\b': output += "\\b"; break; //
            case '\f': output += "\\f"; break; //
            case '\n': output += "\\n"; break; //prefer compact escaping
            case '\r': output += "\\r"; break; //
            case '\t': output += "\\t"; break; //

            default:
                if (static_cast<unsigned char>(c) < 32)
                {
                    const auto [high, low] = hexify(static_cast<unsigned char>(c));
                    output += "\\u00";
                    output += high;
                    output += low;
                }
                else
                    output += c;
                break;
            //*INDENT-ON*
        }
    return output;
}


inline
void serialize(const JsonValue& jval, std::string& stream,
               const std::string& lineBreak,
               const std::string& indent,
               size_t indentLevel)
{
    //caller is responsible for line break and indentation of the *first* line
    auto writeIndent = [&](size_t level)
    {
        for (size_t i = 0; i < level; ++i)
            stream += indent;
    };

    auto writeChildren = [&](char open, char close, const auto& children, auto writeChild)
    {
        stream += open;
        if (!children.empty())
        {
            bool first = true;
            for (const auto& child : children)
            {
                if (!first)
                    stream += ',';
                first = false;

                stream += lineBreak;
                writeIndent(indentLevel + 1);
                writeChild(child);
            }
            stream += lineBreak;
            writeIndent(indentLevel);
        }
        stream += close;
    };

    switch (jval.type)
    {
        case JsonValue::Type::null:
            stream += "null";
            break;

        case JsonValue::Type::boolean:
        case JsonValue::Type::number:
            stream += jval.primVal;
            break;

        case JsonValue::Type::string:
            stream += '"' + jsonEscape(jval.primVal) + '"';
            break;

        case JsonValue::Type::object:
            writeChildren('{', '}', jval.objectVal, [&](const auto& child)
            {
                const auto& [childName, childValue] = child;
                stream += '"' + jsonEscape(childName) + "\":";
                if (!indent.empty())
                    stream += ' ';
                serialize(childValue, stream, lineBreak, indent, indentLevel + 1);
            });
            break;

        case JsonValue::Type::array:
            writeChildren('[', ']', jval.arrayVal, [&](const JsonValue& childValue)
            {
                serialize(childValue, stream, lineBreak, indent, indentLevel + 1);
            });
            break;
    }
}


inline
std::optional<unsigned int> parseHex4(std::string_view digits) //exactly 4 hex digits
{
    if (digits.size() != 4)
        return std::nullopt;

    unsigned int val = 0;
    for (const char c : digits)
    {
        val *= 16;
        if ('0' <= c && c <= '9')
            val += c - '0';
        else if ('a' <= c && c <= 'f')
            val += c - 'a' + 10;
        else if ('A' <= c && c <= 'F')
            val += c - 'A' + 10;
        else
            return std::nullopt;
    }
    return val;
}


class JsonParser
{
public:
    explicit JsonParser(const std::string& stream) : stream_(stream)
    {
        if (startsWith(stream_, BYTE_ORDER_MARK_UTF8))
            pos_ = BYTE_ORDER_MARK_UTF8.size();
    }

    JsonValue parse() //throw JsonParsingError
    {
        JsonValue jval = parseValue(); //throw JsonParsingError
        skipWhiteSpace();
        if (pos_ != stream_.size())
            throw error();
        return jval;
    }

private:
    JsonParser           (const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;

    JsonValue parseValue() //throw JsonParsingError
    {
        skipWhiteSpace();
        if (pos_ == stream_.size())
            throw error();

        switch (stream_[pos_])
        {
            case '{':
            {
                ++pos_;
                JsonValue jval(JsonValue::Type::object);
                if (!consumeIf('}'))
                {
                    do
                    {
                        skipWhiteSpace();
                        std::string name = parseString(); //throw JsonParsingError
                        consume(':');                     //
                        JsonValue value = parseValue();   //
                        jval.objectVal.emplace(std::move(name), std::move(value));
                    }
                    while (consumeIf(','));
                    consume('}'); //throw JsonParsingError
                }
                return jval;
            }

            case '[':
            {
                ++pos_;
                JsonValue jval(JsonValue::Type::array);
                if (!consumeIf(']'))
                {
                    do
                        jval.arrayVal.push_back(parseValue()); //throw JsonParsingError
                    while (consumeIf(','));
                    consume(']'); //throw JsonParsingError
                }
                return jval;
            }

            case '"':
                return JsonValue(parseString()); //throw JsonParsingError
        }

        if (consumeKeyword("null"))
            return JsonValue();
        if (consumeKeyword("true"))
            return JsonValue(true);
        if (consumeKeyword("false"))
            return JsonValue(false);

        //expect a number:
        const size_t numEnd = std::find_if_not(stream_.begin() + pos_, stream_.end(), isJsonNumChar) - stream_.begin();
        if (numEnd == pos_)
            throw error();

        JsonValue jval(JsonValue::Type::number);
        jval.primVal = stream_.substr(pos_, numEnd - pos_);
        pos_ = numEnd;
        return jval;
    }

    std::string parseString() //throw JsonParsingError
    {
        if (pos_ == stream_.size() || stream_[pos_] != '"')
            throw error();
        ++pos_;

        std::string output;
        auto writeCodePoint = [&](impl::CodePoint cp) { impl::codePointToUtf8(cp, [&](impl::Char8 b) { output += static_cast<char>(b); }); };

        while (pos_ < stream_.size())
        {
            const char c = stream_[pos_++];
            if (c == '"')
                return output;

            if (c != '\\')
            {
                output += c;
                continue;
            }
            if (pos_ == stream_.size())
                break;

            const char c2 = stream_[pos_++];
            switch (c2)
            {
                //*INDENT-OFF*
                case '\\':
                case '"':
                case '/': output += c2;   break;
                case 'b': output += '\b'; break;
                case 'f': output += '\f'; break;
                case 'n': output += '\n'; break;
                case 'r': output += '\r'; break;
                case 't': output += '\t'; break;
                //*INDENT-ON*
                case 'u':
                {
                    const std::optional<unsigned int> unit = parseHex4(std::string_view(stream_).substr(pos_, 4));
                    if (!unit)
                        throw error();
                    pos_ += 4;

                    impl::CodePoint cp = *unit;
                    if (0xd800 <= cp && cp < 0xdc00 && //lead surrogate: combine with trailing "\uXXXX"
                        startsWith(std::string_view(stream_).substr(pos_), "\\u"))
                        if (const std::optional<unsigned int> trail = parseHex4(std::string_view(stream_).substr(pos_ + 2, 4));
                            trail && 0xdc00 <= *trail && *trail <= 0xdfff)
                        {
                            cp = 0x10000 + ((cp - 0xd800) << 10) + (*trail - 0xdc00);
                            pos_ += 6;
                        }
                    writeCodePoint(cp); //unpaired surrogates => replacement char
                    break;
                }
                default: //unknown escape sequence
                    throw error();
            }
        }
        throw error(); //missing closing quote
    }

    void skipWhiteSpace()
    {
        while (pos_ < stream_.size() && isJsonWhiteSpace(stream_[pos_]))
            ++pos_;
    }

    bool consumeIf(char c)
    {
        skipWhiteSpace();
        if (pos_ < stream_.size() && stream_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    void consume(char c) //throw JsonParsingError
    {
        if (!consumeIf(c))
            throw error();
    }

    bool consumeKeyword(std::string_view keyword)
    {
        if (!startsWith(std::string_view(stream_).substr(pos_), keyword))
            return false;
        pos_ += keyword.size();
        return true;
    }

    JsonParsingError error() const
    {
        const auto itPos = stream_.begin() + pos_;
        const size_t crSum = std::count(stream_.begin(), itPos, '\r'); //carriage returns
        const size_t nlSum = std::count(stream_.begin(), itPos, '\n'); //new lines
        const size_t row = std::max(crSum, nlSum); //be compatible with Linux/Mac/Win

        const size_t lineStart = stream_.find_last_of("\r\n", pos_ == 0 ? 0 : pos_ - 1);
        const size_t col = lineStart == std::string::npos || pos_ == 0 ? pos_ : pos_ - lineStart - 1;
        return JsonParsingError(row, col);
    }

    static bool isJsonWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
    static bool isJsonNumChar   (char c) { return ('0' <= c && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E'; }

    const std::string& stream_;
    size_t pos_ = 0;
};
}


inline
std::string serializeJson(const JsonValue& jval,
                          const std::string& lineBreak,
                          const std::string& indent) //noexcept
{
    std::string output;
    json_impl::serialize(jval, output, lineBreak, indent, 0);
    output += lineBreak;
    return output;
}


inline
JsonValue parseJson(const std::string& stream) //throw JsonParsingError
{
    return json_impl::JsonParser(stream).parse(); //throw JsonParsingError
}
}

#endif //JSON_H_0187348321748321758934215734
