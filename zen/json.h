// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
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
//JSON: https://tools.ietf.org/html/rfc8259
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
    explicit JsonValue(double num)      : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(std::string str) : type(Type::string),  primVal(std::move(str)) {} //unifying assignment
    explicit JsonValue(const char* str) : type(Type::string),  primVal(str) {}
    explicit JsonValue(const void*) = delete; //catch usage errors e.g. const int* -> JsonValue(bool)
    explicit JsonValue(std::vector<JsonValue> initList) : type(Type::array), arrayVal(std::move(initList)) {} //unifying assignment

    Type type = Type::null;
    std::string                      primVal; //for primitive types
    std::vector<JsonValue>           arrayVal;
    std::map<std::string, JsonValue> objectVal; //sorted => stable file output
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



//helper functions for JsonValue access:
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


inline
std::optional<std::string> getPrimitiveFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (const JsonValue* childValue = getChildFromJsonObject(jvalue, name))
        if (childValue->type != JsonValue::Type::object &&
            childValue->type != JsonValue::Type::array)
            return childValue->primVal;
    return std::nullopt;
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
                    const auto [high, low] = hexify(c);
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
std::string jsonUnescape(std::string_view str)
{
    using impl::CodePoint;
    std::string output;
    std::optional<CodePoint> leadSurrogate; //😀 => U+1F600

    auto writeCodePoint = [&](CodePoint cp)
    {
        if (leadSurrogate)
        {
            if (impl::TRAIL_SURROGATE <= cp && cp <= impl::TRAIL_SURROGATE_MAX)
                cp = ((*leadSurrogate - impl::LEAD_SURROGATE) << 10) + (cp - impl::TRAIL_SURROGATE) + 0x10000;
            else
                impl::codePointToUtf8(impl::REPLACEMENT_CHAR, [&](char c) { output += c; });
            leadSurrogate.reset();
        }

        if (impl::LEAD_SURROGATE <= cp && cp < impl::TRAIL_SURROGATE)
            leadSurrogate = cp;
        else
            impl::codePointToUtf8(cp, [&](char c) { output += c; });
    };
    auto writeOut = [&](char c)
    {
        if (leadSurrogate) //unpaired
        {
            leadSurrogate.reset();
            impl::codePointToUtf8(impl::REPLACEMENT_CHAR, [&](char c2) { output += c2; });
        }
        output += c;
    };

    for (auto it = str.begin(); it != str.end(); ++it)
    {
        const char c = *it;
        if (c == '\\')
        {
            ++it;
            if (it == str.end()) //unexpected end!
            {
                writeOut(c);
                break;
            }

            const char c2 = *it;
            switch (c2)
            {
                //*INDENT-OFF*
                case '\\':
                case '"':
                case '/': writeOut(c2);   break;
                case 'b': writeOut('\b'); break;
                case 'f': writeOut('\f'); break;
                case 'n': writeOut('\n'); break;
                case 'r': writeOut('\r'); break;
                case 't': writeOut('\t'); break;
                default:
                    if (c2 == 'u' &&
                        str.end() - it >= 5 &&
                        isHexDigit(it[1])   &&
                        isHexDigit(it[2])   &&
                        isHexDigit(it[3])   &&
                        isHexDigit(it[4]))
                    {
                        writeCodePoint(static_cast<unsigned char>(unhexify(it[1], it[2])) * 256 +
                                       static_cast<unsigned char>(unhexify(it[3], it[4])));
                        it += 4;
                    }
                    else //unknown escape sequence!
                    {
                        writeOut(c);
                        writeOut(c2);
                    }
                    break;
                //*INDENT-ON*
            }
        }
        else
            writeOut(c);
    }
    if (leadSurrogate)
        impl::codePointToUtf8(impl::REPLACEMENT_CHAR, [&](char c) { output += c; });
    return output;
}


inline
void serialize(const JsonValue& jval, std::string& stream,
               const std::string& lineBreak,
               const std::string& indent,
               size_t indentLevel)
{
    //the caller is repsonsible for line breaks and indentation of *first* line
    auto writeIndent = [&](size_t level)
    {
        for (size_t i = 0; i < level; ++i)
            stream += indent;
    };

    //arrays and objects share the same layout
    auto writeContainer = [&](char openBracket, char closeBracket, size_t childCount, auto writeChild)
    {
        stream += openBracket;
        if (childCount > 0)
        {
            for (size_t i = 0; i < childCount; ++i)
            {
                if (i > 0)
                    stream += ',';
                stream += lineBreak;
                writeIndent(indentLevel + 1);
                writeChild(i);
            }
            stream += lineBreak;
            writeIndent(indentLevel);
        }
        stream += closeBracket;
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
        {
            auto itChild = jval.objectVal.begin();
            writeContainer('{', '}', jval.objectVal.size(), [&](size_t /*i*/)
            {
                const auto& [childName, childValue] = *itChild++;
                stream += '"' + jsonEscape(childName) + "\":";
                if (!indent.empty())
                    stream += ' ';
                serialize(childValue, stream, lineBreak, indent, indentLevel + 1);
            });
        }
        break;

        case JsonValue::Type::array:
            writeContainer('[', ']', jval.arrayVal.size(), [&](size_t i)
            {
                serialize(jval.arrayVal[i], stream, lineBreak, indent, indentLevel + 1);
            });
            break;
    }
}
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


namespace json_impl
{
enum class TokenType
{
    eof,
    curlyOpen,
    curlyClose,
    squareOpen,
    squareClose,
    colon,
    comma,
    string,  //
    number,  //primitive types
    boolean, //
    null,    //
};

struct Token
{
    Token(TokenType t) : type(t) {}
    Token(TokenType t, std::string val) : type(t), primVal(std::move(val)) {}

    TokenType type;
    std::string primVal; //for primitive types
};

class Scanner
{
public:
    explicit Scanner(const std::string& stream) : stream_(stream), pos_(stream_.begin())
    {
        if (zen::startsWith(stream_, BYTE_ORDER_MARK_UTF8))
            pos_ += BYTE_ORDER_MARK_UTF8.size();
    }

    Token getNextToken() //throw JsonParsingError
    {
        pos_ = std::find_if_not(pos_, stream_.end(), isJsonWhiteSpace);

        if (pos_ == stream_.end())
            return TokenType::eof;

        switch (*pos_)
        {
            //*INDENT-OFF*
            case '{': ++pos_; return TokenType::curlyOpen;
            case '}': ++pos_; return TokenType::curlyClose;
            case '[': ++pos_; return TokenType::squareOpen;
            case ']': ++pos_; return TokenType::squareClose;
            case ':': ++pos_; return TokenType::colon;
            case ',': ++pos_; return TokenType::comma;
            //*INDENT-ON*
        }

        for (const auto& [keyword, tokenType] :
             {
                 std::pair<std::string_view, TokenType>{"null",  TokenType::null},
                 std::pair<std::string_view, TokenType>{"true",  TokenType::boolean},
                 std::pair<std::string_view, TokenType>{"false", TokenType::boolean},
             })
            if (remainderStartsWith(keyword))
            {
                pos_ += keyword.size();
                return Token(tokenType, tokenType == TokenType::null ? std::string() : std::string(keyword));
            }

        if (*pos_ == '"')
        {
            for (auto it = ++pos_; it != stream_.end(); ++it)
                if (*it == '"')
                {
                    Token tk(TokenType::string, jsonUnescape(std::string_view(&*pos_, it - pos_)));
                    pos_ = ++it;
                    return tk;
                }
                else if (*it == '\\') //skip next char
                    if (++it == stream_.end())
                        break;

            throw JsonParsingError(posRow(), posCol());
        }

        //expect a number:
        const auto itNumEnd = std::find_if_not(pos_, stream_.end(), isJsonNumDigit);
        if (itNumEnd == pos_)
            throw JsonParsingError(posRow(), posCol());

        Token tk(TokenType::number, std::string(pos_, itNumEnd));
        pos_ = itNumEnd;
        return tk;
    }

    size_t posRow() const //current row beginning with 0
    {
        const size_t crSum = std::count(stream_.begin(), pos_, '\r'); //carriage returns
        const size_t nlSum = std::count(stream_.begin(), pos_, '\n'); //new lines
        return std::max(crSum, nlSum); //be compatible with Linux/Mac/Win
    }

    size_t posCol() const //current col beginning with 0
    {
        //seek beginning of line
        for (auto it = pos_; it != stream_.begin(); )
        {
            --it;
            if (isLineBreak(*it))
                return pos_ - it - 1;
        }
        return pos_ - stream_.begin();
    }

private:
    Scanner           (const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    static bool isJsonWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
    static bool isJsonNumDigit  (char c) { return ('0' <= c && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e'|| c == 'E'; }

    bool remainderStartsWith(std::string_view prefix) const
    {
        return static_cast<size_t>(stream_.end() - pos_) >= prefix.size() &&
               std::equal(prefix.begin(), prefix.end(), pos_);
    }

    const std::string stream_;
    std::string::const_iterator pos_;
};


class JsonParser
{
public:
    explicit JsonParser(const std::string& stream) :
        scn_(stream),
        tk_(scn_.getNextToken()) {} //throw JsonParsingError

    JsonValue parse() //throw JsonParsingError
    {
        JsonValue jval = parseValue(); //throw JsonParsingError
        expectToken(TokenType::eof);   //
        return jval;
    }

private:
    JsonParser           (const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;

    JsonValue parseValue() //throw JsonParsingError
    {
        switch (tk_.type)
        {
            case TokenType::curlyOpen:
            {
                nextToken(); //throw JsonParsingError
                JsonValue jval(JsonValue::Type::object);

                if (tk_.type != TokenType::curlyClose)
                    for (;;)
                    {
                        expectToken(TokenType::string); //throw JsonParsingError
                        std::string name = tk_.primVal;
                        nextToken();                    //throw JsonParsingError
                        consumeToken(TokenType::colon); //

                        JsonValue value = parseValue(); //throw JsonParsingError
                        jval.objectVal.emplace(std::move(name), std::move(value));

                        if (tk_.type != TokenType::comma)
                            break;
                        nextToken(); //throw JsonParsingError
                    }

                consumeToken(TokenType::curlyClose); //throw JsonParsingError
                return jval;
            }

            case TokenType::squareOpen:
            {
                nextToken(); //throw JsonParsingError
                JsonValue jval(JsonValue::Type::array);

                if (tk_.type != TokenType::squareClose)
                    for (;;)
                    {
                        jval.arrayVal.push_back(parseValue()); //throw JsonParsingError

                        if (tk_.type != TokenType::comma)
                            break;
                        nextToken(); //throw JsonParsingError
                    }

                consumeToken(TokenType::squareClose); //throw JsonParsingError
                return jval;
            }

            case TokenType::string:
            case TokenType::number:
            case TokenType::boolean:
            case TokenType::null:
            {
                JsonValue jval(tk_.type == TokenType::string  ? JsonValue::Type::string  :
                               tk_.type == TokenType::number  ? JsonValue::Type::number  :
                               tk_.type == TokenType::boolean ? JsonValue::Type::boolean : JsonValue::Type::null);
                jval.primVal = tk_.primVal;
                nextToken(); //throw JsonParsingError
                return jval;
            }

            default: //unexpected token
                throw JsonParsingError(scn_.posRow(), scn_.posCol());
        }
    }

    void nextToken() { tk_ = scn_.getNextToken(); } //throw JsonParsingError

    void expectToken(TokenType t) //throw JsonParsingError
    {
        if (tk_.type != t)
            throw JsonParsingError(scn_.posRow(), scn_.posCol());
    }

    void consumeToken(TokenType t) //throw JsonParsingError
    {
        expectToken(t); //throw JsonParsingError
        nextToken();    //
    }

    Scanner scn_;
    Token tk_;
};
}

inline
JsonValue parseJson(const std::string& stream) //throw JsonParsingError
{
    return json_impl::JsonParser(stream).parse(); //throw JsonParsingError
}
}

#endif //JSON_H_0187348321748321758934215734
