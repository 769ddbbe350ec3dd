#include "BEncode.hpp"

#include <cctype>

const BEncodeValue* BEncodeValue::find(std::string_view key) const {
    if (!is_dict()) return nullptr;

    const auto& dict = as_dict();
    auto it = dict.find(key);
    return it == dict.end() ? nullptr : &it->second;
}

BEncodeParser::BEncodeParser(std::string_view input) : _data(input), pos(0) {}

BEncodeValue BEncodeParser::parse() {
    auto v = parse_value(0);
    if (pos != _data.size()) throw std::runtime_error("Trailing data after BEncode value");
    return v;
}

BEncodeValue BEncodeParser::parse_value(int depth) {
    if (pos >= _data.size()) throw std::runtime_error("Unexpected end of input");
    if (depth > MAX_DEPTH) throw std::runtime_error("BEncode nesting too deep");

    char c = _data[pos];
    if (c == 'i') {
        return BEncodeValue{ parse_int() };
    } else if (c == 'l') {
        ++pos;
        return BEncodeValue{ parse_list(depth + 1) };
    } else if (c == 'd') {
        ++pos;
        return BEncodeValue{ parse_dict(depth + 1) };
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
        return BEncodeValue{ parse_string() };
    } else {
        throw std::runtime_error(std::string("Invalid BEncode token: ") + c);
    }
}

// parse integer like: i-123e or i0e
int64_t BEncodeParser::parse_int() {
    ++pos; // skip 'i'

    bool neg = false;
    if (pos < _data.size() && _data[pos] == '-') {
        neg = true;
        ++pos;
    }

    if (pos >= _data.size() || !std::isdigit(static_cast<unsigned char>(_data[pos])))
        throw std::runtime_error("Invalid integer");

    if (_data[pos] == '0' && (neg || (pos + 1 < _data.size() && _data[pos + 1] != 'e')))
        throw std::runtime_error("Leading zeros not allowed");

    int64_t value = 0;
    while (pos < _data.size() && std::isdigit(static_cast<unsigned char>(_data[pos]))) {
        if (value > (INT64_MAX - 9) / 10) throw std::runtime_error("Integer overflow");
        value = value * 10 + (_data[pos] - '0');
        ++pos;
    }

    if (pos >= _data.size() || _data[pos] != 'e') throw std::runtime_error("Missing 'e' for integer");
    ++pos; // skip 'e'
    return neg ? -value : value;
}

// parse string: <len>:<data>
std::string BEncodeParser::parse_string() {
    size_t colon = _data.find(':', pos);
    if (colon == std::string_view::npos) throw std::runtime_error("Missing ':' in string");

    size_t len = 0;
    for (size_t i = pos; i < colon; ++i) {
        char ch = _data[i];
        if (!std::isdigit(static_cast<unsigned char>(ch))) throw std::runtime_error("Invalid string length");
        if (len > _data.size()) throw std::runtime_error("String length exceeds input");
        len = len * 10 + (ch - '0');
    }

    pos = colon + 1;
    if (len > _data.size() - pos) throw std::runtime_error("String length exceeds input");

    std::string out(_data.substr(pos, len));
    pos += len;
    return out;
}

BEncodeValue::List BEncodeParser::parse_list(int depth) {
    BEncodeValue::List list;
    while (pos < _data.size() && _data[pos] != 'e') {
        list.push_back(parse_value(depth));
    }
    if (pos >= _data.size()) throw std::runtime_error("Missing 'e' at end of list");
    ++pos; // skip 'e'
    return list;
}

BEncodeValue::Dict BEncodeParser::parse_dict(int depth) {
    BEncodeValue::Dict dict;
    while (pos < _data.size() && _data[pos] != 'e') {
        if (!std::isdigit(static_cast<unsigned char>(_data[pos]))) throw std::runtime_error("Dictionary key must be a string");
        auto key = parse_string();
        auto value = parse_value(depth);
        dict.insert_or_assign(std::move(key), std::move(value));
    }
    if (pos >= _data.size()) throw std::runtime_error("Missing 'e' at end of dict");
    ++pos;
    return dict;
}

namespace {

void encode_into(std::string& out, const BEncodeValue& v) {
    if (v.is_int()) {
        out += 'i';
        out += std::to_string(v.as_int());
        out += 'e';
    }
    else if (v.is_string()) {
        const auto& s = v.as_string();
        out += std::to_string(s.size());
        out += ':';
        out += s;
    }
    else if (v.is_list()) {
        out += 'l';
        for (const auto& item: v.as_list()) encode_into(out, item);
        out += 'e';
    }
    else {
        // std::map keeps keys in the sorted order bencode requires
        out += 'd';
        for (const auto& [key, item]: v.as_dict()) {
            out += std::to_string(key.size());
            out += ':';
            out += key;
            encode_into(out, item);
        }
        out += 'e';
    }
}

}

std::string bencode(const BEncodeValue& v) {
    std::string out;
    encode_into(out, v);
    return out;
}
