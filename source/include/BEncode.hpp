#pragma once

#include <map>
#include <string>
#include <vector>
#include <variant>
#include <stdexcept>
#include <cstdint>
#include <functional>
#include <string_view>

struct BEncodeValue {
    using List = std::vector<BEncodeValue>;
    using Dict = std::map<std::string, BEncodeValue, std::less<>>;

    std::variant<int64_t, std::string, List, Dict> value;

    bool is_int() const { return std::holds_alternative<int64_t>(value); }
    bool is_string() const { return std::holds_alternative<std::string>(value); }
    bool is_list() const { return std::holds_alternative<List>(value); }
    bool is_dict() const { return std::holds_alternative<Dict>(value); }

    int64_t as_int() const { return std::get<int64_t>(value); }
    const std::string& as_string() const { return std::get<std::string>(value); }
    const List& as_list() const { return std::get<List>(value); }
    const Dict& as_dict() const { return std::get<Dict>(value); }
    Dict& as_dict() { return std::get<Dict>(value); }

    // dict lookup, nullptr when absent or when this is not a dict
    const BEncodeValue* find(std::string_view key) const;
};

class BEncodeParser {
public:
    explicit BEncodeParser(std::string_view input);

    // throws std::runtime_error on malformed input or trailing bytes
    BEncodeValue parse();

private:
    BEncodeValue parse_value(int depth);
    int64_t parse_int();
    std::string parse_string();
    BEncodeValue::List parse_list(int depth);
    BEncodeValue::Dict parse_dict(int depth);

    static constexpr int MAX_DEPTH = 100;

    std::string_view _data;
    size_t pos{};
};

std::string bencode(const BEncodeValue& v);
