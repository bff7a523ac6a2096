#include "index/column_type.h"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace sidx {

ColumnTypePtr ColumnType::fromName(std::string_view name) {
    std::string s(name);
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "text" || s == "utf8" || s == "varchar") return UTF8Type::instance();
    if (s == "ascii") return AsciiType::instance();
    if (s == "bigint" || s == "int64" || s == "long") return Int64Type::instance();
    if (s == "blob" || s == "bytes") return BytesType::instance();
    return nullptr;
}

ColumnTypePtr UTF8Type::instance() {
    static const ColumnTypePtr type = std::make_shared<UTF8Type>();
    return type;
}

ColumnTypePtr AsciiType::instance() {
    static const ColumnTypePtr type = std::make_shared<AsciiType>();
    return type;
}

ColumnTypePtr Int64Type::instance() {
    static const ColumnTypePtr type = std::make_shared<Int64Type>();
    return type;
}

ColumnTypePtr BytesType::instance() {
    static const ColumnTypePtr type = std::make_shared<BytesType>();
    return type;
}

std::string Int64Type::encode(int64_t v) {
    uint64_t u = static_cast<uint64_t>(v) ^ (uint64_t(1) << 63);
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = static_cast<char>(u & 0xFF);
        u >>= 8;
    }
    return out;
}

int64_t Int64Type::decode(std::string_view raw) {
    if (raw.size() != 8)
        throw std::invalid_argument("bigint value must be 8 bytes, got " + std::to_string(raw.size()));
    uint64_t u = 0;
    for (unsigned char c : raw)
        u = (u << 8) | c;
    return static_cast<int64_t>(u ^ (uint64_t(1) << 63));
}

int Int64Type::compare(std::string_view a, std::string_view b) const {
    int64_t x = decode(a);
    int64_t y = decode(b);
    return x < y ? -1 : (x > y ? 1 : 0);
}

std::string Int64Type::toString(std::string_view raw) const {
    return raw.size() == 8 ? std::to_string(decode(raw)) : BytesType().toString(raw);
}

std::string BytesType::toString(std::string_view raw) const {
    std::string out = "0x";
    char buf[3];
    for (unsigned char c : raw) {
        snprintf(buf, sizeof(buf), "%02x", c);
        out.append(buf);
    }
    return out;
}

} // namespace sidx
