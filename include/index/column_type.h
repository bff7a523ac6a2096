#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sidx {

/// Comparison semantics of a column. Values are raw byte strings.
class ColumnType {
public:
    virtual ~ColumnType() = default;

    virtual std::string name() const = 0;
    virtual int compare(std::string_view a, std::string_view b) const = 0;
    /// Textual columns get prefix/substring predicates and the prefix term tree.
    virtual bool isTextual() const { return false; }
    virtual std::string toString(std::string_view raw) const { return std::string(raw); }

    /// "text", "utf8", "ascii", "bigint", "blob"; nullptr for anything else.
    static std::shared_ptr<const ColumnType> fromName(std::string_view name);
};

using ColumnTypePtr = std::shared_ptr<const ColumnType>;

class UTF8Type : public ColumnType {
public:
    std::string name() const override { return "text"; }
    int compare(std::string_view a, std::string_view b) const override { return a.compare(b); }
    bool isTextual() const override { return true; }

    static ColumnTypePtr instance();
};

class AsciiType : public ColumnType {
public:
    std::string name() const override { return "ascii"; }
    int compare(std::string_view a, std::string_view b) const override { return a.compare(b); }
    bool isTextual() const override { return true; }

    static ColumnTypePtr instance();
};

/// Signed 64-bit integers, stored big-endian with the sign bit flipped so the
/// byte order matches the numeric order.
class Int64Type : public ColumnType {
public:
    std::string name() const override { return "bigint"; }
    int compare(std::string_view a, std::string_view b) const override;
    std::string toString(std::string_view raw) const override;

    static std::string encode(int64_t v);
    static int64_t decode(std::string_view raw);
    static ColumnTypePtr instance();
};

class BytesType : public ColumnType {
public:
    std::string name() const override { return "blob"; }
    int compare(std::string_view a, std::string_view b) const override { return a.compare(b); }
    std::string toString(std::string_view raw) const override;

    static ColumnTypePtr instance();
};

/// Adapter for ordered containers keyed by raw values.
struct ValueLess {
    ColumnTypePtr type;
    bool operator()(const std::string& a, const std::string& b) const {
        return type->compare(a, b) < 0;
    }
};

} // namespace sidx
