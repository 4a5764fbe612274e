#pragma once

#include <compare>
#include <string>
#include <string_view>

namespace arbor {

/**
 * FractionalIndex - Dense, sortable sibling key.
 *
 * A key is a base-62 fraction written as its digits after the point
 * ("V" is 31/62, roughly one half). Byte-wise string order equals numeric
 * order because DIGITS is in ascending ASCII order and keys never end in
 * the zero digit. A new key can always be generated before, after or
 * between existing keys without touching any other key.
 *
 * The empty index is not a valid sibling key; it stands for an open bound
 * in between().
 */
class FractionalIndex {
public:
    static constexpr std::string_view DIGITS =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    static constexpr int BASE = 62;

    FractionalIndex() = default;

    /**
     * Wrap an existing key. Throws std::invalid_argument for characters
     * outside DIGITS or a trailing zero digit.
     */
    explicit FractionalIndex(std::string value);

    /**
     * Key for the first sibling of an empty group.
     */
    [[nodiscard]] static FractionalIndex first();

    /**
     * Key strictly between lower and upper. An empty bound is open, so
     * between({}, {}) == first(). Throws std::invalid_argument unless
     * lower < upper when both are set.
     */
    [[nodiscard]] static FractionalIndex between(const FractionalIndex& lower,
                                                 const FractionalIndex& upper);

    [[nodiscard]] FractionalIndex before() const { return between(FractionalIndex{}, *this); }
    [[nodiscard]] FractionalIndex after() const { return between(*this, FractionalIndex{}); }

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] bool is_empty() const noexcept { return value_.empty(); }

    auto operator<=>(const FractionalIndex&) const = default;
    bool operator==(const FractionalIndex&) const = default;

private:
    std::string value_;
};

} // namespace arbor
